#ifndef DEF_DIVRANK_PTHREAD_TOOLS_HPP
#define DEF_DIVRANK_PTHREAD_TOOLS_HPP

#include <pthread.h>
#include <cstdio>
#include <cassert>

/**
 * \file pthread_tools.hpp Locking helpers shared by the metrics registry.
 */
namespace divrank {

    /**
     * \class mutex
     *
     * Wrapper around pthread's mutex.
     */
    class mutex {
    private:
        mutable pthread_mutex_t m_mut;
        mutex(const mutex &);
        mutex & operator=(const mutex &);
    public:
        mutex() {
            int error = pthread_mutex_init(&m_mut, NULL);
            assert(!error);
        }
        inline void lock() const {
            int error = pthread_mutex_lock( &m_mut  );
            assert(!error);
        }
        inline void unlock() const {
            int error = pthread_mutex_unlock( &m_mut );
            assert(!error);
        }
        inline bool try_lock() const {
            return pthread_mutex_trylock( &m_mut ) == 0;
        }
        ~mutex(){
            int error = pthread_mutex_destroy( &m_mut );
            if (error)
              perror("Error: failed to destroy mutex");
        }
    };

    /**
     * Locks a mutex for the lifetime of the scope.
     */
    class scoped_lock {
        const mutex & m;
    public:
        explicit scoped_lock(const mutex & m) : m(m) { m.lock(); }
        ~scoped_lock() { m.unlock(); }
    };

}

#endif
