/**
 * Copyright (c) 2009 Carnegie Mellon University.
 *     All rights reserved.
 *
 *  Licensed under the Apache License, Version 2.0 (the "License");
 *  you may not use this file except in compliance with the License.
 *  You may obtain a copy of the License at
 *
 *      http://www.apache.org/licenses/LICENSE-2.0
 *
 *  Unless required by applicable law or agreed to in writing,
 *  software distributed under the License is distributed on an "AS
 *  IS" BASIS, WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either
 *  express or implied.  See the License for the specific language
 *  governing permissions and limitations under the License.
 *
 */


/**
 * @file logger.hpp
 * Usage:
 *
 *    logstream(LOG_INFO) << "fitted " << n << " users" << std::endl;
 *
 * A line is written when its level passes both the compile time floor
 * OUTPUTLEVEL and the runtime level set with
 * global_logger().set_log_level(). Lines below OUTPUTLEVEL compile to
 * nothing. std::endl terminates and flushes a line; a LOG_FATAL line
 * throws divrank::fatal_error once it has been written.
 *
 * Output goes to stderr (coloured for warnings and errors) and, when
 * set_log_file() was called, to that file as well. Every thread owns its
 * own line buffer so that concurrent lines do not interleave.
 */

#ifndef DIVRANK_LOG_LOG_HPP
#define DIVRANK_LOG_LOG_HPP

#include <fstream>
#include <sstream>
#include <cstdlib>
#include <cstdio>
#include <iostream>
#include <cassert>
#include <cstring>
#include <pthread.h>

#include "util/errors.hpp"

/**
 * \def LOG_FATAL
 *   Irrecoverable conditions; the line throws divrank::fatal_error
 * \def LOG_ERROR
 *   Written right before a divrank exception is thrown
 * \def LOG_WARNING
 *   Interesting conditions which are not errors (cold start, clamped cutoffs)
 * \def LOG_INFO
 *   General progress information
 * \def LOG_DEBUG
 *   Debugging purposes only
 */
#define LOG_NONE 5
#define LOG_FATAL 4
#define LOG_ERROR 3
#define LOG_WARNING 2
#define LOG_INFO 1
#define LOG_DEBUG 0

#ifndef OUTPUTLEVEL
#define OUTPUTLEVEL LOG_DEBUG
#endif
/// If set, logs to screen will be printed in color
#define COLOROUTPUT

#if OUTPUTLEVEL == LOG_NONE
#define logstream(lvl) (divrank::null_stream())
#else
#define logstream(lvl)                      \
    (divrank::log_stream_dispatch<(lvl >= OUTPUTLEVEL)>::exec(lvl,__FILE__, __func__ ,__LINE__) )
#endif

namespace divrank {

static const char* log_level_names[] = {  "DEBUG:    ",
    "INFO:     ",
    "WARNING:  ",
    "ERROR:    ",
    "FATAL:    "};

struct log_line_buffer {
  std::stringstream buffer;
  bool active;
  int level;
  log_line_buffer() : active(false), level(LOG_INFO) {}
};

/**
  Logger writing to the console and optionally to a file.
*/
class file_logger {
 public:

  file_logger() {
    log_to_console = true;
    log_level = LOG_DEBUG;
    pthread_mutex_init(&mut, NULL);
    pthread_key_create(&bufferkey, buffer_destructor);
  }

  ~file_logger() {
    if (fout.is_open()) {
      fout.flush();
      fout.close();
    }
    pthread_mutex_destroy(&mut);
  }

  /// If consolelog is true, subsequent output will be written to stderr
  void set_log_to_console(bool consolelog) {
    log_to_console = consolelog;
  }

  bool get_log_to_console() {
    return log_to_console;
  }

  /** Lines below the given level are dropped. */
  void set_log_level(int new_log_level) {
    log_level = new_log_level;
  }

  int get_log_level() {
    return log_level;
  }

  std::string get_log_file() {
    return log_file;
  }

  /**
   * Closes the current log file, then opens 'file' (truncating it) if it
   * is not empty. Returns false if the file could not be opened.
   */
  bool set_log_file(std::string file) {
    if (fout.is_open()) {
      fout.flush();
      fout.close();
      log_file = "";
    }
    if (file.length() > 0) {
      fout.open(file.c_str());
      if (fout.fail()) return false;
      log_file = file;
    }
    return true;
  }

  template <typename T>
  file_logger& operator<<(T a) {
    log_line_buffer * line = current_line();
    if (line != NULL && line->active) line->buffer << a;
    return *this;
  }

  file_logger& operator<<(const char* a) {
    log_line_buffer * line = current_line();
    if (line != NULL && line->active) {
      line->buffer << a;
      size_t len = strlen(a);
      if (len > 0 && a[len-1] == '\n') {
        end_line(line);
      }
    }
    return *this;
  }

  file_logger& operator<<(std::ostream& (*f)(std::ostream&)) {
    log_line_buffer * line = current_line();
    typedef std::ostream& (*endltype)(std::ostream&);
    if (line != NULL && line->active && endltype(f) == endltype(std::endl)) {
      line->buffer << "\n";
      end_line(line);
    }
    return *this;
  }

  file_logger& start_stream(int lineloglevel, const char* file, const char* function, int line) {
    log_line_buffer * entry = current_line();
    if (entry == NULL) {
      entry = new log_line_buffer();
      pthread_setspecific(bufferkey, entry);
    }
    const char * slash = strrchr(file, '/');
    if (slash != NULL) file = slash + 1;

    // Fatal lines are never filtered out.
    if (lineloglevel >= log_level || lineloglevel == LOG_FATAL) {
      if (entry->buffer.str().length() == 0) {
        entry->buffer << log_level_names[lineloglevel] << file
                      << "(" << function << ":" << line << "): ";
      }
      entry->active = true;
      entry->level = lineloglevel;
    } else {
      entry->active = false;
    }
    return *this;
  }

 private:

  static void buffer_destructor(void* v) {
    delete reinterpret_cast<log_line_buffer*>(v);
  }

  log_line_buffer * current_line() {
    return reinterpret_cast<log_line_buffer*>(pthread_getspecific(bufferkey));
  }

  void end_line(log_line_buffer * line) {
    std::string text = line->buffer.str();
    int level = line->level;
    line->buffer.str("");
    line->active = false;
    write_raw(level, text);
    if (level == LOG_FATAL) {
      throw fatal_error(text);
    }
  }

  void write_raw(int level, const std::string & text) {
    pthread_mutex_lock(&mut);
    if (fout.is_open()) {
      fout << text;
      fout.flush();
    }
    if (log_to_console) {
#ifdef COLOROUTPUT
      if (level >= LOG_ERROR) textcolor(stderr, 1, 1);           // bright red
      else if (level == LOG_WARNING) textcolor(stderr, 1, 2);    // bright green
#endif
      std::cerr << text;
#ifdef COLOROUTPUT
      if (level >= LOG_WARNING) reset_color(stderr);
#endif
      std::cerr.flush();
    }
    pthread_mutex_unlock(&mut);
  }

  void textcolor(FILE* handle, int attr, int fg) {
    fprintf(handle, "%c[%d;%dm", 0x1B, attr, fg + 30);
  }

  void reset_color(FILE* handle) {
    fprintf(handle, "%c[0m", 0x1B);
  }

  std::ofstream fout;
  std::string log_file;
  pthread_key_t bufferkey;
  pthread_mutex_t mut;
  bool log_to_console;
  int log_level;
};

static inline file_logger& global_logger() {
  static file_logger l;
  return l;
}

struct null_stream {
  template<typename T>
  inline null_stream operator<<(T t) { return null_stream(); }
  inline null_stream operator<<(const char* a) { return null_stream(); }
  inline null_stream operator<<(std::ostream& (*f)(std::ostream&)) { return null_stream(); }
};

/**
 * Generates no code for lines below the compile time floor.
 */
template <bool dostuff>
struct log_stream_dispatch {};

template <>
struct log_stream_dispatch<true> {
  inline static file_logger& exec(int lineloglevel, const char* file, const char* function, int line) {
    return global_logger().start_stream(lineloglevel, file, function, line);
  }
};

template <>
struct log_stream_dispatch<false> {
  inline static null_stream exec(int lineloglevel, const char* file, const char* function, int line) {
    return null_stream();
  }
};

}

#endif
