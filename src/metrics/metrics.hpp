/**
 * @file
 * @version 1.0
 *
 * @section LICENSE
 *
 * Copyright [2012] [Carnegie Mellon University]
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 * http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.

 *
 * @section DESCRIPTION
 *
 * Metrics registry. The trainer and the tools record timings (fit
 * iterations, recommendation passes), scalar results (training loss,
 * precision, diversity statistics) and free text under named keys. A
 * reporter prints the registry at the end of a run.
 */


#ifndef DEF_DIVRANK_METRICS_HPP
#define DEF_DIVRANK_METRICS_HPP

#include <cstdio>
#include <iostream>
#include <map>
#include <string>
#include <vector>
#include <limits>
#include <algorithm>
#include <sys/time.h>

#include "util/pthread_tools.hpp"

namespace divrank {

  enum metrictype {REAL, INTEGER, TIME, STRING, VECTOR};

  struct metrics_entry {
    size_t count;
    double value;
    double minvalue;
    double cumvalue;
    double maxvalue;
    metrictype valtype;
    std::string stringval;
    std::vector<double> v;
    timeval start_time;
    double lasttime;

    metrics_entry() : count(0), value(0), minvalue(0), cumvalue(0), maxvalue(0), valtype(REAL), lasttime(0) {}

    inline metrics_entry(double firstvalue, metrictype _valtype) {
      minvalue = firstvalue;
      maxvalue = firstvalue;
      value = firstvalue;
      valtype = _valtype;
      cumvalue = value;
      count = 1;
      lasttime = 0;
      if (valtype == VECTOR) v.push_back(firstvalue);
    }
    inline metrics_entry(std::string svalue) {
      valtype = STRING;
      stringval = svalue;
      count = 0;
      value = minvalue = maxvalue = cumvalue = lasttime = 0;
    }
    inline metrics_entry(metrictype _valtype) {
      valtype = _valtype;
      count = 0;
      cumvalue = 0;
      value = 0;
      lasttime = 0;
      minvalue = std::numeric_limits<double>::max();
      maxvalue = -std::numeric_limits<double>::max();
    }
    inline void adj(double x) {
      if (count == 0) {
        minvalue = x;
        maxvalue = x;
      } else {
        minvalue = std::min(x, minvalue);
        maxvalue = std::max(x, maxvalue);
      }
    }

    inline void add(double x) {
      adj(x);
      value += x;
      cumvalue += x;
      ++count;
      if (valtype == VECTOR) {
        v.push_back(x);
      }
    }

    inline void set(double x) {
      adj(x);
      value = x;
      cumvalue += x;
      if (count == 0) count = 1;
    }
    inline void set(std::string s) {
      stringval = s;
    }

    inline void timer_start() {
      gettimeofday(&start_time, NULL);
    }
    inline void timer_stop() {
      timeval end;
      gettimeofday(&end, NULL);
      lasttime = end.tv_sec - start_time.tv_sec + ((double)(end.tv_usec - start_time.tv_usec)) / 1.0E6;
      add(lasttime);
    }
  };

  class imetrics_reporter {
  public:
    virtual ~imetrics_reporter() {}
    virtual void do_report(std::string name, std::string id, std::map<std::string, metrics_entry> & entries) = 0;
  };

  /**
   * Metrics instance of one run. Name of the instance is set on construction.
   */
  class metrics {

    std::string name, ident;
    std::map<std::string, metrics_entry> entries;
    mutex mlock;

  public:
    inline metrics(std::string _name = "", std::string _id = "") : name(_name), ident(_id) {
      this->set("app", _name);
    }

    inline void clear() {
      scoped_lock lock(mlock);
      entries.clear();
    }

    inline std::string iterkey(std::string key, int iter) {
      char s[256];
      snprintf(s, sizeof(s), "%s.%d", key.c_str(), iter);
      return std::string(s);
    }

    /**
     * Add to an existing value or create new.
     */
    inline void add(std::string key, double value, metrictype type = REAL) {
      scoped_lock lock(mlock);
      if (entries.count(key) == 0) {
        entries[key] = metrics_entry(value, type);
      } else {
        entries[key].add(value);
      }
    }

    inline void add_to_vector(std::string key, double value) {
      scoped_lock lock(mlock);
      if (entries.count(key) == 0) {
        entries[key] = metrics_entry(value, VECTOR);
      } else {
        entries[key].add(value);
      }
    }

    inline void set(std::string key, size_t value) {
      set(key, (double)value, INTEGER);
    }

    inline void set(std::string key, int value) {
      set(key, (double)value, INTEGER);
    }

    inline void set(std::string key, double value, metrictype type = REAL) {
      scoped_lock lock(mlock);
      if (entries.count(key) == 0) {
        entries[key] = metrics_entry(value, type);
      } else {
        entries[key].set(value);
      }
    }

    inline void set(std::string key, std::string s) {
      scoped_lock lock(mlock);
      if (entries.count(key) == 0) {
        entries[key] = metrics_entry(s);
      } else {
        entries[key].set(s);
      }
    }

    inline void set(std::string key, const char * s) {
      set(key, std::string(s));
    }

    metrics_entry start_time() {
      metrics_entry me(TIME);
      me.timer_start();
      return me;
    }

    inline void stop_time(metrics_entry me, std::string key, bool show=false) {
      me.timer_stop();
      scoped_lock lock(mlock);
      if (entries.count(key) == 0) {
        entries[key] = metrics_entry(TIME);
      }
      entries[key].add(me.lasttime);
      if (show)
        std::cout << key << ": " << me.lasttime << " secs." << std::endl;
    }

    inline void stop_time(metrics_entry me, std::string key, int iternum, bool show=false) {
      me.timer_stop();
      scoped_lock lock(mlock);
      double t = me.lasttime;
      if (entries.count(key) == 0) {
        entries[key] = metrics_entry(TIME);
      }
      entries[key].add(t);
      if (show)
        std::cout << key << ": " << t << " secs." << std::endl;

      std::string ikey = iterkey(key, iternum);
      if (entries.count(ikey) == 0) {
        entries[ikey] = metrics_entry(TIME);
      }
      entries[ikey].add(t);
    }

    inline bool has(std::string key) {
      scoped_lock lock(mlock);
      return entries.count(key) > 0;
    }

    inline metrics_entry get(std::string key) {
      scoped_lock lock(mlock);
      return entries[key];
    }

    void report(imetrics_reporter & reporter) {
      if (name != "") {
        reporter.do_report(name, ident, entries);
      }
    }

  };

}

#endif
