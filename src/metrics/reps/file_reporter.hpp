
/**
 * @file
 * @author  Aapo Kyrola <akyrola@cs.cmu.edu>
 * @version 1.0
 *
 * @section LICENSE
 *
 * Copyright [2012] [Aapo Kyrola, Guy Blelloch, Carlos Guestrin / Carnegie Mellon University]
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
 * File metrics reporter. Writes one key=value line per entry, in the
 * format of the configuration files.
 */


#ifndef DEF_DIVRANK_FILE_REPORTER
#define DEF_DIVRANK_FILE_REPORTER

#include <cstdio>
#include <map>
#include <string>

#include "logger/logger.hpp"
#include "metrics/metrics.hpp"
#include "util/errors.hpp"

namespace divrank {

  class file_reporter : public imetrics_reporter {
  private:
    file_reporter() {}

    std::string filename;

  public:

    file_reporter(std::string fname) : filename(fname) {}

    virtual ~file_reporter() {}

    virtual void do_report(std::string name, std::string ident, std::map<std::string, metrics_entry> & entries) {
      FILE * f = fopen(filename.c_str(), "w");
      if (f == NULL) {
        logstream(LOG_ERROR) << "Could not open metrics file " << filename << std::endl;
        throw input_error("file_reporter: cannot open " + filename);
      }
      if (ident != name && ident != "") {
        fprintf(f, "[%s:%s]\n", name.c_str(), ident.c_str());
      } else {
        fprintf(f, "[%s]\n", name.c_str());
      }
      std::map<std::string, metrics_entry>::iterator it;

      for(it = entries.begin(); it != entries.end(); ++it) {
        const metrics_entry & ent = it->second;
        const char * key = it->first.c_str();
        switch(ent.valtype) {
        case INTEGER:
          fprintf(f, "%s=%ld\n", key, (long int) (ent.value));
          fprintf(f, "%s.count=%lu\n", key, (unsigned long) ent.count);
          fprintf(f, "%s.min=%ld\n", key, (long int) (ent.minvalue));
          fprintf(f, "%s.max=%ld\n", key, (long int) (ent.maxvalue));
          fprintf(f, "%s.avg=%lf\n", key, ent.cumvalue/ent.count);
          break;
        case REAL:
        case TIME:
          fprintf(f, "%s=%lf\n", key, ent.value);
          fprintf(f, "%s.count=%lu\n", key, (unsigned long) ent.count);
          fprintf(f, "%s.min=%lf\n", key, ent.minvalue);
          fprintf(f, "%s.max=%lf\n", key, ent.maxvalue);
          fprintf(f, "%s.avg=%lf\n", key, ent.cumvalue/ent.count);
          break;
        case STRING:
          fprintf(f, "%s=%s\n", key, ent.stringval.c_str());
          break;
        case VECTOR:
          fprintf(f, "%s=", key);
          for (size_t i = 0; i < ent.v.size(); i++)
            fprintf(f, i == 0 ? "%lf" : ",%lf", ent.v[i]);
          fprintf(f, "\n");
          break;
        }
      }
      fclose(f);
      logstream(LOG_INFO) << "Wrote metrics to " << filename << std::endl;
    }

  };

}

#endif
