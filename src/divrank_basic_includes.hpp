

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
 * This header includes all the main headers needed for a divrank
 * program.
 */


#ifndef DIVRANK_DEF_ALLBASIC_INCLUDES
#define DIVRANK_DEF_ALLBASIC_INCLUDES

#include <omp.h>
#include <cstring>
#include <sstream>

#include "divrank_types.hpp"

#include "api/ifactor_model.hpp"
#include "api/item_table.hpp"

#include "diversity/histogram.hpp"
#include "diversity/diversity_metrics.hpp"

#include "engine/retrieval_engine.hpp"
#include "engine/rerank_preprocessor.hpp"
#include "engine/toppop.hpp"

#include "evaluation/offline_eval.hpp"

#include "logger/logger.hpp"

#include "metrics/metrics.hpp"
#include "metrics/reps/basic_reporter.hpp"
#include "metrics/reps/file_reporter.hpp"

#include "models/ials_model.hpp"

#include "preprocessing/bm25.hpp"

#include "util/cmdopts.hpp"
#include "util/errors.hpp"


namespace divrank {

    /**
      * Helper for metrics.
      */
    static VARIABLE_IS_NOT_USED void metrics_report(metrics &m);
    static VARIABLE_IS_NOT_USED void metrics_report(metrics &m) {
        std::string reporters = get_option_string("metrics.reporter", "console");
        char * creps = (char*)reporters.c_str();
        const char * delims = ",";
        char * t = strtok(creps, delims);

        while(t != NULL) {
            std::string repname(t);
            if (repname == "basic" || repname == "console") {
                basic_reporter rep;
                m.report(rep);
            } else if (repname == "file") {
                file_reporter rep(get_option_string("metrics.reporter.filename", "metrics.txt"));
                m.report(rep);
            } else {
                logstream(LOG_WARNING) << "Could not find metrics reporter with name [" << repname << "], ignoring." << std::endl;
            }
            t = strtok(NULL, delims);
        }
    }

}

#endif
