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
 * Parses key = value configuration files. Lines starting with '#' or '%'
 * are comments. The configuration lives in conf/divrank.cnf, optionally
 * shadowed by conf/divrank.local.cnf. Both are looked up relative to
 * the environment variable DIVRANK_ROOT when it is set, otherwise
 * relative to the working directory.
 */

#ifndef DIVRANK_CONFIGFILE_DEF
#define DIVRANK_CONFIGFILE_DEF

#include <iostream>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <map>

#include "logger/logger.hpp"

namespace divrank {

    const std::string whiteSpaces( " \f\n\r\t\v" );

    static inline std::string trim(std::string str) {
        std::string::size_type pos = str.find_last_not_of(whiteSpaces);
        str.erase(pos + 1);
        pos = str.find_first_not_of(whiteSpaces);
        str.erase(0, pos);
        return str;
    }

    static inline std::string filename_config() {
        char * root = getenv("DIVRANK_ROOT");
        if (root != NULL) {
            return std::string(root) + "/conf/divrank.cnf";
        }
        return "conf/divrank.cnf";
    }

    static inline std::string filename_config_local() {
        char * root = getenv("DIVRANK_ROOT");
        if (root != NULL) {
            return std::string(root) + "/conf/divrank.local.cnf";
        }
        return "conf/divrank.local.cnf";
    }

    /**
     * Returns the key-value map of a configuration file.
     * The secondary filename is tried if the first one is not found. If
     * neither exists an empty map is returned: every option has a default.
     * @param filename filename of the configuration file
     * @param secondary_filename secondary filename if the first version is not found.
     */
    static inline std::map<std::string, std::string> loadconfig(std::string filename, std::string secondary_filename) {
        std::map<std::string, std::string> conf;
        FILE * f = fopen(filename.c_str(), "r");
        if (f == NULL) {
            f = fopen(secondary_filename.c_str(), "r");
            if (f == NULL) {
                logstream(LOG_WARNING) << "Could not read configuration file " << secondary_filename
                    << ", using defaults. Define DIVRANK_ROOT to point at the directory holding conf/." << std::endl;
                return conf;
            }
        }

        char s[4096];
        while(fgets(s, 4096, f) != NULL) {
            std::string line(s);
            line = trim(line);
            if (line.empty() || line[0] == '#' || line[0] == '%') continue;

            std::string::size_type eq = line.find('=');
            if (eq == std::string::npos) continue;
            std::string key = trim(line.substr(0, eq));
            std::string val = trim(line.substr(eq + 1));
            if (!key.empty() && !val.empty())
                conf[key] = val;
        }
        fclose(f);
        return conf;
    }

}


#endif
