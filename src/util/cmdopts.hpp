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
 * Command line options. divrank_init() loads the configuration file and
 * then applies --key=value arguments on top of it, so the command line
 * always wins. Options are read with the typed get_option_* getters.
 */


#ifndef DIVRANK_CMDOPTS_DEF
#define DIVRANK_CMDOPTS_DEF


#include <string>
#include <iostream>
#include <map>
#include <cstdlib>
#include <stdint.h>

#include "logger/logger.hpp"
#include "util/configfile.hpp"

namespace divrank {

#ifdef __GNUC__
#define VARIABLE_IS_NOT_USED __attribute__ ((unused))
#else
#define VARIABLE_IS_NOT_USED
#endif

    static bool _cmd_configured = false;
    static std::map<std::string, std::string> conf;

    static void VARIABLE_IS_NOT_USED set_conf(std::string key, std::string value) {
        conf[key] = value;
    }

    static void VARIABLE_IS_NOT_USED divrank_init(int argc, const char ** argv) {
        conf = loadconfig(filename_config_local(), filename_config());
        _cmd_configured = true;

        /* Load --key=value type arguments into the conf map */
        std::string prefix = "--";
        for (int i = 1; i < argc; i++) {
            std::string arg = std::string(argv[i]);

            if (arg.substr(0, prefix.size()) == prefix) {
                arg = arg.substr(prefix.size());
                size_t a = arg.find_first_of("=", 0);
                if (a != arg.npos) {
                    std::string key = arg.substr(0, a);
                    std::string val = arg.substr(a + 1);

                    std::cout << "[" << key << "]" << " => " << "[" << val << "]" << std::endl;
                    conf[key] = val;
                } else {
                    logstream(LOG_WARNING) << "Ignoring argument without value: " << argv[i] << std::endl;
                }
            }
        }
    }

    static void check_cmd_init() {
        if (!_cmd_configured) {
            logstream(LOG_WARNING) << "Command line options not initialized, call divrank_init() first. Using defaults." << std::endl;
            _cmd_configured = true;
        }
    }

    static bool VARIABLE_IS_NOT_USED has_option(const char *option_name) {
        return conf.find(option_name) != conf.end();
    }

    static std::string VARIABLE_IS_NOT_USED get_option_string(const char *option_name,
                                         std::string default_value) {
        check_cmd_init();
        if (conf.find(option_name) != conf.end()) {
            return conf[option_name];
        }
        return default_value;
    }

    /**
     * Mandatory option: a missing value is fatal.
     */
    static std::string VARIABLE_IS_NOT_USED get_option_string(const char *option_name) {
        check_cmd_init();
        if (conf.find(option_name) == conf.end()) {
            logstream(LOG_FATAL) << "Missing mandatory option --" << option_name << "=..." << std::endl;
        }
        return conf[option_name];
    }

    static int VARIABLE_IS_NOT_USED get_option_int(const char *option_name, int default_value) {
        check_cmd_init();
        if (conf.find(option_name) != conf.end()) {
            return atoi(conf[option_name].c_str());
        }
        return default_value;
    }

    static uint64_t VARIABLE_IS_NOT_USED get_option_long(const char *option_name, uint64_t default_value) {
        check_cmd_init();
        if (conf.find(option_name) != conf.end()) {
            return strtoull(conf[option_name].c_str(), NULL, 10);
        }
        return default_value;
    }

    static double VARIABLE_IS_NOT_USED get_option_float(const char *option_name, double default_value) {
        check_cmd_init();
        if (conf.find(option_name) != conf.end()) {
            return atof(conf[option_name].c_str());
        }
        return default_value;
    }

} // End namespace


#endif
