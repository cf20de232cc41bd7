

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
 * Text output of diversity artifacts. The core only computes the
 * distribution table and the Lorenz curve; how they look on screen is
 * decided here, from a render_config handed in by the caller.
 */

#ifndef DEF_DIVRANK_OUTPUT_HPP
#define DEF_DIVRANK_OUTPUT_HPP

#include <algorithm>
#include <iomanip>
#include <ostream>
#include <string>

#include "diversity/diversity_metrics.hpp"

namespace divrank {

    struct render_config {
        std::string delimiter;
        char bar_char;         // glyph of the distribution bars
        int bar_width;         // width of the bar of the largest category, 0 for no bars
        int precision;         // digits after the decimal point

        render_config() : delimiter("\t"), bar_char('#'), bar_width(40), precision(4) {}
    };

    template <typename LabelType>
    class idiversity_output {
    public:
        virtual ~idiversity_output() {}

        virtual void output_summary(const diversity_summary & s) = 0;
        virtual void output_distribution(const distribution_table<LabelType> & table) = 0;
        virtual void output_lorenz(const lorenz_curve & curve) = 0;
    };

    template <typename LabelType>
    class basic_text_output : public idiversity_output<LabelType> {

        std::ostream & strm;
        render_config config;

    public:

        basic_text_output(std::ostream & strm, const render_config & config = render_config())
            : strm(strm), config(config) {
            strm << std::fixed << std::setprecision(config.precision);
        }

        virtual ~basic_text_output() {}

        virtual void output_summary(const diversity_summary & s) {
            strm << "categories" << config.delimiter << s.categories << std::endl;
            strm << "observations" << config.delimiter << s.observations << std::endl;
            strm << "gini" << config.delimiter << s.gini << std::endl;
            strm << "ecs" << config.delimiter << s.ecs << std::endl;
            strm << "shannon" << config.delimiter << s.shannon << std::endl;
        }

        virtual void output_distribution(const distribution_table<LabelType> & table) {
            size_t largest = 0;
            for (size_t i = 0; i < table.size(); i++)
                largest = std::max(largest, table.rows[i].count);
            for (size_t i = 0; i < table.size(); i++) {
                const distribution_row<LabelType> & row = table.rows[i];
                strm << row.category << config.delimiter << row.count << config.delimiter << 100 * row.percentage << "%";
                if (config.bar_width > 0 && largest > 0) {
                    int len = (int)((double)row.count * config.bar_width / largest + 0.5);
                    strm << config.delimiter << std::string(len, config.bar_char);
                }
                strm << std::endl;
            }
        }

        virtual void output_lorenz(const lorenz_curve & curve) {
            for (int i = 0; i < curve.x.size(); i++)
                strm << curve.x[i] << config.delimiter << curve.y[i] << std::endl;
        }
    };

}

#endif
