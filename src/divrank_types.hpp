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
 * Basic types shared by the retrieval engine, the models and the tools.
 */

#ifndef DEF_DIVRANK_TYPES
#define DEF_DIVRANK_TYPES

#include <stdint.h>
#include <string>
#include <vector>

#include "util/eigen_wrapper.hpp"

namespace divrank {

    /// Internal (row/column) index of a user or an item.
    typedef uint32_t rid_t;

    /**
     * Ranked result of one query: item indices (or tokens) and their
     * scores, best first.
     */
    template <typename IdType>
    struct ranked_list {
        std::vector<IdType> ids;
        std::vector<double> scores;

        size_t size() const { return ids.size(); }
        void push_back(IdType id, double score) {
            ids.push_back(id);
            scores.push_back(score);
        }
    };

    typedef ranked_list<rid_t> ranked_ids;
    typedef ranked_list<std::string> ranked_tokens;

}

#endif
