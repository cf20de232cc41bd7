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
 * Top-popular ranking of the catalog, the fallback served to users the
 * model has never seen. Popularity of an item is the sum of its
 * interaction weights; items with equal popularity are ranked by index.
 */

#ifndef DEF_DIVRANK_TOPPOP
#define DEF_DIVRANK_TOPPOP

#include <algorithm>
#include <vector>

#include "divrank_types.hpp"
#include "logger/logger.hpp"
#include "util/errors.hpp"
#include "util/eigen_wrapper.hpp"

namespace divrank {

    struct item_value {
        rid_t item;
        double value;
        item_value() {}
        item_value(rid_t i, double x) : item(i), value(x) {}
    };

    inline bool item_value_greater(const item_value & a, const item_value & b) {
        return a.value > b.value;
    }

    /**
     * Ranks every item of the interaction matrix by popularity, best first.
     * Items listed in mask are left out of the ranking.
     */
    inline ranked_ids compute_toppop(const sparse_mat & interactions,
                                     const std::vector<rid_t> & mask = std::vector<rid_t>()) {
        const int nitems = (int)interactions.cols();
        std::vector<bool> masked(nitems, false);
        for (size_t i = 0; i < mask.size(); i++) {
            if (mask[i] >= (rid_t)nitems) {
                logstream(LOG_ERROR) << "Top-popular mask holds item " << mask[i] << ", catalog has " << nitems << " items" << std::endl;
                throw dimension_error("toppop: masked item out of range");
            }
            masked[mask[i]] = true;
        }

        vec popularity = zeros(nitems);
        for (int u = 0; u < interactions.outerSize(); u++)
            for (sparse_mat::InnerIterator it(interactions, u); it; ++it)
                popularity[it.col()] += it.value();

        std::vector<item_value> buffer;
        buffer.reserve(nitems);
        for (int i = 0; i < nitems; i++)
            if (!masked[i])
                buffer.push_back(item_value((rid_t)i, popularity[i]));
        std::stable_sort(buffer.begin(), buffer.end(), item_value_greater);

        ranked_ids ret;
        for (size_t i = 0; i < buffer.size(); i++)
            ret.push_back(buffer[i].item, buffer[i].value);
        logstream(LOG_DEBUG) << "Top-popular ranking over " << ret.size() << " items, " << mask.size() << " masked" << std::endl;
        return ret;
    }

    /**
     * Entries of a top-popular ranking whose item is in keep_indices, in
     * ranking order.
     */
    inline ranked_ids restrict_toppop(const ranked_ids & toppop, const std::vector<rid_t> & keep_indices) {
        rid_t maxid = 0;
        for (size_t i = 0; i < toppop.size(); i++)
            maxid = std::max(maxid, toppop.ids[i]);
        std::vector<bool> keep(toppop.size() > 0 ? maxid + 1 : 0, false);
        for (size_t i = 0; i < keep_indices.size(); i++)
            if (keep_indices[i] < keep.size())
                keep[keep_indices[i]] = true;

        ranked_ids ret;
        for (size_t i = 0; i < toppop.size(); i++)
            if (keep[toppop.ids[i]])
                ret.push_back(toppop.ids[i], toppop.scores[i]);
        return ret;
    }

}

#endif
