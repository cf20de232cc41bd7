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
 * Interface of a latent factor model as seen by the retrieval engine.
 * The engine never looks inside the trainer: it fits it, asks it for
 * ranked items and reads (or, through mask_items, writes) the factor
 * matrices. Row u of user_factors() is the embedding of user u, row i of
 * item_factors() the embedding of item i.
 */

#ifndef DEF_DIVRANK_IFACTOR_MODEL
#define DEF_DIVRANK_IFACTOR_MODEL

#include <vector>

#include "divrank_types.hpp"
#include "util/eigen_wrapper.hpp"

namespace divrank {

    class ifactor_model {
    public:
        virtual ~ifactor_model() {}

        /**
         * Trains the model on a (weighted) interaction matrix,
         * rows = users, columns = items.
         */
        virtual void fit(const sparse_mat & interactions) = 0;

        /**
         * Ranks items for each user of user_ids. Row k of filter_matrix
         * belongs to user_ids[k]; the items stored in that row are never
         * returned for that user. At most N items are returned per user,
         * best first.
         */
        virtual std::vector<ranked_ids> recommend(const std::vector<rid_t> & user_ids,
                                                  const sparse_mat & filter_matrix, int N) const = 0;

        virtual const mat & user_factors() const = 0;
        virtual const mat & item_factors() const = 0;

        /**
         * Writable item embeddings. Changes are seen by every later query
         * against this model.
         */
        virtual mat & mutable_item_factors() = 0;
    };

}

#endif
