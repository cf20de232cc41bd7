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
 * Builds the input of a diversity aware reranker (MMR, DPP and the like)
 * for one user: the truncated candidate list with its relevance scores,
 * the category of every catalog item and the pairwise inner products of
 * the candidates' content embeddings.
 */

#ifndef DEF_DIVRANK_RERANK_PREPROCESSOR
#define DEF_DIVRANK_RERANK_PREPROCESSOR

#include <string>
#include <vector>

#include "api/item_table.hpp"
#include "engine/retrieval_engine.hpp"
#include "logger/logger.hpp"
#include "util/errors.hpp"
#include "util/eigen_wrapper.hpp"

namespace divrank {

    struct rerank_input {
        /// truncated candidates, best first
        std::vector<rid_t> candidates;
        /// category of every catalog item, by internal item index
        std::vector<std::string> categories;
        /// relevance score of each candidate
        vec relevance;
        /// similarity(a, b) = <embedding of candidate a, embedding of candidate b>
        mat similarity;
    };

    class rerank_preprocessor {

        const retrieval_engine & engine;
        const item_table & items;

    public:

        rerank_preprocessor(const retrieval_engine & engine, const item_table & items)
            : engine(engine), items(items) {}

        rerank_input rerank_preprocess(rid_t user_id, int truncate_at,
                                       const std::string & category_col, const std::string & embedding_col) const {
            if (truncate_at < 0) {
                logstream(LOG_ERROR) << "Negative rerank cutoff " << truncate_at << std::endl;
                throw input_error("rerank_preprocess: truncate_at must be >= 0");
            }
            std::vector<rid_t> query(1, user_id);
            ranked_ids ranked = engine.recommend(query)[0];
            if ((size_t)truncate_at > ranked.size()) {
                logstream(LOG_WARNING) << "truncate_at is too big - setting it to: " << ranked.size() << std::endl;
                truncate_at = (int)ranked.size();
            }

            rerank_input ret;
            ret.candidates.assign(ranked.ids.begin(), ranked.ids.begin() + truncate_at);
            ret.relevance.resize(truncate_at);
            for (int j = 0; j < truncate_at; j++)
                ret.relevance[j] = ranked.scores[j];

            std::vector<size_t> rows = metadata_rows();
            ret.categories.resize(rows.size());
            for (size_t i = 0; i < rows.size(); i++)
                ret.categories[i] = items.category(category_col, rows[i]);

            mat E = embeddings(rows, embedding_col);
            mat selected(truncate_at, E.cols());
            for (int j = 0; j < truncate_at; j++)
                selected.row(j) = E.row(ret.candidates[j]);
            ret.similarity = selected * selected.transpose();
            // mirror the upper triangle so that the matrix is exactly symmetric
            for (int a = 0; a < truncate_at; a++)
                for (int b = a + 1; b < truncate_at; b++)
                    ret.similarity(b, a) = ret.similarity(a, b);

            logstream(LOG_DEBUG) << "Rerank input for user " << user_id << ": " << truncate_at << " candidates, embedding width "
                << E.cols() << std::endl;
            return ret;
        }

    private:

        /** Metadata row of each catalog item, by internal item index. */
        std::vector<size_t> metadata_rows() const {
            std::vector<size_t> rows(engine.n_items());
            for (rid_t i = 0; i < engine.n_items(); i++) {
                if (!items.find(engine.item_token(i), rows[i])) {
                    logstream(LOG_ERROR) << "Catalog item '" << engine.item_token(i) << "' has no metadata row" << std::endl;
                    throw input_error("rerank_preprocess: catalog item missing from item metadata");
                }
            }
            return rows;
        }

        /** Embedding matrix of the whole catalog, one row per item. */
        mat embeddings(const std::vector<size_t> & rows, const std::string & embedding_col) const {
            if (rows.empty())
                return mat(0, 0);
            int width = (int)items.vector(embedding_col, rows[0]).size();
            mat E(rows.size(), width);
            for (size_t i = 0; i < rows.size(); i++) {
                const vec & e = items.vector(embedding_col, rows[i]);
                if (e.size() != width) {
                    logstream(LOG_ERROR) << "Embedding of item '" << items.token(rows[i]) << "' has length " << e.size()
                        << ", expected " << width << std::endl;
                    throw input_error("rerank_preprocess: embeddings of unequal length");
                }
                E.row(i) = e.transpose();
            }
            return E;
        }
    };

}

#endif
