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
 * Retrieval engine: candidate generation on top of a latent factor model.
 *
 * The engine owns the BM25 weighted training matrix, the optional test
 * matrix, the top-popular ranking and the token maps of users and items.
 * Users are addressed by internal index (row of the matrices) or by
 * token. A token the engine does not know is a cold-start user: it is
 * served from the top-popular ranking, the model is never consulted for
 * it.
 *
 * The model is held by reference and must outlive the engine.
 * mask_items() writes the model's item factors in place; it must not run
 * concurrently with any scoring call.
 */

#ifndef DEF_DIVRANK_RETRIEVAL_ENGINE
#define DEF_DIVRANK_RETRIEVAL_ENGINE

#include <map>
#include <string>
#include <vector>

#include "api/ifactor_model.hpp"
#include "divrank_types.hpp"
#include "engine/toppop.hpp"
#include "evaluation/offline_eval.hpp"
#include "logger/logger.hpp"
#include "metrics/metrics.hpp"
#include "preprocessing/bm25.hpp"
#include "util/errors.hpp"
#include "util/eigen_wrapper.hpp"

namespace divrank {

    struct engine_config {
        bm25_params bm25;
        bool use_bm25;
        /// fit() trains the model on fit_scale * weighted training matrix
        double fit_scale;
        /// items never served by the top-popular fallback
        std::vector<rid_t> toppop_mask;

        engine_config() : use_bm25(true), fit_scale(2.0) {}
    };

    class retrieval_engine {

        ifactor_model & model;
        sparse_mat train;
        sparse_mat test;
        bool has_test;
        ranked_ids toppop_ranking;

        std::vector<std::string> user_tokens;
        std::vector<std::string> item_tokens;
        std::map<std::string, rid_t> user_ids;
        std::map<std::string, rid_t> item_ids;

        engine_config config;
        ranking_evaluator default_evaluator;
        /// NULL selects default_evaluator; never points into this object
        const ioffline_evaluator * evaluator;
        metrics * m;

    public:

        /**
         * @param model factor model, fitted later by fit() or already trained
         * @param interactions raw training interactions, users x items
         * @param users token of each row of interactions
         * @param items token of each column of interactions
         * @param test optional held-out interactions of the same shape
         */
        retrieval_engine(ifactor_model & model, const sparse_mat & interactions,
                         const std::vector<std::string> & users, const std::vector<std::string> & items,
                         const engine_config & config = engine_config(),
                         const sparse_mat * test = NULL, metrics * m = NULL)
            : model(model), has_test(test != NULL), user_tokens(users), item_tokens(items),
              config(config), evaluator(NULL), m(m) {

            if ((size_t)interactions.rows() != users.size() || (size_t)interactions.cols() != items.size()) {
                logstream(LOG_ERROR) << "Interaction matrix is " << interactions.rows() << "x" << interactions.cols()
                    << " but " << users.size() << " user tokens and " << items.size() << " item tokens were given" << std::endl;
                throw dimension_error("retrieval_engine: token lists disagree with the interaction matrix");
            }
            if (test != NULL && (test->rows() != interactions.rows() || test->cols() != interactions.cols())) {
                logstream(LOG_ERROR) << "Test matrix is " << test->rows() << "x" << test->cols() << ", training matrix "
                    << interactions.rows() << "x" << interactions.cols() << std::endl;
                throw dimension_error("retrieval_engine: test matrix shape differs from training matrix");
            }
            build_token_map(user_tokens, user_ids, "user");
            build_token_map(item_tokens, item_ids, "item");

            toppop_ranking = compute_toppop(interactions, config.toppop_mask);
            train = config.use_bm25 ? bm25_weight(interactions, config.bm25) : interactions;
            train.makeCompressed();
            if (test != NULL)
                this->test = *test;

            logstream(LOG_INFO) << "Retrieval engine over " << n_users() << " users and " << n_items() << " items, "
                << train.nonZeros() << " training interactions" << std::endl;
        }

        /**
         * Trains the model on the weighted training matrix.
         */
        void fit() {
            metrics_entry me;
            if (m != NULL) me = m->start_time();
            sparse_mat scaled = train * config.fit_scale;
            model.fit(scaled);
            if (m != NULL) m->stop_time(me, "engine_fit");
            check_model();
        }

        void set_evaluator(const ioffline_evaluator * e) {
            evaluator = e;
        }

        /**
         * Full ranking of the not yet interacted items for each user.
         */
        std::vector<ranked_ids> recommend(const std::vector<rid_t> & users) const {
            check_model();
            for (size_t i = 0; i < users.size(); i++)
                check_user(users[i]);
            return model.recommend(users, select_rows(train, users), (int)n_items());
        }

        /**
         * Top top_k item tokens for a user token. Unknown tokens get the
         * head of the top-popular ranking.
         */
        std::vector<std::string> recommend_single(const std::string & user_token, int top_k = 100) const {
            std::vector<std::string> ret;
            rid_t u;
            if (!get_user_id(user_token, u)) {
                logstream(LOG_DEBUG) << "Unknown user " << user_token << ", serving top-popular items" << std::endl;
                for (size_t i = 0; i < toppop_ranking.size() && (int)i < top_k; i++)
                    ret.push_back(item_tokens[toppop_ranking.ids[i]]);
                return ret;
            }
            check_model();
            std::vector<rid_t> query(1, u);
            ranked_ids ids = model.recommend(query, sparse_mat(train.middleRows(u, 1)), top_k)[0];
            for (size_t i = 0; i < ids.size(); i++)
                ret.push_back(item_tokens[ids.ids[i]]);
            return ret;
        }

        /**
         * Scores of the items keep_indices for a user token, in the order of
         * keep_indices. Returns false and leaves scores untouched when the
         * user is unknown.
         */
        bool get_score_single_user(const std::string & user_token, const std::vector<rid_t> & keep_indices, vec & scores) const {
            rid_t u;
            if (!get_user_id(user_token, u))
                return false;
            check_model();
            check_items(keep_indices);
            const mat & X = model.user_factors();
            const mat & Y = model.item_factors();
            scores.resize(keep_indices.size());
            for (size_t j = 0; j < keep_indices.size(); j++)
                scores[j] = X.row(u).dot(Y.row(keep_indices[j]));
            return true;
        }

        /**
         * Best top_k of keep_indices for a user token as (item token, score)
         * pairs. Equal scores keep the order of keep_indices. Unknown users
         * get the top-popular ranking restricted to keep_indices.
         */
        ranked_tokens get_topk_single_user(const std::string & user_token, const std::vector<rid_t> & keep_indices, int top_k) const {
            check_items(keep_indices);
            ranked_tokens ret;
            vec scores;
            if (!get_score_single_user(user_token, keep_indices, scores)) {
                ranked_ids pop = restrict_toppop(toppop_ranking, keep_indices);
                for (size_t i = 0; i < pop.size() && (int)i < top_k; i++)
                    ret.push_back(item_tokens[pop.ids[i]], pop.scores[i]);
                return ret;
            }
            vec sorted;
            ivec order = reverse_sort_index2(scores, sorted, top_k);
            for (int i = 0; i < order.size(); i++)
                ret.push_back(item_tokens[keep_indices[order[i]]], sorted[i]);
            return ret;
        }

        /**
         * Zeroes the embedding of every item not in keep_row, in the model
         * itself. Irreversible: every later query of this engine and of
         * anyone sharing the model sees the masked catalog.
         */
        void mask_items(const std::vector<rid_t> & keep_row) {
            check_model();
            check_items(keep_row);
            mat & Y = model.mutable_item_factors();
            std::vector<bool> keep = keep_flags(keep_row);
            int masked = 0;
            for (int i = 0; i < Y.rows(); i++) {
                if (!keep[i]) {
                    Y.row(i).setZero();
                    masked++;
                }
            }
            logstream(LOG_INFO) << "Masked " << masked << " of " << Y.rows() << " item embeddings" << std::endl;
        }

        /**
         * Copy of the item factors with the rows outside keep_row zeroed.
         * The model is not modified.
         */
        mat masked_view(const std::vector<rid_t> & keep_row) const {
            check_model();
            check_items(keep_row);
            mat Y = model.item_factors();
            std::vector<bool> keep = keep_flags(keep_row);
            for (int i = 0; i < Y.rows(); i++)
                if (!keep[i])
                    Y.row(i).setZero();
            return Y;
        }

        /**
         * predict[k] = <user_factors[user_ids[k]], item_factors[item_ids[k]]>
         */
        vec predict(const std::vector<rid_t> & users, const std::vector<rid_t> & items) const {
            if (users.size() != items.size()) {
                logstream(LOG_ERROR) << "predict: " << users.size() << " users but " << items.size() << " items" << std::endl;
                throw dimension_error("predict: user_ids and item_ids differ in length");
            }
            check_model();
            check_items(items);
            const mat & X = model.user_factors();
            const mat & Y = model.item_factors();
            vec ret(users.size());
            for (size_t k = 0; k < users.size(); k++) {
                check_user(users[k]);
                ret[k] = X.row(users[k]).dot(Y.row(items[k]));
            }
            return ret;
        }

        double auc_score(int top_k = 100) const {
            check_test();
            check_model();
            return active_evaluator().auc_at_k(model, train, test, top_k);
        }

        double precision_at_top_k(int top_k = 100) const {
            check_test();
            check_model();
            return active_evaluator().precision_at_k(model, train, test, top_k);
        }

        const mat & get_user_factors() const { return model.user_factors(); }
        const mat & get_item_factors() const { return model.item_factors(); }

        bool get_user_id(const std::string & token, rid_t & id) const {
            return lookup(user_ids, token, id);
        }

        bool get_item_id(const std::string & token, rid_t & id) const {
            return lookup(item_ids, token, id);
        }

        const std::string & user_token(rid_t u) const {
            check_user(u);
            return user_tokens[u];
        }

        const std::string & item_token(rid_t i) const {
            if (i >= n_items()) {
                logstream(LOG_ERROR) << "Item index " << i << " out of range [0, " << n_items() << ")" << std::endl;
                throw dimension_error("retrieval_engine: item index out of range");
            }
            return item_tokens[i];
        }

        /// Full top-popular ranking, most popular first.
        const ranked_ids & toppop() const { return toppop_ranking; }

        rid_t n_users() const { return (rid_t)user_tokens.size(); }
        rid_t n_items() const { return (rid_t)item_tokens.size(); }

        const sparse_mat & train_matrix() const { return train; }
        bool has_test_matrix() const { return has_test; }
        const ifactor_model & get_model() const { return model; }

    private:

        static void build_token_map(const std::vector<std::string> & tokens, std::map<std::string, rid_t> & ids, const char * what) {
            for (size_t i = 0; i < tokens.size(); i++) {
                if (!ids.insert(std::make_pair(tokens[i], (rid_t)i)).second) {
                    logstream(LOG_ERROR) << "Duplicate " << what << " token '" << tokens[i] << "'" << std::endl;
                    throw input_error(std::string("retrieval_engine: duplicate ") + what + " token");
                }
            }
        }

        static bool lookup(const std::map<std::string, rid_t> & ids, const std::string & token, rid_t & id) {
            std::map<std::string, rid_t>::const_iterator it = ids.find(token);
            if (it == ids.end())
                return false;
            id = it->second;
            return true;
        }

        static sparse_mat select_rows(const sparse_mat & A, const std::vector<rid_t> & rows) {
            std::vector<triplet> entries;
            for (size_t k = 0; k < rows.size(); k++)
                for (sparse_mat::InnerIterator it(A, rows[k]); it; ++it)
                    entries.push_back(triplet((int)k, it.col(), it.value()));
            sparse_mat ret((int)rows.size(), A.cols());
            ret.setFromTriplets(entries.begin(), entries.end());
            return ret;
        }

        std::vector<bool> keep_flags(const std::vector<rid_t> & keep_row) const {
            std::vector<bool> keep(n_items(), false);
            for (size_t i = 0; i < keep_row.size(); i++)
                keep[keep_row[i]] = true;
            return keep;
        }

        void check_user(rid_t u) const {
            if (u >= n_users()) {
                logstream(LOG_ERROR) << "User index " << u << " out of range [0, " << n_users() << ")" << std::endl;
                throw dimension_error("retrieval_engine: user index out of range");
            }
        }

        void check_items(const std::vector<rid_t> & items) const {
            for (size_t i = 0; i < items.size(); i++) {
                if (items[i] >= n_items()) {
                    logstream(LOG_ERROR) << "Item index " << items[i] << " out of range [0, " << n_items() << ")" << std::endl;
                    throw dimension_error("retrieval_engine: item index out of range");
                }
            }
        }

        void check_model() const {
            if (model.item_factors().rows() != (int)n_items() || model.user_factors().rows() != (int)n_users()) {
                logstream(LOG_ERROR) << "Model has " << model.user_factors().rows() << " user and " << model.item_factors().rows()
                    << " item factors, interaction matrix is " << n_users() << "x" << n_items() << std::endl;
                throw dimension_error("retrieval_engine: model factors disagree with the interaction matrix");
            }
        }

        const ioffline_evaluator & active_evaluator() const {
            return evaluator != NULL ? *evaluator : default_evaluator;
        }

        void check_test() const {
            if (!has_test) {
                logstream(LOG_ERROR) << "Offline evaluation requested but the engine has no test matrix" << std::endl;
                throw input_error("retrieval_engine: no test matrix");
            }
        }
    };

}

#endif
