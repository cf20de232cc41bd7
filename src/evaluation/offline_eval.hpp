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
 * Offline ranking metrics of a factor model over a train/test split.
 * For every user with at least one test interaction the model ranks its
 * top K items, training items excluded, and the list is compared with
 * the user's test items.
 *
 *   precision@K  = total hits / sum over users of min(K, |test_u|)
 *   AUC@K        = mean over users of the ranked AUC truncated at K;
 *                  items below the cutoff count as ranked after every
 *                  hit, and ties of the tail are split evenly.
 *   MAP@K        = mean over users of average_precision_at_k().
 */

#ifndef DEF_DIVRANK_OFFLINE_EVAL
#define DEF_DIVRANK_OFFLINE_EVAL

#include <algorithm>
#include <set>
#include <vector>

#include "api/ifactor_model.hpp"
#include "logger/logger.hpp"
#include "util/errors.hpp"
#include "util/eigen_wrapper.hpp"

namespace divrank {

    /*  average_precision_at_k code based on Ben Hamer's Kaggle code:
     *  https://github.com/benhamner/Metrics/blob/master/MATLAB/metrics/averagePrecisionAtK.m
     */
    inline double average_precision_at_k(const vec & predictions, const vec & actual, int k) {
        double score = 0;
        int num_hits = 0;
        int divisor = std::min(k, (int)actual.size());
        if (divisor <= 0)
            return 0;

        vec sorted_actual = actual;
        std::sort(sorted_actual.data(), sorted_actual.data() + sorted_actual.size());
        for (int i = 0; i < std::min((int)predictions.size(), k); i++) {
            if (std::binary_search(sorted_actual.data(), sorted_actual.data() + sorted_actual.size(), predictions[i])) {
                num_hits++;
                score += num_hits / (i + 1.0);
            }
        }
        score /= (double)divisor;
        return score;
    }

    struct ranking_scores {
        double precision;
        double auc;
        double map;
        size_t users;   // users with test interactions

        ranking_scores() : precision(0), auc(0), map(0), users(0) {}
    };

    class ioffline_evaluator {
    public:
        virtual ~ioffline_evaluator() {}

        virtual double auc_at_k(const ifactor_model & model, const sparse_mat & train,
                                const sparse_mat & test, int K) const = 0;
        virtual double precision_at_k(const ifactor_model & model, const sparse_mat & train,
                                      const sparse_mat & test, int K) const = 0;
    };

    class ranking_evaluator : public ioffline_evaluator {
    public:

        ranking_scores evaluate(const ifactor_model & model, const sparse_mat & train,
                                const sparse_mat & test, int K) const {
            if (train.rows() != test.rows() || train.cols() != test.cols()) {
                logstream(LOG_ERROR) << "Train matrix is " << train.rows() << "x" << train.cols()
                    << " but test matrix is " << test.rows() << "x" << test.cols() << std::endl;
                throw dimension_error("evaluation: train and test shapes differ");
            }
            if (K <= 0) {
                logstream(LOG_ERROR) << "Ranking cutoff must be positive, got " << K << std::endl;
                throw input_error("evaluation: K must be positive");
            }

            ranking_scores ret;
            const int nitems = (int)test.cols();
            double relevant = 0, pr_div = 0, mean_auc = 0, mean_ap = 0;

            for (int u = 0; u < test.outerSize(); u++) {
                std::set<rid_t> likes;
                for (sparse_mat::InnerIterator it(test, u); it; ++it)
                    if (it.value() != 0)
                        likes.insert((rid_t)it.col());
                if (likes.empty())
                    continue;

                std::vector<rid_t> query(1, (rid_t)u);
                ranked_ids ids = model.recommend(query, sparse_mat(train.middleRows(u, 1)), K)[0];

                const double num_pos = (double)likes.size();
                const double num_neg = (double)nitems - num_pos;
                double hit = 0, miss = 0, auc = 0;
                vec predictions(ids.size()), actual(likes.size());
                int j = 0;
                for (std::set<rid_t>::const_iterator it = likes.begin(); it != likes.end(); ++it)
                    actual[j++] = *it;
                for (size_t i = 0; i < ids.size(); i++) {
                    predictions[i] = ids.ids[i];
                    if (likes.count(ids.ids[i])) {
                        hit += 1;
                    } else {
                        miss += 1;
                        auc += hit;
                    }
                }
                relevant += hit;
                pr_div += std::min((double)K, num_pos);
                auc += ((hit + num_pos) / 2.0) * (num_neg - miss);
                mean_auc += num_neg > 0 ? auc / (num_pos * num_neg) : 1.0;
                mean_ap += average_precision_at_k(predictions, actual, K);
                ret.users++;
            }

            if (ret.users == 0) {
                logstream(LOG_WARNING) << "No user has test interactions, ranking metrics are 0" << std::endl;
                return ret;
            }
            ret.precision = relevant / pr_div;
            ret.auc = mean_auc / ret.users;
            ret.map = mean_ap / ret.users;
            logstream(LOG_DEBUG) << "Ranking metrics@" << K << " over " << ret.users << " users: precision="
                << ret.precision << " auc=" << ret.auc << " map=" << ret.map << std::endl;
            return ret;
        }

        virtual double auc_at_k(const ifactor_model & model, const sparse_mat & train,
                                const sparse_mat & test, int K) const {
            return evaluate(model, train, test, K).auc;
        }

        virtual double precision_at_k(const ifactor_model & model, const sparse_mat & train,
                                      const sparse_mat & test, int K) const {
            return evaluate(model, train, test, K).precision;
        }
    };

}

#endif
