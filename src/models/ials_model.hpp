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
 * Matrix factorization of implicit feedback with Alternating Least
 * Squares (iALS), as described in:
 *    Collaborative Filtering for Implicit Feedback Datasets
 *    Yifan Hu, Yehuda Koren and Chris Volinsky, ICDM 2008.
 *
 * Each observed entry r of the interaction matrix becomes a confidence
 * c = 1 + alpha * |r| and a preference p = 1 (r > 0) or p = 0 (r < 0);
 * unobserved entries have c = 1 and p = 0. One sweep solves, for every
 * user u with the item factors Y fixed,
 *
 *    (YtY + Yt (C_u - I) Y + lambda I) x_u = Yt C_u p_u
 *
 * and then the same for every item with the user factors fixed. The
 * systems only touch the observed entries of a row, the dense YtY is
 * shared by all rows of a sweep. Rows are solved in parallel with OpenMP.
 *
 * All factors are kept in memory.
 */

#ifndef DEF_DIVRANK_IALS_MODEL
#define DEF_DIVRANK_IALS_MODEL

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <vector>
#include <omp.h>

#include "api/ifactor_model.hpp"
#include "logger/logger.hpp"
#include "metrics/metrics.hpp"
#include "util/errors.hpp"
#include "util/eigen_wrapper.hpp"

namespace divrank {

    struct ials_params {
        int D;            // feature vector width
        double lambda;    // regularization
        double alpha;     // confidence scaling of observed entries
        int niters;       // number of sweeps
        long seed;        // seed of the factor initialization
        double init_scale;

        ials_params() : D(300), lambda(0.03), alpha(0.6), niters(10), seed(42), init_scale(0.01) {}
    };

    class ials_model : public ifactor_model {

        ials_params params;
        mat X;       // user factors, one row per user
        mat Y;       // item factors, one row per item
        metrics * m;
        std::vector<double> losses;

    public:

        explicit ials_model(const ials_params & params = ials_params(), metrics * m = NULL)
            : params(params), m(m) {
            if (params.D <= 0 || params.lambda < 0 || params.niters < 0) {
                logstream(LOG_ERROR) << "Invalid iALS parameters: D=" << params.D << " lambda=" << params.lambda
                    << " niters=" << params.niters << std::endl;
                throw input_error("ials: D must be >= 1, lambda >= 0 and niters >= 0");
            }
        }

        virtual ~ials_model() {}

        const ials_params & get_params() const { return params; }

        /** Training loss after each sweep of the last fit(). */
        const std::vector<double> & training_losses() const { return losses; }

        virtual void fit(const sparse_mat & interactions) {
            const int M = (int)interactions.rows();
            const int N = (int)interactions.cols();
            logstream(LOG_INFO) << "iALS fit: " << M << " users, " << N << " items, "
                << interactions.nonZeros() << " entries, D=" << params.D << std::endl;

            init_feature_vectors(M, N);
            sparse_mat transposed = sparse_mat(interactions.transpose());
            losses.clear();

            for (int iter = 0; iter < params.niters; iter++) {
                metrics_entry me;
                if (m != NULL) me = m->start_time();

                least_squares_sweep(interactions, Y, X);
                least_squares_sweep(transposed, X, Y);

                double loss = training_loss(interactions);
                losses.push_back(loss);
                if (m != NULL) {
                    m->stop_time(me, "ials_iteration", iter);
                    m->add_to_vector("ials_training_loss", loss);
                }
                logstream(LOG_INFO) << "iALS iteration " << iter + 1 << "/" << params.niters
                    << " training loss: " << loss << std::endl;
            }
        }

        virtual std::vector<ranked_ids> recommend(const std::vector<rid_t> & user_ids,
                                                  const sparse_mat & filter_matrix, int N) const {
            if ((size_t)filter_matrix.rows() != user_ids.size() || filter_matrix.cols() != Y.rows()) {
                logstream(LOG_ERROR) << "Filter matrix is " << filter_matrix.rows() << "x" << filter_matrix.cols()
                    << ", expected " << user_ids.size() << "x" << Y.rows() << std::endl;
                throw dimension_error("ials: filter matrix shape does not match the query");
            }
            std::vector<ranked_ids> ret(user_ids.size());
            for (size_t k = 0; k < user_ids.size(); k++) {
                rid_t u = user_ids[k];
                if (u >= (rid_t)X.rows()) {
                    logstream(LOG_ERROR) << "User index " << u << " out of range [0, " << X.rows() << ")" << std::endl;
                    throw dimension_error("ials: user index out of range");
                }
                vec scores = Y * X.row(u).transpose();

                std::vector<bool> liked(Y.rows(), false);
                for (sparse_mat::InnerIterator it(filter_matrix, (int)k); it; ++it)
                    liked[it.col()] = true;

                std::vector<std::pair<double,int> > candidates;
                candidates.reserve(Y.rows());
                for (int i = 0; i < (int)Y.rows(); i++) {
                    if (!liked[i])
                        candidates.push_back(std::make_pair(scores[i], i));
                }
                std::stable_sort(candidates.begin(), candidates.end(), pair_compare_desc);
                int howmany = std::max(0, std::min(N, (int)candidates.size()));
                for (int j = 0; j < howmany; j++)
                    ret[k].push_back((rid_t)candidates[j].second, candidates[j].first);
            }
            return ret;
        }

        virtual const mat & user_factors() const { return X; }
        virtual const mat & item_factors() const { return Y; }
        virtual mat & mutable_item_factors() { return Y; }

        /**
         * Replaces the factors, e.g. with ones trained elsewhere.
         */
        void set_factors(const mat & user_factors, const mat & item_factors) {
            if (user_factors.cols() != item_factors.cols()) {
                logstream(LOG_ERROR) << "User factors have width " << user_factors.cols()
                    << " but item factors " << item_factors.cols() << std::endl;
                throw dimension_error("ials: factor widths differ");
            }
            X = user_factors;
            Y = item_factors;
            params.D = (int)user_factors.cols();
        }

        /**
         * Weighted squared error over all entries plus the regularizer,
         * divided by the number of matrix entries.
         */
        double training_loss(const sparse_mat & interactions) const {
            const double nentries = (double)interactions.rows() * (double)interactions.cols();
            if (nentries == 0)
                return 0;
            // Every entry as if unobserved (c = 1, p = 0): sum of all squared scores.
            mat XtX = X.transpose() * X;
            mat YtY = Y.transpose() * Y;
            double loss = (XtX.array() * YtY.array()).sum();
            for (int u = 0; u < interactions.outerSize(); u++) {
                for (sparse_mat::InnerIterator it(interactions, u); it; ++it) {
                    double r = it.value();
                    if (r == 0)
                        continue;
                    double score = X.row(u).dot(Y.row(it.col()));
                    double c = 1 + params.alpha * std::fabs(r);
                    double p = r > 0 ? 1 : 0;
                    loss += c * (p - score) * (p - score) - score * score;
                }
            }
            loss += params.lambda * (X.squaredNorm() + Y.squaredNorm());
            return loss / nentries;
        }

    private:

        void init_feature_vectors(int M, int N) {
            srand48(params.seed);
            X.resize(M, params.D);
            Y.resize(N, params.D);
            for (int i = 0; i < M; i++)
                for (int j = 0; j < params.D; j++)
                    X(i, j) = params.init_scale * drand48();
            for (int i = 0; i < N; i++)
                for (int j = 0; j < params.D; j++)
                    Y(i, j) = params.init_scale * drand48();
        }

        /**
         * Solves every row of `target` against the fixed `fixed` factors.
         * Row r of R holds the observations of target row r.
         */
        void least_squares_sweep(const sparse_mat & R, const mat & fixed, mat & target) const {
            const int D = params.D;
            mat YtY = fixed.transpose() * fixed;

#pragma omp parallel for
            for (int r = 0; r < (int)R.outerSize(); r++) {
                mat A = YtY;
                vec b = vec::Zero(D);
                for (sparse_mat::InnerIterator it(R, r); it; ++it) {
                    double value = it.value();
                    if (value == 0)
                        continue;
                    double c = 1 + params.alpha * std::fabs(value);
                    vec nbr = fixed.row(it.col()).transpose();
                    A.selfadjointView<Eigen::Upper>().rankUpdate(nbr, c - 1);
                    if (value > 0)
                        b += c * nbr;
                }
                for (int i = 0; i < D; i++) A(i, i) += params.lambda;

                // Solve the least squares problem with eigen using Cholesky decomposition
                target.row(r) = A.selfadjointView<Eigen::Upper>().ldlt().solve(b).transpose();
            }
        }

    };

}

#endif
