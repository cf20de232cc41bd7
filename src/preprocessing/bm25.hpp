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
 * BM25 weighting of an implicit feedback matrix, applied before training
 * a factor model. The matrix is read in its transposed orientation: each
 * item is a "document" whose length is the sum of its interaction
 * weights, and each user plays the role of a term whose document
 * frequency is the number of items the user interacted with.
 *
 *   N           = number of items
 *   idf[u]      = ln N - ln(1 + df[u])
 *   length_norm = (1 - B) + B * item_len / avg_item_len
 *   w'          = w * (K1 + 1) / (K1 * length_norm[i] + w) * idf[u]
 *
 * The result has exactly the stored pattern of the input; zero entries
 * stay zero. A user whose interaction count reaches N - 1 gets a
 * non-positive idf (always the case when N = 1); such weights are kept
 * as computed and reported with a warning.
 */

#ifndef DEF_DIVRANK_BM25
#define DEF_DIVRANK_BM25

#include <cmath>

#include "logger/logger.hpp"
#include "util/errors.hpp"
#include "util/eigen_wrapper.hpp"

namespace divrank {

    struct bm25_params {
        double K1;  // term frequency saturation
        double B;   // length normalization, in [0, 1]

        bm25_params() : K1(100), B(0.8) {}
        bm25_params(double K1, double B) : K1(K1), B(B) {}
    };

    /**
     * Returns the BM25 weighted copy of X (rows = users, columns = items).
     * X itself is not modified.
     */
    inline sparse_mat bm25_weight(const sparse_mat & X, const bm25_params & params = bm25_params()) {
        if (params.B < 0 || params.B > 1 || params.K1 < 0) {
            logstream(LOG_ERROR) << "BM25 parameters out of range: K1=" << params.K1 << " B=" << params.B << std::endl;
            throw input_error("bm25: K1 must be >= 0 and B in [0, 1]");
        }

        sparse_mat weighted = X;
        weighted.makeCompressed();
        const int nusers = (int)X.rows();
        const int nitems = (int)X.cols();
        if (nitems == 0 || nusers == 0)
            return weighted;

        vec df = zeros(nusers);
        vec item_len = zeros(nitems);
        for (int u = 0; u < nusers; u++) {
            for (sparse_mat::InnerIterator it(X, u); it; ++it) {
                if (it.value() < 0) {
                    logstream(LOG_ERROR) << "Negative interaction weight " << it.value() << " at (" << u << ", " << it.col() << ")" << std::endl;
                    throw input_error("bm25: interaction weights must be non-negative");
                }
                if (it.value() != 0) {
                    df[u] += 1;
                    item_len[it.col()] += it.value();
                }
            }
        }

        const double N = (double)nitems;
        vec idf = (vec::Constant(nusers, std::log(N)).array() - df.array().log1p()).matrix();
        double average_length = item_len.mean();
        vec length_norm = vec::Constant(nitems, 1.0 - params.B);
        if (average_length > 0)
            length_norm += params.B * item_len / average_length;

        int nonpositive = 0;
        for (int u = 0; u < nusers; u++) {
            if (df[u] > 0 && idf[u] <= 0)
                nonpositive++;
            for (sparse_mat::InnerIterator it(weighted, u); it; ++it) {
                double w = it.value();
                if (w == 0)
                    continue;
                it.valueRef() = w * (params.K1 + 1.0) / (params.K1 * length_norm[it.col()] + w) * idf[u];
            }
        }
        if (nonpositive > 0) {
            logstream(LOG_WARNING) << nonpositive << " users have a non-positive BM25 idf (N=" << nitems
                << " items); their weights are zero or negative" << std::endl;
        }
        return weighted;
    }

}

#endif
