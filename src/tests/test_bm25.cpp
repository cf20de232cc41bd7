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
 * BM25 weighting: hand computed weights, preservation of the stored
 * pattern, the single item catalog and parameter validation.
 */

#include <cmath>
#include <vector>

#include "logger/logger.hpp"
#include "preprocessing/bm25.hpp"

using namespace divrank;

static bool close_to(double a, double b, double tol = 1e-9) {
    return std::fabs(a - b) <= tol;
}

static sparse_mat from_triplets(int rows, int cols, const std::vector<triplet> & entries) {
    sparse_mat A(rows, cols);
    A.setFromTriplets(entries.begin(), entries.end());
    A.makeCompressed();
    return A;
}

void test_hand_computed_weights() {
    // user 0 -> items 0 (1) and 1 (3), user 1 -> item 0 (2); 4 items
    std::vector<triplet> entries;
    entries.push_back(triplet(0, 0, 1));
    entries.push_back(triplet(0, 1, 3));
    entries.push_back(triplet(1, 0, 2));
    sparse_mat X = from_triplets(2, 4, entries);

    sparse_mat W = bm25_weight(X);
    double idf0 = std::log(4.0) - std::log(3.0);
    double idf1 = std::log(4.0) - std::log(2.0);
    // item lengths [3, 3, 0, 0], mean 1.5
    double norm = 0.2 + 0.8 * 3 / 1.5;
    assert(close_to(W.coeff(0, 0), 1 * 101.0 / (100 * norm + 1) * idf0));
    assert(close_to(W.coeff(0, 1), 3 * 101.0 / (100 * norm + 3) * idf0));
    assert(close_to(W.coeff(1, 0), 2 * 101.0 / (100 * norm + 2) * idf1));

    // input untouched
    assert(X.coeff(0, 1) == 3);
}

void test_pattern_preserved() {
    std::vector<triplet> entries;
    for (int u = 0; u < 6; u++) {
        entries.push_back(triplet(u, u, 1 + u));
        entries.push_back(triplet(u, (u + 3) % 10, 2));
    }
    entries.push_back(triplet(2, 9, 0));   // explicitly stored zero
    sparse_mat X = from_triplets(6, 10, entries);
    sparse_mat W = bm25_weight(X, bm25_params(1.2, 0.75));

    assert(W.rows() == X.rows() && W.cols() == X.cols());
    assert(W.nonZeros() == X.nonZeros());
    for (int u = 0; u < X.outerSize(); u++) {
        sparse_mat::InnerIterator a(X, u), b(W, u);
        for (; a; ++a, ++b) {
            assert(b);
            assert(a.col() == b.col());
            if (a.value() == 0)
                assert(b.value() == 0);
            else {
                // every user has df = 2 out of 10 items, so idf > 0
                assert(b.value() > 0);
                assert(std::isfinite(b.value()));
            }
        }
        assert(!b);
    }
}

/* N = 1: idf = ln 1 - ln 2 is negative. The weight is kept as computed. */
void test_single_item_catalog() {
    std::vector<triplet> entries(1, triplet(0, 0, 2));
    sparse_mat X = from_triplets(1, 1, entries);
    sparse_mat W = bm25_weight(X, bm25_params(100, 0.8));
    assert(W.nonZeros() == 1);
    double w = W.coeff(0, 0);
    assert(std::isfinite(w));
    assert(w < 0);
    assert(close_to(w, 2 * 101.0 / (100 * 1.0 + 2) * -std::log(2.0)));
}

void test_invalid_input() {
    std::vector<triplet> entries(1, triplet(0, 1, 1));
    sparse_mat X = from_triplets(2, 2, entries);

    bool thrown = false;
    try { bm25_weight(X, bm25_params(100, 1.5)); } catch (input_error &) { thrown = true; }
    assert(thrown);

    thrown = false;
    try { bm25_weight(X, bm25_params(-1, 0.5)); } catch (input_error &) { thrown = true; }
    assert(thrown);

    thrown = false;
    std::vector<triplet> negative(1, triplet(1, 0, -2));
    try { bm25_weight(from_triplets(2, 2, negative)); } catch (input_error &) { thrown = true; }
    assert(thrown);

    sparse_mat empty(0, 0);
    assert(bm25_weight(empty).nonZeros() == 0);
}

int main(int argc, const char ** argv) {
    test_hand_computed_weights();
    test_pattern_preserved();
    test_single_item_catalog();
    test_invalid_input();
    logstream(LOG_INFO) << "BM25 tests passed." << std::endl;
    return 0;
}
