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
 * Rerank preprocessing: truncation, category lookup through the item
 * tokens, the similarity matrix and the metadata errors.
 */

#include <cmath>
#include <sstream>
#include <string>
#include <vector>

#include "api/item_table.hpp"
#include "engine/rerank_preprocessor.hpp"
#include "logger/logger.hpp"
#include "models/ials_model.hpp"

using namespace divrank;

const int NITEMS = 12;

static std::string item_name(int i) {
    std::ostringstream ss;
    ss << "item" << i;
    return ss.str();
}

static vec embedding_of(int i) {
    vec e(3);
    e << i, 1, 0.5 * i - 2;
    return e;
}

/* Metadata rows are added in reverse catalog order, so the engine has to
 * go through the tokens. */
static item_table catalog_metadata() {
    item_table items;
    for (int i = NITEMS - 1; i >= 0; i--) {
        items.set_category("genre", item_name(i), i % 2 == 0 ? "even" : "odd");
        items.set_vector("embedding", item_name(i), embedding_of(i));
    }
    return items;
}

struct fixture {
    ials_model model;
    std::vector<std::string> users, items;
    sparse_mat R;

    fixture() : users(1, "alice"), R(1, NITEMS) {
        for (int i = 0; i < NITEMS; i++)
            items.push_back(item_name(i));
        R.insert(0, 0) = 1;
        R.makeCompressed();
        // score of item i is i
        mat X = mat::Ones(1, 1);
        mat Y(NITEMS, 1);
        for (int i = 0; i < NITEMS; i++) Y(i, 0) = i;
        model.set_factors(X, Y);
    }
};

void test_truncated_candidates() {
    fixture f;
    retrieval_engine engine(f.model, f.R, f.users, f.items);
    item_table metadata = catalog_metadata();
    rerank_preprocessor prep(engine, metadata);

    rerank_input in = prep.rerank_preprocess(0, 10, "genre", "embedding");
    assert(in.candidates.size() == 10);
    assert(in.relevance.size() == 10);
    for (int j = 0; j < 10; j++) {
        assert(in.candidates[j] == (rid_t)(NITEMS - 1 - j));
        assert(in.relevance[j] == NITEMS - 1 - j);
    }

    assert(in.categories.size() == (size_t)NITEMS);
    for (int i = 0; i < NITEMS; i++)
        assert(in.categories[i] == (i % 2 == 0 ? "even" : "odd"));

    assert(in.similarity.rows() == 10 && in.similarity.cols() == 10);
    for (int a = 0; a < 10; a++) {
        for (int b = 0; b < 10; b++)
            assert(in.similarity(a, b) == in.similarity(b, a));
        vec e = embedding_of(in.candidates[a]);
        assert(std::fabs(in.similarity(a, a) - e.dot(e)) <= 1e-9 * (1 + e.dot(e)));
    }
    vec e0 = embedding_of(in.candidates[0]), e3 = embedding_of(in.candidates[3]);
    assert(std::fabs(in.similarity(0, 3) - e0.dot(e3)) <= 1e-9 * (1 + std::fabs(e0.dot(e3))));
}

void test_cutoff_clamped() {
    fixture f;
    retrieval_engine engine(f.model, f.R, f.users, f.items);
    item_table metadata = catalog_metadata();
    rerank_preprocessor prep(engine, metadata);

    // 11 candidates: item 0 was already seen
    rerank_input in = prep.rerank_preprocess(0, 50, "genre", "embedding");
    assert(in.candidates.size() == (size_t)(NITEMS - 1));
    assert(in.similarity.rows() == NITEMS - 1);

    in = prep.rerank_preprocess(0, 0, "genre", "embedding");
    assert(in.candidates.empty() && in.similarity.rows() == 0);
}

void test_metadata_errors() {
    fixture f;
    retrieval_engine engine(f.model, f.R, f.users, f.items);

    item_table metadata = catalog_metadata();
    rerank_preprocessor prep(engine, metadata);
    bool thrown = false;
    try { prep.rerank_preprocess(0, 5, "mood", "embedding"); } catch (input_error &) { thrown = true; }
    assert(thrown);

    thrown = false;
    try { prep.rerank_preprocess(0, 5, "genre", "audio"); } catch (input_error &) { thrown = true; }
    assert(thrown);

    item_table uneven = catalog_metadata();
    uneven.set_vector("embedding", item_name(4), vec::Ones(2));
    rerank_preprocessor prep_uneven(engine, uneven);
    thrown = false;
    try { prep_uneven.rerank_preprocess(0, 5, "genre", "embedding"); } catch (input_error &) { thrown = true; }
    assert(thrown);

    item_table partial;
    for (int i = 0; i < NITEMS - 1; i++) {
        partial.set_category("genre", item_name(i), "any");
        partial.set_vector("embedding", item_name(i), embedding_of(i));
    }
    rerank_preprocessor prep_partial(engine, partial);
    thrown = false;
    try { prep_partial.rerank_preprocess(0, 5, "genre", "embedding"); } catch (input_error &) { thrown = true; }
    assert(thrown);

    thrown = false;
    try { prep.rerank_preprocess(1, 5, "genre", "embedding"); } catch (dimension_error &) { thrown = true; }
    assert(thrown);
}

int main(int argc, const char ** argv) {
    test_truncated_candidates();
    test_cutoff_clamped();
    test_metadata_errors();
    logstream(LOG_INFO) << "Rerank preprocessing tests passed." << std::endl;
    return 0;
}
