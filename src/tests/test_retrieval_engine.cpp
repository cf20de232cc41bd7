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
 * Retrieval engine on a small catalog with fixed factors: cold-start
 * fallback, restricted scoring, masking, prediction and the shape checks.
 */

#include <cmath>
#include <string>
#include <vector>

#include "engine/retrieval_engine.hpp"
#include "logger/logger.hpp"
#include "models/ials_model.hpp"

using namespace divrank;

static bool close_to(double a, double b, double tol = 1e-9) {
    return std::fabs(a - b) <= tol;
}

static std::vector<std::string> tokens(const char * prefix, int n) {
    std::vector<std::string> ret;
    for (int i = 0; i < n; i++)
        ret.push_back(prefix + std::string(1, (char)('0' + i)));
    return ret;
}

/* Item popularity: i3 = 3, i4 = 2, i0 = i1 = i2 = 1. */
static sparse_mat interactions() {
    std::vector<triplet> e;
    e.push_back(triplet(0, 0, 1)); e.push_back(triplet(0, 3, 1));
    e.push_back(triplet(1, 3, 1)); e.push_back(triplet(1, 4, 1));
    e.push_back(triplet(2, 1, 1)); e.push_back(triplet(2, 3, 1)); e.push_back(triplet(2, 4, 1));
    e.push_back(triplet(3, 2, 1));
    sparse_mat R(4, 5);
    R.setFromTriplets(e.begin(), e.end());
    return R;
}

static void set_fixed_factors(ials_model & model) {
    mat X(4, 2), Y(5, 2);
    X << 1, 0,
         0, 1,
         1, 1,
         2, 0;
    Y << 1, 0,
         0, 1,
         0.5, 0.5,
         3, 0,
         0, 2;
    model.set_factors(X, Y);
}

static std::vector<rid_t> ids(rid_t a, rid_t b) {
    std::vector<rid_t> v;
    v.push_back(a);
    v.push_back(b);
    return v;
}

static std::vector<rid_t> ids(rid_t a, rid_t b, rid_t c) {
    std::vector<rid_t> v = ids(a, b);
    v.push_back(c);
    return v;
}

void test_toppop_fallback() {
    ials_model model;   // never fitted
    retrieval_engine engine(model, interactions(), tokens("u", 4), tokens("i", 5));

    const ranked_ids & pop = engine.toppop();
    assert(pop.size() == 5);
    assert(pop.ids[0] == 3 && pop.ids[1] == 4 && pop.ids[2] == 0 && pop.ids[3] == 1 && pop.ids[4] == 2);

    std::vector<std::string> recs = engine.recommend_single("unknown_user", 5);
    assert(recs.size() == 5);
    for (size_t i = 0; i < recs.size(); i++)
        assert(recs[i] == engine.item_token(pop.ids[i]));

    recs = engine.recommend_single("unknown_user", 2);
    assert(recs.size() == 2 && recs[0] == "i3" && recs[1] == "i4");

    vec scores;
    assert(!engine.get_score_single_user("unknown_user", ids(0, 1), scores));

    ranked_tokens top = engine.get_topk_single_user("unknown_user", ids(0, 4, 2), 2);
    assert(top.size() == 2);
    assert(top.ids[0] == "i4" && top.scores[0] == 2);
    assert(top.ids[1] == "i0" && top.scores[1] == 1);
}

void test_toppop_mask() {
    ials_model model;
    engine_config config;
    config.toppop_mask.push_back(3);
    retrieval_engine engine(model, interactions(), tokens("u", 4), tokens("i", 5), config);
    std::vector<std::string> recs = engine.recommend_single("nobody", 1);
    assert(recs.size() == 1 && recs[0] == "i4");
}

void test_known_users() {
    ials_model model;
    retrieval_engine engine(model, interactions(), tokens("u", 4), tokens("i", 5));
    set_fixed_factors(model);

    // u0 scores [1, 0, 0.5, 3, 0], items 0 and 3 already seen
    std::vector<std::string> recs = engine.recommend_single("u0", 10);
    assert(recs.size() == 3);
    assert(recs[0] == "i2" && recs[1] == "i1" && recs[2] == "i4");

    std::vector<ranked_ids> all = engine.recommend(ids(0, 1));
    assert(all.size() == 2);
    // u1 scores [0, 1, 0.5, 0, 2], items 3 and 4 already seen
    assert(all[1].size() == 3);
    assert(all[1].ids[0] == 1 && all[1].ids[1] == 2 && all[1].ids[2] == 0);

    vec scores;
    assert(engine.get_score_single_user("u2", ids(0, 3, 4), scores));
    assert(scores.size() == 3 && scores[0] == 1 && scores[1] == 3 && scores[2] == 2);

    ranked_tokens top = engine.get_topk_single_user("u2", ids(4, 0, 3), 2);
    assert(top.size() == 2);
    assert(top.ids[0] == "i3" && top.scores[0] == 3);
    assert(top.ids[1] == "i4" && top.scores[1] == 2);

    // equal scores keep the order of keep_indices
    top = engine.get_topk_single_user("u0", ids(4, 1), 2);
    assert(top.ids[0] == "i4" && top.ids[1] == "i1");

    vec p = engine.predict(ids(0, 2), ids(3, 4));
    assert(p.size() == 2 && p[0] == 3 && p[1] == 2);

    rid_t id;
    assert(engine.get_user_id("u3", id) && id == 3);
    assert(engine.get_item_id("i4", id) && id == 4);
    assert(!engine.get_item_id("i9", id));
    assert(engine.user_token(1) == "u1");
    assert(engine.n_users() == 4 && engine.n_items() == 5);
    assert(engine.get_item_factors().rows() == 5);
}

void test_masking() {
    ials_model model;
    retrieval_engine engine(model, interactions(), tokens("u", 4), tokens("i", 5));
    set_fixed_factors(model);

    mat view = engine.masked_view(ids(0, 3));
    assert(view.row(1).isZero() && view.row(2).isZero() && view.row(4).isZero());
    assert(view(3, 0) == 3);
    assert(model.item_factors()(4, 1) == 2);

    engine.mask_items(ids(0, 3));
    vec scores;
    assert(engine.get_score_single_user("u2", ids(1, 2, 4), scores));
    assert(scores.isZero());
    assert(engine.get_score_single_user("u2", std::vector<rid_t>(1, 3), scores));
    assert(scores[0] == 3);
    assert(model.item_factors() == view);
}

void test_offline_scores() {
    ials_model model;
    sparse_mat test(4, 5);
    test.insert(0, 2) = 1;
    retrieval_engine engine(model, interactions(), tokens("u", 4), tokens("i", 5), engine_config(), &test);
    set_fixed_factors(model);
    assert(close_to(engine.precision_at_top_k(1), 1.0));
    assert(close_to(engine.auc_score(1), 1.0));

    // a copy evaluates on its own after the engine it was copied from is gone
    retrieval_engine * original = new retrieval_engine(model, interactions(), tokens("u", 4), tokens("i", 5),
                                                       engine_config(), &test);
    retrieval_engine copy(*original);
    delete original;
    assert(close_to(copy.auc_score(2), 1.0));
    assert(close_to(copy.precision_at_top_k(1), 1.0));

    retrieval_engine no_test(model, interactions(), tokens("u", 4), tokens("i", 5));
    bool thrown = false;
    try { no_test.auc_score(5); } catch (input_error &) { thrown = true; }
    assert(thrown);
}

void test_fit() {
    ials_params params;
    params.D = 2;
    params.niters = 3;
    ials_model model(params);
    retrieval_engine engine(model, interactions(), tokens("u", 4), tokens("i", 5));
    engine.fit();
    assert(engine.get_user_factors().rows() == 4 && engine.get_user_factors().cols() == 2);
    assert(model.training_losses().size() == 3);
    assert(engine.recommend_single("u3", 2).size() == 2);
}

void test_shape_errors() {
    ials_model model;
    bool thrown = false;
    try { retrieval_engine e(model, interactions(), tokens("u", 3), tokens("i", 5)); } catch (dimension_error &) { thrown = true; }
    assert(thrown);

    thrown = false;
    std::vector<std::string> dup = tokens("u", 4);
    dup[3] = "u0";
    try { retrieval_engine e(model, interactions(), dup, tokens("i", 5)); } catch (input_error &) { thrown = true; }
    assert(thrown);

    thrown = false;
    sparse_mat test(4, 6);
    try { retrieval_engine e(model, interactions(), tokens("u", 4), tokens("i", 5), engine_config(), &test); } catch (dimension_error &) { thrown = true; }
    assert(thrown);

    retrieval_engine engine(model, interactions(), tokens("u", 4), tokens("i", 5));

    // not fitted: factor rows disagree with the catalog
    thrown = false;
    try { engine.recommend_single("u0", 3); } catch (dimension_error &) { thrown = true; }
    assert(thrown);

    set_fixed_factors(model);
    vec scores;
    thrown = false;
    try { engine.get_score_single_user("u0", ids(0, 5), scores); } catch (dimension_error &) { thrown = true; }
    assert(thrown);

    thrown = false;
    try { engine.predict(ids(0, 1), std::vector<rid_t>(1, 0)); } catch (dimension_error &) { thrown = true; }
    assert(thrown);

    thrown = false;
    try { engine.predict(ids(0, 4), ids(0, 1)); } catch (dimension_error &) { thrown = true; }
    assert(thrown);

    thrown = false;
    try { engine.mask_items(std::vector<rid_t>(1, 7)); } catch (dimension_error &) { thrown = true; }
    assert(thrown);
}

int main(int argc, const char ** argv) {
    test_toppop_fallback();
    test_toppop_mask();
    test_known_users();
    test_masking();
    test_offline_scores();
    test_fit();
    test_shape_errors();
    logstream(LOG_INFO) << "Retrieval engine tests passed." << std::endl;
    return 0;
}
