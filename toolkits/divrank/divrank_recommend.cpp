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
 * Candidate generation from an implicit feedback matrix: BM25 weighting,
 * iALS training, top-N recommendation per user and the category
 * diversity of everything that was recommended.
 *
 * Input is a Matrix Market file of users x items. User i and item j get
 * the tokens "i" and "j" (1-based, as in the file).
 *
 * Usage:
 *   divrank_recommend --training=smallnetflix_mm [--test=smallnetflix_mme]
 *       [--K1=100] [--B=0.8] [--D=300] [--lambda=0.03] [--alpha=0.6]
 *       [--max_iter=10] [--seed=42] [--num_ratings=10] [--print_users=10]
 */

#include <sstream>
#include <string>
#include <vector>

#include "divrank_basic_includes.hpp"

#include <unsupported/Eigen/SparseExtra>

using namespace divrank;

static std::vector<std::string> index_tokens(int n) {
  std::vector<std::string> ret(n);
  for (int i = 0; i < n; i++) {
    std::ostringstream ss;
    ss << (i + 1);
    ret[i] = ss.str();
  }
  return ret;
}

static sparse_mat load_matrix_market(const std::string & filename) {
  sparse_mat A;
  if (!Eigen::loadMarket(A, filename))
    logstream(LOG_FATAL) << "Failed to read matrix market file: " << filename << std::endl;
  A.makeCompressed();
  logstream(LOG_INFO) << "Loaded " << filename << ": " << A.rows() << "x" << A.cols() << ", "
    << A.nonZeros() << " entries" << std::endl;
  return A;
}

int main(int argc, const char ** argv) {

  divrank_init(argc, argv);
  global_logger().set_log_level(get_option_int("loglevel", LOG_INFO));

  metrics m("divrank-recommend");

  try {
    std::string training = get_option_string("training");
    std::string testfile = get_option_string("test", "");
    int num_ratings = get_option_int("num_ratings", 10);
    int print_users = get_option_int("print_users", 10);
    if (num_ratings <= 0)
      logstream(LOG_FATAL) << "num_ratings, the number of recomended items for each user, should be >=1 " << std::endl;

    engine_config config;
    config.bm25.K1 = get_option_float("K1", config.bm25.K1);
    config.bm25.B = get_option_float("B", config.bm25.B);
    config.fit_scale = get_option_float("fit_scale", config.fit_scale);

    ials_params params;
    params.D = get_option_int("D", params.D);
    params.lambda = get_option_float("lambda", params.lambda);
    params.alpha = get_option_float("alpha", params.alpha);
    params.niters = get_option_int("max_iter", params.niters);
    params.seed = (long)get_option_long("seed", params.seed);

    sparse_mat train = load_matrix_market(training);
    sparse_mat test;
    if (testfile != "") {
      test = load_matrix_market(testfile);
      if (test.rows() != train.rows() || test.cols() != train.cols()) {
        // Test files may omit trailing users or items.
        test.conservativeResize(train.rows(), train.cols());
      }
    }
    if ((int)train.cols() < num_ratings) {
      logstream(LOG_WARNING) << "num_ratings is too big - setting it to: " << train.cols() << std::endl;
      num_ratings = (int)train.cols();
    }

    ials_model model(params, &m);
    retrieval_engine engine(model, train, index_tokens((int)train.rows()), index_tokens((int)train.cols()),
                            config, testfile != "" ? &test : NULL, &m);
    engine.fit();

    metrics_entry me = m.start_time();
    std::vector<rid_t> users(engine.n_users());
    for (rid_t u = 0; u < engine.n_users(); u++)
      users[u] = u;
    std::vector<ranked_ids> recs = engine.recommend(users);
    m.stop_time(me, "recommend");

    std::vector<std::string> recommended;
    for (rid_t u = 0; u < engine.n_users(); u++) {
      const ranked_ids & r = recs[u];
      int howmany = std::min(num_ratings, (int)r.size());
      if ((int)u < print_users)
        std::cout << "user " << engine.user_token(u) << ":";
      for (int j = 0; j < howmany; j++) {
        recommended.push_back(engine.item_token(r.ids[j]));
        if ((int)u < print_users)
          std::cout << " " << engine.item_token(r.ids[j]) << "(" << r.scores[j] << ")";
      }
      if ((int)u < print_users)
        std::cout << std::endl;
    }

    if (!recommended.empty()) {
      diversity_summary s = summarize(build_histogram(recommended));
      std::cout << "Recommended item diversity over " << s.observations << " slots, " << s.categories << " distinct items:" << std::endl;
      std::cout << "  gini:    " << s.gini << std::endl;
      std::cout << "  ecs:     " << s.ecs << std::endl;
      std::cout << "  shannon: " << s.shannon << std::endl;
      m.set("recommended_gini", s.gini);
      m.set("recommended_ecs", s.ecs);
      m.set("recommended_shannon", s.shannon);
    }

    if (engine.has_test_matrix()) {
      // one ranking pass for all three scores
      ranking_evaluator eval;
      ranking_scores scores = eval.evaluate(engine.get_model(), engine.train_matrix(), test, num_ratings);
      std::cout << "precision@" << num_ratings << ": " << scores.precision << std::endl;
      std::cout << "auc@" << num_ratings << ": " << scores.auc << std::endl;
      std::cout << "map@" << num_ratings << ": " << scores.map << std::endl;
      m.set("precision_at_k", scores.precision);
      m.set("auc_at_k", scores.auc);
      m.set("map_at_k", scores.map);
    }
  } catch (divrank_error & e) {
    logstream(LOG_ERROR) << "divrank_recommend failed: " << e.what() << std::endl;
    return 1;
  }

  /* Report execution metrics */
  metrics_report(m);
  return 0;
}
