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
 * Diversity statistics on known histograms: Gini, effective catalog
 * size, Shannon index, distribution table and Lorenz curve.
 */

#include <cmath>
#include <string>
#include <vector>

#include "diversity/diversity_metrics.hpp"
#include "logger/logger.hpp"

using namespace divrank;

static bool close_to(double a, double b, double tol = 1e-9) {
    return std::fabs(a - b) <= tol;
}

static vec make_counts(int n, const double * values) {
    vec v(n);
    for (int i = 0; i < n; i++) v[i] = values[i];
    return v;
}

void test_skewed_items() {
    int data[] = {1, 1, 2, 3, 3, 3};
    std::vector<category_item<int> > items = scalar_items(std::vector<int>(data, data + 6));

    // area = (3*1 + 2*2 + 1*3) / (6*3)
    double area = 10.0 / 18.0;
    double gini = gini_coefficient(items);
    assert(close_to(gini, 1 - 2 * area + 1.0 / 3));
    assert(close_to(gini, 2.0 / 9));

    lorenz_curve curve = get_lorenz_curve(items);
    assert(curve.x.size() == 4 && curve.y.size() == 4);
    assert(close_to(curve.y[0], 0) && close_to(curve.y[1], 1.0 / 6) && close_to(curve.y[2], 0.5) && close_to(curve.y[3], 1));
    assert(close_to(curve.x[1], 1.0 / 3));
    assert(close_to(curve.gini(), gini));

    // p = [1/2, 1/3, 1/6]: 2 * (1/2 + 2/3 + 3/6) - 1
    assert(close_to(effective_catalog_size(items), 7.0 / 3));
}

void test_uniform_items() {
    int data[] = {1, 2, 3, 4};
    std::vector<category_item<int> > items = scalar_items(std::vector<int>(data, data + 4));
    assert(close_to(gini_coefficient(items), 0));
    assert(close_to(shannon_index(items), std::log(4.0)));
    assert(close_to(shannon_index(items, 2.0), 2));
    assert(close_to(effective_catalog_size(items), 4));
}

void test_equal_counts() {
    for (int n = 1; n <= 7; n++) {
        vec counts = vec::Constant(n, 5);
        assert(close_to(gini_coefficient(counts), 0));
        assert(close_to(shannon_index(counts), std::log((double)n)));
        assert(close_to(effective_catalog_size(counts), n));
        assert(close_to(get_lorenz_curve(counts).area(), 0.5));
    }
}

void test_single_category() {
    vec counts = vec::Constant(1, 9);
    assert(close_to(gini_coefficient(counts), 0));
    assert(close_to(effective_catalog_size(counts), 1));
    assert(close_to(shannon_index(counts), 0));
}

void test_distribution_table() {
    const char * data[] = {"rock", "jazz", "rock", "pop", "rock", "jazz", "folk"};
    std::vector<category_item<std::string> > items = scalar_items(std::vector<std::string>(data, data + 7));
    distribution_table<std::string> table = get_distribution(items);
    assert(table.size() == 4);
    assert(table.total == 7);
    assert(table.rows[0].category == "rock" && table.rows[0].count == 3);
    assert(table.rows[1].category == "jazz" && table.rows[1].count == 2);
    assert(table.rows[2].category == "pop");
    assert(table.rows[3].category == "folk");
    double sum = 0;
    for (size_t i = 0; i < table.size(); i++) sum += table.rows[i].percentage;
    assert(close_to(sum, 1.0));
    assert(close_to(table.rows[0].percentage, 3.0 / 7));
}

/* Moving one observation from a smaller to a larger category never
 * lowers the Gini coefficient. */
void test_concentrating_transfers() {
    double start[] = {4, 4, 4, 4, 4};
    vec counts = make_counts(5, start);
    double previous = gini_coefficient(counts);
    while (counts[4] > 0) {
        counts[4] -= 1;
        counts[0] += 1;
        double g = gini_coefficient(counts);
        assert(g >= previous - 1e-12);
        assert(close_to(g, get_lorenz_curve(counts).gini()));
        previous = g;
    }
    double a[] = {5, 3, 2}, b[] = {6, 2, 2};
    assert(close_to(gini_coefficient(make_counts(3, a)), 0.2));
    assert(gini_coefficient(make_counts(3, b)) > 0.2);
}

void test_zero_counts() {
    vec counts = zeros(3);
    assert(gini_coefficient(counts) == 0);
    assert(effective_catalog_size(counts) == 0);
    assert(shannon_index(counts) == 0);
    lorenz_curve curve = get_lorenz_curve(counts);
    for (int i = 0; i < curve.x.size(); i++)
        assert(curve.y[i] == curve.x[i]);

    histogram<int> hist;
    hist.bins.push_back(labelcount_tt<int>(7, 0));
    distribution_table<int> table = get_distribution(hist);
    assert(table.rows[0].percentage == 0);
}

void test_invalid_input() {
    bool thrown = false;
    try { gini_coefficient(vec()); } catch (input_error &) { thrown = true; }
    assert(thrown);

    thrown = false;
    double negative[] = {3, -1};
    try { shannon_index(make_counts(2, negative)); } catch (input_error &) { thrown = true; }
    assert(thrown);

    thrown = false;
    try { shannon_index(vec::Constant(2, 1), 1.0); } catch (input_error &) { thrown = true; }
    assert(thrown);

    thrown = false;
    try { get_lorenz_curve(std::vector<category_item<int> >()); } catch (input_error &) { thrown = true; }
    assert(thrown);
}

void test_summary() {
    int data[] = {1, 1, 2, 3, 3, 3};
    diversity_summary s = summarize(build_histogram(std::vector<int>(data, data + 6)));
    assert(s.categories == 3);
    assert(s.observations == 6);
    assert(close_to(s.gini, 2.0 / 9));
    assert(close_to(s.ecs, 7.0 / 3));
    double expected = -(0.5 * std::log(0.5) + (1.0 / 3) * std::log(1.0 / 3) + (1.0 / 6) * std::log(1.0 / 6));
    assert(close_to(s.shannon, expected));
}

int main(int argc, const char ** argv) {
    test_skewed_items();
    test_uniform_items();
    test_equal_counts();
    test_single_category();
    test_distribution_table();
    test_concentrating_transfers();
    test_zero_counts();
    test_invalid_input();
    test_summary();
    logstream(LOG_INFO) << "Diversity metric tests passed." << std::endl;
    return 0;
}
