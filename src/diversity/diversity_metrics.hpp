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
 * Diversity statistics of a category histogram: Gini coefficient,
 * effective catalog size, Shannon index, the distribution table and the
 * Lorenz curve. Every statistic is a pure function of the count vector,
 * so the functions are offered on count vectors and, for convenience, on
 * tagged observation sequences (see histogram.hpp).
 *
 * The functions produce data only. Drawing the distribution or the
 * Lorenz curve is left to the caller.
 *
 * A count vector of zeros is accepted and treated as perfectly even:
 * gini 0, effective catalog size 0, Shannon index 0, all percentages 0
 * and the Lorenz curve on the diagonal.
 */

#ifndef DEF_DIVRANK_DIVERSITY_METRICS
#define DEF_DIVRANK_DIVERSITY_METRICS

#include <cmath>
#include <vector>

#include "logger/logger.hpp"
#include "util/errors.hpp"
#include "util/eigen_wrapper.hpp"
#include "diversity/histogram.hpp"

namespace divrank {

    static inline void check_counts(const vec & counts, const char * metric) {
        if (counts.size() == 0) {
            logstream(LOG_ERROR) << metric << ": histogram has no category" << std::endl;
            throw input_error(std::string(metric) + ": empty histogram");
        }
        if (counts.minCoeff() < 0) {
            logstream(LOG_ERROR) << metric << ": histogram holds a negative count " << counts.minCoeff() << std::endl;
            throw input_error(std::string(metric) + ": negative count");
        }
    }

    /**
     * Gini coefficient of a count vector, in [0, 1).
     * With h sorted descending, n categories and S observations:
     *   area = sum_i h_i * i / (S * n),  gini = 1 - 2 * area + 1/n
     * which is the discrete form of one minus twice the area under the
     * Lorenz curve. 0 means an even spread over the categories.
     */
    inline double gini_coefficient(const vec & counts) {
        check_counts(counts, "gini_coefficient");
        double total = counts.sum();
        if (total == 0)
            return 0;
        vec h = sort_descending(counts);
        int n = (int)h.size();
        vec rank = vec::LinSpaced(n, 1, n);
        double area = h.dot(rank) / (total * n);
        return 1 - 2 * area + 1.0 / n;
    }

    /**
     * Effective catalog size: with p the probability mass sorted
     * descending, ecs = 2 * sum_i p_i * i - 1.
     *
     * This is a rank weighted concentration statistic. It is 1 when a
     * single category holds everything and n when n categories are even.
     * It is not the entropy based "effective number of categories" (exp of
     * the Shannon index) nor the inverse Simpson index.
     */
    inline double effective_catalog_size(const vec & counts) {
        check_counts(counts, "effective_catalog_size");
        double total = counts.sum();
        if (total == 0)
            return 0;
        vec pmf = sort_descending(counts / total);
        int n = (int)pmf.size();
        vec rank = vec::LinSpaced(n, 1, n);
        return 2 * pmf.dot(rank) - 1;
    }

    /**
     * Shannon entropy of the histogram, -sum p_i ln p_i. Empty bins add
     * nothing. 0 when one category holds everything, ln n when the n
     * categories are even.
     */
    inline double shannon_index(const vec & counts) {
        check_counts(counts, "shannon_index");
        double total = counts.sum();
        if (total == 0)
            return 0;
        double ent = 0;
        for (int i = 0; i < counts.size(); i++) {
            if (counts[i] > 0) {
                double p = counts[i] / total;
                ent -= p * std::log(p);
            }
        }
        return ent;
    }

    /** Shannon entropy in the given logarithm base. */
    inline double shannon_index(const vec & counts, double base) {
        if (!(base > 0) || base == 1) {
            logstream(LOG_ERROR) << "shannon_index: invalid logarithm base " << base << std::endl;
            throw input_error("shannon_index: base must be positive and different from 1");
        }
        return shannon_index(counts) / std::log(base);
    }

    template <typename LabelType>
    struct distribution_row {
        LabelType category;
        size_t count;
        double percentage;  // share of all observations, in [0, 1]
    };

    /**
     * Rows sorted by descending count; percentages sum to 1.
     */
    template <typename LabelType>
    struct distribution_table {
        std::vector<distribution_row<LabelType> > rows;
        size_t total;

        distribution_table() : total(0) {}
        size_t size() const { return rows.size(); }
    };

    template <typename LabelType>
    distribution_table<LabelType> get_distribution(const histogram<LabelType> & hist) {
        distribution_table<LabelType> table;
        table.total = hist.total;
        table.rows.resize(hist.bins.size());
        for (size_t i = 0; i < hist.bins.size(); i++) {
            table.rows[i].category = hist.bins[i].label;
            table.rows[i].count = hist.bins[i].count;
            table.rows[i].percentage = hist.total > 0 ? (double)hist.bins[i].count / (double)hist.total : 0;
        }
        return table;
    }

    /**
     * Polyline of the Lorenz curve: x is a uniform grid over [0, 1], y the
     * cumulative share of observations held by the x poorest categories.
     * Both have n + 1 points and start at 0.
     */
    struct lorenz_curve {
        vec x;
        vec y;

        /** Area below the curve, by the trapezoid rule. */
        double area() const {
            double a = 0;
            for (int i = 1; i < x.size(); i++)
                a += (x[i] - x[i-1]) * (y[i] + y[i-1]) / 2;
            return a;
        }

        /** One minus twice the area; matches gini_coefficient() of the same counts. */
        double gini() const {
            return 1 - 2 * area();
        }
    };

    inline lorenz_curve get_lorenz_curve(const vec & counts) {
        check_counts(counts, "lorenz_curve");
        lorenz_curve curve;
        int n = (int)counts.size();
        curve.x = linspace(0.0, 1.0, n + 1);
        double total = counts.sum();
        if (total == 0) {
            curve.y = curve.x;
            return curve;
        }
        vec scaled_prefix_sum = cumsum(sort_ascending(counts)) / total;
        curve.y.resize(n + 1);
        curve.y[0] = 0;
        curve.y.tail(n) = scaled_prefix_sum;
        return curve;
    }

    /**
     * The three scalar statistics of one histogram.
     */
    struct diversity_summary {
        size_t categories;
        size_t observations;
        double gini;
        double ecs;
        double shannon;
    };

    template <typename LabelType>
    diversity_summary summarize(const histogram<LabelType> & hist) {
        vec counts = hist.counts();
        diversity_summary s;
        s.categories = hist.size();
        s.observations = hist.total;
        s.gini = gini_coefficient(counts);
        s.ecs = effective_catalog_size(counts);
        s.shannon = shannon_index(counts);
        return s;
    }

    /* Entry points on tagged observation sequences. Each builds the
     * histogram and throws input_error on an empty sequence. */

    template <typename LabelType>
    double gini_coefficient(const std::vector<category_item<LabelType> > & items) {
        return gini_coefficient(build_histogram(items).counts());
    }

    template <typename LabelType>
    double effective_catalog_size(const std::vector<category_item<LabelType> > & items) {
        return effective_catalog_size(build_histogram(items).counts());
    }

    template <typename LabelType>
    double shannon_index(const std::vector<category_item<LabelType> > & items) {
        return shannon_index(build_histogram(items).counts());
    }

    template <typename LabelType>
    double shannon_index(const std::vector<category_item<LabelType> > & items, double base) {
        return shannon_index(build_histogram(items).counts(), base);
    }

    template <typename LabelType>
    distribution_table<LabelType> get_distribution(const std::vector<category_item<LabelType> > & items) {
        return get_distribution(build_histogram(items));
    }

    template <typename LabelType>
    lorenz_curve get_lorenz_curve(const std::vector<category_item<LabelType> > & items) {
        return get_lorenz_curve(build_histogram(items).counts());
    }

}

#endif
