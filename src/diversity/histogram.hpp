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
 * Category histograms. The input is a sequence of observations, each
 * either a single category label or a list of labels (a multi-label
 * item). The caller tags every observation explicitly, see
 * scalar_item() and labels_item(); list observations are flattened into
 * the label stream before counting.
 *
 * The histogram is ordered by descending count. Labels with equal
 * counts keep the order in which they were first seen.
 */

#ifndef DEF_DIVRANK_HISTOGRAM
#define DEF_DIVRANK_HISTOGRAM

#include <map>
#include <vector>
#include <string>
#include <algorithm>

#include "logger/logger.hpp"
#include "util/errors.hpp"
#include "util/eigen_wrapper.hpp"

namespace divrank {

    template <typename LabelType>
    struct category_item {
        enum kind_t {
            SCALAR = 0, LABELS = 1
        };
        kind_t kind;
        LabelType label;                  // valid for SCALAR
        std::vector<LabelType> labels;    // valid for LABELS

        category_item() : kind(SCALAR), label() {}
    };

    template <typename LabelType>
    category_item<LabelType> scalar_item(const LabelType & label) {
        category_item<LabelType> item;
        item.kind = category_item<LabelType>::SCALAR;
        item.label = label;
        return item;
    }

    template <typename LabelType>
    category_item<LabelType> labels_item(const std::vector<LabelType> & labels) {
        category_item<LabelType> item;
        item.kind = category_item<LabelType>::LABELS;
        item.labels = labels;
        return item;
    }

    /** Tags every label of a flat sequence as a scalar observation. */
    template <typename LabelType>
    std::vector<category_item<LabelType> > scalar_items(const std::vector<LabelType> & labels) {
        std::vector<category_item<LabelType> > items;
        items.reserve(labels.size());
        for (size_t i = 0; i < labels.size(); i++)
            items.push_back(scalar_item(labels[i]));
        return items;
    }

    template <typename LabelType>
    struct labelcount_tt {
        LabelType label;
        size_t count;
        labelcount_tt(LabelType l, size_t c) : label(l), count(c) {}
        labelcount_tt() : count(0) {}
    };

    template <typename LabelType>
    bool label_count_greater(const labelcount_tt<LabelType> &a, const labelcount_tt<LabelType> &b) {
        return a.count > b.count;
    }

    template <typename LabelType>
    struct histogram {
        typedef labelcount_tt<LabelType> labelcount_t;

        /// Bins by descending count, ties in first-seen order.
        std::vector<labelcount_t> bins;
        /// Number of flattened observations, equal to the sum of the counts.
        size_t total;

        histogram() : total(0) {}

        size_t size() const { return bins.size(); }

        /** Counts in bin order, as doubles for the metric formulas. */
        vec counts() const {
            vec ret(bins.size());
            for (size_t i = 0; i < bins.size(); i++)
                ret[i] = (double)bins[i].count;
            return ret;
        }
    };

    template <typename LabelType>
    void add_observation(histogram<LabelType> & hist, std::map<LabelType, size_t> & position, const LabelType & label) {
        typename std::map<LabelType, size_t>::iterator it = position.find(label);
        if (it == position.end()) {
            position[label] = hist.bins.size();
            hist.bins.push_back(labelcount_tt<LabelType>(label, 1));
        } else {
            hist.bins[it->second].count++;
        }
        hist.total++;
    }

    /**
     * Counts the labels of a tagged observation sequence.
     * Throws input_error when the sequence is empty or when it only holds
     * empty label lists, since there is nothing to count.
     */
    template <typename LabelType>
    histogram<LabelType> build_histogram(const std::vector<category_item<LabelType> > & items) {
        if (items.empty()) {
            logstream(LOG_ERROR) << "Cannot build a histogram of an empty category sequence" << std::endl;
            throw input_error("empty category sequence");
        }

        histogram<LabelType> hist;
        std::map<LabelType, size_t> position;
        for (size_t i = 0; i < items.size(); i++) {
            const category_item<LabelType> & item = items[i];
            if (item.kind == category_item<LabelType>::SCALAR) {
                add_observation(hist, position, item.label);
            } else {
                for (size_t j = 0; j < item.labels.size(); j++)
                    add_observation(hist, position, item.labels[j]);
            }
        }
        if (hist.total == 0) {
            logstream(LOG_ERROR) << "Category sequence of " << items.size() << " items holds no label" << std::endl;
            throw input_error("category sequence without observations");
        }

        std::stable_sort(hist.bins.begin(), hist.bins.end(), label_count_greater<LabelType>);
        return hist;
    }

    template <typename LabelType>
    histogram<LabelType> build_histogram(const std::vector<LabelType> & labels) {
        return build_histogram(scalar_items(labels));
    }

}

#endif
