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
 * In-memory item metadata: one row per item token, named string columns
 * (categories) and named vector columns (content embeddings). Cells that
 * were never set hold an empty string or an empty vector.
 */

#ifndef DEF_DIVRANK_ITEM_TABLE
#define DEF_DIVRANK_ITEM_TABLE

#include <map>
#include <string>
#include <vector>

#include "logger/logger.hpp"
#include "util/errors.hpp"
#include "util/eigen_wrapper.hpp"

namespace divrank {

    class item_table {

        std::vector<std::string> tokens;
        std::map<std::string, size_t> row_of;
        std::map<std::string, std::vector<std::string> > category_columns;
        std::map<std::string, std::vector<vec> > vector_columns;

    public:

        size_t size() const { return tokens.size(); }

        /** Returns the row of token, adding it when new. */
        size_t add_item(const std::string & token) {
            std::map<std::string, size_t>::iterator it = row_of.find(token);
            if (it != row_of.end())
                return it->second;
            size_t row = tokens.size();
            tokens.push_back(token);
            row_of[token] = row;
            for (std::map<std::string, std::vector<std::string> >::iterator c = category_columns.begin(); c != category_columns.end(); ++c)
                c->second.resize(tokens.size());
            for (std::map<std::string, std::vector<vec> >::iterator c = vector_columns.begin(); c != vector_columns.end(); ++c)
                c->second.resize(tokens.size());
            return row;
        }

        bool find(const std::string & token, size_t & row) const {
            std::map<std::string, size_t>::const_iterator it = row_of.find(token);
            if (it == row_of.end())
                return false;
            row = it->second;
            return true;
        }

        const std::string & token(size_t row) const {
            check_row(row);
            return tokens[row];
        }

        void set_category(const std::string & column, const std::string & token, const std::string & value) {
            size_t row = add_item(token);
            std::vector<std::string> & col = category_columns[column];
            col.resize(tokens.size());
            col[row] = value;
        }

        void set_vector(const std::string & column, const std::string & token, const vec & value) {
            size_t row = add_item(token);
            std::vector<vec> & col = vector_columns[column];
            col.resize(tokens.size());
            col[row] = value;
        }

        bool has_category_column(const std::string & column) const {
            return category_columns.count(column) > 0;
        }

        bool has_vector_column(const std::string & column) const {
            return vector_columns.count(column) > 0;
        }

        const std::string & category(const std::string & column, size_t row) const {
            std::map<std::string, std::vector<std::string> >::const_iterator it = category_columns.find(column);
            if (it == category_columns.end()) {
                logstream(LOG_ERROR) << "Item metadata has no category column '" << column << "'" << std::endl;
                throw input_error("item_table: unknown category column " + column);
            }
            check_row(row);
            return it->second[row];
        }

        const vec & vector(const std::string & column, size_t row) const {
            std::map<std::string, std::vector<vec> >::const_iterator it = vector_columns.find(column);
            if (it == vector_columns.end()) {
                logstream(LOG_ERROR) << "Item metadata has no vector column '" << column << "'" << std::endl;
                throw input_error("item_table: unknown vector column " + column);
            }
            check_row(row);
            return it->second[row];
        }

    private:
        void check_row(size_t row) const {
            if (row >= tokens.size()) {
                logstream(LOG_ERROR) << "Item metadata row " << row << " out of range [0, " << tokens.size() << ")" << std::endl;
                throw dimension_error("item_table: row out of range");
            }
        }
    };

}

#endif
