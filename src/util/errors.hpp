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
 * Exception types thrown by the divrank library. Every throw site writes
 * a LOG_ERROR line first, so the exception message is a short summary.
 */

#ifndef DEF_DIVRANK_ERRORS
#define DEF_DIVRANK_ERRORS

#include <stdexcept>
#include <string>

namespace divrank {

    /** Base class of all divrank exceptions. */
    class divrank_error : public std::runtime_error {
    public:
        explicit divrank_error(const std::string & what) : std::runtime_error(what) {}
    };

    /**
     * Bad caller input: empty category sequences, histograms without
     * observations, unequal embedding lengths, unknown metadata columns.
     */
    class input_error : public divrank_error {
    public:
        explicit input_error(const std::string & what) : divrank_error(what) {}
    };

    /**
     * Shape mismatch: indices out of range, matrices whose dimensions
     * disagree with the factor model or the token maps.
     */
    class dimension_error : public divrank_error {
    public:
        explicit dimension_error(const std::string & what) : divrank_error(what) {}
    };

    /** Raised by the logger after a LOG_FATAL line has been flushed. */
    class fatal_error : public divrank_error {
    public:
        explicit fatal_error(const std::string & what) : divrank_error(what) {}
    };

}

#endif
