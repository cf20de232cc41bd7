/**
 * Copyright (c) 2009 Carnegie Mellon University.
 *     All rights reserved.
 *
 *  Licensed under the Apache License, Version 2.0 (the "License");
 *  you may not use this file except in compliance with the License.
 *  You may obtain a copy of the License at
 *
 *      http://www.apache.org/licenses/LICENSE-2.0
 *
 *  Unless required by applicable law or agreed to in writing,
 *  software distributed under the License is distributed on an "AS
 *  IS" BASIS, WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either
 *  express or implied.  See the License for the specific language
 *  governing permissions and limitations under the License.
 *
 */

#ifndef DIVRANK_EIGEN_WRAPPER
#define DIVRANK_EIGEN_WRAPPER

/**
 * SET OF WRAPPER FUNCTIONS FOR EIGEN
 *
 * Short typedefs for the dense and sparse types used across divrank,
 * plus the ranking helpers shared by the retrieval code.
 */

#include <algorithm>
#include <cstdio>
#include <functional>
#include <utility>
#include <vector>

#define EIGEN_DONT_PARALLELIZE //eigen parallel for loop interfers with ours.
#include "Eigen/Dense"
#include "Eigen/Sparse"

namespace divrank {

typedef Eigen::MatrixXd mat;
typedef Eigen::VectorXd vec;
typedef Eigen::VectorXi ivec;
typedef Eigen::SparseVector<double> sparse_vec;
/// Interaction matrices: rows are users, columns are items.
typedef Eigen::SparseMatrix<double, Eigen::RowMajor> sparse_mat;
typedef Eigen::SparseMatrix<double, Eigen::ColMajor> sparse_col_mat;
typedef Eigen::Triplet<double> triplet;

inline void debug_print_vec(const char * name, const vec& _vec, int len){
  printf("%s ) ", name);
  for (int i=0; i< len && i < _vec.size(); i++)
    if (_vec[i] == 0)
      printf("      0    ");
    else printf("%12.4g    ", _vec[i]);
  printf("\n");
}

inline vec zeros(int size){
  return vec::Zero(size);
}
inline mat zeros(int rows, int cols){
  return mat::Zero(rows, cols);
}
inline vec ones(int size){
  return vec::Ones(size);
}
inline double dot_prod(const vec &v1, const vec & v2){
  return v1.dot(v2);
}
inline double sum(const vec & a){
  return a.sum();
}
inline vec cumsum(const vec& v){
  vec ret = v;
  for (int i=1; i< v.size(); i++)
    ret[i] += ret[i-1];
  return ret;
}
inline vec linspace(double from, double to, int num){
  if (num == 1)
    return vec::Constant(1, from);
  return vec::LinSpaced(num, from, to);
}
inline vec sort_descending(const vec & a){
  vec ret = a;
  std::sort(ret.data(), ret.data() + ret.size(), std::greater<double>());
  return ret;
}
inline vec sort_ascending(const vec & a){
  vec ret = a;
  std::sort(ret.data(), ret.data() + ret.size());
  return ret;
}

inline bool pair_compare_desc(const std::pair<double,int> &x1, const std::pair<double,int> & x2) {
  return x1.first > x2.first;
}

/**
 * Positions of the K largest entries of a, largest first. Equal values
 * keep their original relative order.
 */
inline ivec reverse_sort_index(const vec& a, int K){
  std::vector<std::pair<double,int> > D;
  D.reserve(a.size());
  for (int i=0;i<a.size();i++)
    D.push_back(std::make_pair(a.coeff(i),i));
  std::stable_sort(D.begin(),D.end(), pair_compare_desc);
  int n = std::max(0, std::min(K, (int)a.size()));
  ivec ret(n);
  for (int i=0;i<n;i++)
    ret[i]=D[i].second;
  return ret;
}

/**
 * As reverse_sort_index(), and writes the matching values of a to out.
 */
inline ivec reverse_sort_index2(const vec&a, vec & out, int K){
  ivec ret = reverse_sort_index(a, K);
  out.resize(ret.size());
  for (int i=0; i< ret.size(); i++)
    out[i] = a[ret[i]];
  return ret;
}

}

#endif
