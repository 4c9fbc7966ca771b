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
 * For more about this software visit:
 *
 *      http://www.graphlab.ml.cmu.edu
 *
 */

#include <sstream>
#include <algorithm>
#include <bptf/math/dense_tensor.hpp>
#include <bptf/logger/assertions.hpp>

namespace bptf {

  dense_tensor::dense_tensor() {
    m_dims[0] = m_dims[1] = m_dims[2] = 0;
  }

  dense_tensor::dense_tensor(size_t d1, size_t d2, size_t d3, double fill_value)
    : m_data(d1 * d2 * d3, fill_value) {
    m_dims[0] = d1;
    m_dims[1] = d2;
    m_dims[2] = d3;
  }

  bool dense_tensor::same_shape(const dense_tensor& other) const {
    return m_dims[0] == other.m_dims[0] &&
      m_dims[1] == other.m_dims[1] &&
      m_dims[2] == other.m_dims[2];
  }

  void dense_tensor::fill(double value) {
    std::fill(m_data.begin(), m_data.end(), value);
  }

  dense_tensor& dense_tensor::operator+=(const dense_tensor& other) {
    ASSERT_TRUE(same_shape(other));
    for (size_t k = 0; k < m_data.size(); ++k) m_data[k] += other.m_data[k];
    return *this;
  }

  dense_tensor& dense_tensor::operator*=(double scale) {
    for (size_t k = 0; k < m_data.size(); ++k) m_data[k] *= scale;
    return *this;
  }

  mat dense_tensor::unfold(size_t mode) const {
    ASSERT_LT(mode, 3);
    const size_t d1 = m_dims[0], d2 = m_dims[1], d3 = m_dims[2];
    mat ret(m_dims[mode], size() / std::max<size_t>(m_dims[mode], 1));
    for (size_t t = 0; t < d3; ++t) {
      for (size_t j = 0; j < d2; ++j) {
        for (size_t i = 0; i < d1; ++i) {
          const double value = (*this)(i, j, t);
          switch(mode) {
          case 0: ret(i, j + d2 * t) = value; break;
          case 1: ret(j, i + d1 * t) = value; break;
          default: ret(t, i + d1 * j) = value; break;
          }
        }
      }
    }
    return ret;
  }

  std::string dense_tensor::shape_string() const {
    std::stringstream strm;
    strm << m_dims[0] << " x " << m_dims[1] << " x " << m_dims[2];
    return strm.str();
  }


  mat khatri_rao(const mat& a, const mat& b) {
    ASSERT_EQ(a.cols(), b.cols());
    mat ret(a.rows() * b.rows(), a.cols());
    for (int ia = 0; ia < a.rows(); ++ia) {
      for (int ib = 0; ib < b.rows(); ++ib) {
        ret.row(ia * b.rows() + ib) = a.row(ia).cwiseProduct(b.row(ib));
      }
    }
    return ret;
  }


  void cp_reconstruct(const mat& U, const mat& V, const mat& X,
                      dense_tensor& out) {
    ASSERT_EQ(U.cols(), V.cols());
    ASSERT_EQ(U.cols(), X.cols());
    ASSERT_EQ(out.dim(0), size_t(U.rows()));
    ASSERT_EQ(out.dim(1), size_t(V.rows()));
    ASSERT_EQ(out.dim(2), size_t(X.rows()));
    for (int t = 0; t < X.rows(); ++t) {
      for (int j = 0; j < V.rows(); ++j) {
        // one mode-0 fiber: U * (V[j] .* X[t])^T
        const vec weights = V.row(j).cwiseProduct(X.row(t)).transpose();
        const vec fiber = U * weights;
        for (int i = 0; i < U.rows(); ++i) out(i, j, t) = fiber(i);
      }
    }
  }

  dense_tensor cp_reconstruct(const mat& U, const mat& V, const mat& X) {
    dense_tensor out(U.rows(), V.rows(), X.rows());
    cp_reconstruct(U, V, X, out);
    return out;
  }

} // end of namespace bptf
