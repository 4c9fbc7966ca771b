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

#ifndef BPTF_MATH_DENSE_TENSOR_HPP
#define BPTF_MATH_DENSE_TENSOR_HPP

#include <string>
#include <vector>
#include <bptf/math/mathlayer.hpp>

namespace bptf {

  /**
   * \ingroup math
   * A dense 3-way tensor of doubles with shape (d1, d2, d3).
   *
   * Storage is column major: entry (i, j, t) lives at linear index
   * i + d1 * (j + d2 * t). Linear indices are used to address held-out
   * positions.
   */
  class dense_tensor {
  public:
    dense_tensor();

    dense_tensor(size_t d1, size_t d2, size_t d3, double fill_value = 0);

    //! Length of mode 0, 1 or 2
    size_t dim(size_t mode) const { return m_dims[mode]; }

    //! Total number of entries
    size_t size() const { return m_data.size(); }

    bool empty() const { return m_data.empty(); }

    inline size_t linear_index(size_t i, size_t j, size_t t) const {
      return i + m_dims[0] * (j + m_dims[1] * t);
    }

    inline double& operator()(size_t i, size_t j, size_t t) {
      return m_data[linear_index(i, j, t)];
    }
    inline const double& operator()(size_t i, size_t j, size_t t) const {
      return m_data[linear_index(i, j, t)];
    }
    inline double& operator[](size_t idx) { return m_data[idx]; }
    inline const double& operator[](size_t idx) const { return m_data[idx]; }

    bool same_shape(const dense_tensor& other) const;

    void fill(double value);

    dense_tensor& operator+=(const dense_tensor& other);
    dense_tensor& operator*=(double scale);

    /**
     * Unfolds the tensor along a mode into a matrix with dim(mode) rows.
     * Columns follow the remaining two modes with the lower mode varying
     * fastest:
     *   mode 0: column j + d2 * t
     *   mode 1: column i + d1 * t
     *   mode 2: column i + d1 * j
     */
    mat unfold(size_t mode) const;

    //! "d1 x d2 x d3"
    std::string shape_string() const;

  private:
    size_t m_dims[3];
    std::vector<double> m_data;
  };


  /**
   * Khatri-Rao product: the column-wise Kronecker product of two matrices
   * with the same number of columns. Row ia * b.rows() + ib of the result
   * is the element-wise product of a.row(ia) and b.row(ib).
   */
  mat khatri_rao(const mat& a, const mat& b);

  /**
   * Builds the CP reconstruction
   *   tensor_hat(i, j, t) = sum_s U(i, s) V(j, s) X(t, s)
   */
  dense_tensor cp_reconstruct(const mat& U, const mat& V, const mat& X);

  //! Same as above, writing into an existing tensor of the right shape
  void cp_reconstruct(const mat& U, const mat& V, const mat& X,
                      dense_tensor& out);

} // end of namespace bptf

#endif
