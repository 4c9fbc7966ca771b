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

#ifndef BPTF_MATH_MATHLAYER_HPP
#define BPTF_MATH_MATHLAYER_HPP

#include <Eigen/Dense>
#include <Eigen/Cholesky>

namespace bptf {

  typedef Eigen::MatrixXd mat;
  typedef Eigen::VectorXd vec;
  typedef Eigen::LLT<mat> llt_type;

  inline mat eye(int size){
    return mat::Identity(size, size);
  }
  inline vec zeros(int size){
    return vec::Zero(size);
  }
  inline mat zeros(int rows, int cols){
    return mat::Zero(rows, cols);
  }
  inline mat outer_product(const vec &a, const vec &b){
    return a*b.transpose();
  }

  /**
   * Cholesky factorization of a symmetric positive definite matrix.
   * A failed factorization is fatal: the message names the caller
   * supplied context.
   */
  llt_type chol(const mat& A, const char* context);

  //! Inverse of a symmetric positive definite matrix through its Cholesky factor
  mat inv_sympd(const mat& A, const char* context);

} // end of namespace bptf

#endif
