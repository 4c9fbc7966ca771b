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

#include <bptf/math/mathlayer.hpp>
#include <bptf/logger/logger.hpp>

namespace bptf {

  llt_type chol(const mat& A, const char* context) {
    // LLT only rejects pivots <= 0, which lets NaN through
    if (!A.allFinite()) {
      logstream(LOG_FATAL) << "Cholesky factorization failed in " << context
                           << ": the " << A.rows() << "x" << A.cols()
                           << " matrix has non-finite entries" << std::endl;
    }
    llt_type factor(A);
    if (factor.info() != Eigen::Success || !factor.matrixLLT().allFinite()) {
      logstream(LOG_FATAL) << "Cholesky factorization failed in " << context
                           << ": the " << A.rows() << "x" << A.cols()
                           << " matrix is not positive definite" << std::endl;
    }
    return factor;
  }

  mat inv_sympd(const mat& A, const char* context) {
    return chol(A, context).solve(eye(A.rows()));
  }

} // end of namespace bptf
