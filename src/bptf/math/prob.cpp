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

#include <cmath>
#include <bptf/math/prob.hpp>
#include <bptf/logger/logger.hpp>

namespace bptf {

  vec randn(int size, random::generator& gen) {
    vec ret(size);
    for (int i = 0; i < size; ++i) ret(i) = gen.gaussian();
    return ret;
  }

  mat randn(int rows, int cols, double stdev, random::generator& gen) {
    mat ret(rows, cols);
    for (int i = 0; i < rows; ++i)
      for (int j = 0; j < cols; ++j)
        ret(i, j) = gen.gaussian(0, stdev);
    return ret;
  }

  vec mvnrnd_precision(const vec& mu, const llt_type& chol_Lambda,
                       random::generator& gen) {
    ASSERT_EQ(chol_Lambda.rows(), mu.size());
    vec y = randn(mu.size(), gen);
    // Lambda = L L^T, so U = L^T is the upper factor and U y = z
    chol_Lambda.matrixU().solveInPlace(y);
    return y + mu;
  }

  vec mvnrnd_precision(const vec& mu, const mat& Lambda, random::generator& gen) {
    return mvnrnd_precision(mu, chol(Lambda, "mvnrnd_precision"), gen);
  }

  vec mvnrnd_canonical(const mat& P, const vec& b, random::generator& gen) {
    const llt_type factor = chol(P, "mvnrnd_canonical");
    const vec mean = factor.solve(b);
    return mvnrnd_precision(mean, factor, gen);
  }

  mat wishrnd(const mat& scale, double df, random::generator& gen) {
    const int dim = scale.rows();
    if (df <= dim - 1) {
      logstream(LOG_FATAL) << "Wishart degrees of freedom " << df
                           << " must exceed dimension - 1 = " << dim - 1
                           << std::endl;
    }
    const mat L = chol(scale, "wishrnd").matrixL();
    // Bartlett factor: chi distributed diagonal, normal strictly lower part
    mat A = zeros(dim, dim);
    for (int i = 0; i < dim; ++i) {
      A(i, i) = std::sqrt(gen.chi_squared(df - i));
      for (int j = 0; j < i; ++j) A(i, j) = gen.gaussian();
    }
    const mat LA = L * A;
    mat W = LA * LA.transpose();
    // remove the round off asymmetry
    return 0.5 * (W + W.transpose());
  }

} // end of namespace bptf
