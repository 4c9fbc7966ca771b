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

#ifndef BPTF_MATH_PROB_HPP
#define BPTF_MATH_PROB_HPP

#include <bptf/math/mathlayer.hpp>
#include <bptf/util/random.hpp>

namespace bptf {

  //! Vector of independent standard normal draws
  vec randn(int size, random::generator& gen);

  //! Matrix of independent normal draws with the given standard deviation
  mat randn(int rows, int cols, double stdev, random::generator& gen);

  /**
   * Draws one sample from N(mu, Lambda^-1) where Lambda is a precision
   * matrix. With Lambda = C^T C (C upper triangular) the draw is
   * mu + C^-1 z for standard normal z. A Lambda which is not positive
   * definite is fatal.
   */
  vec mvnrnd_precision(const vec& mu, const mat& Lambda, random::generator& gen);

  //! Same as above with the Cholesky factor of the precision already computed
  vec mvnrnd_precision(const vec& mu, const llt_type& chol_Lambda,
                       random::generator& gen);

  /**
   * Draws from N(P^-1 b, P^-1): the Gaussian given in canonical form by
   * its precision P and linear term b. Uses a single factorization of P
   * for the mean solve and the draw.
   */
  vec mvnrnd_canonical(const mat& P, const vec& b, random::generator& gen);

  /**
   * Draws a matrix from a Wishart distribution with the given scale
   * matrix and degrees of freedom (Bartlett decomposition). The mean of
   * the distribution is df * scale. Requires df > dim - 1.
   */
  mat wishrnd(const mat& scale, double df, random::generator& gen);

} // end of namespace bptf

#endif
