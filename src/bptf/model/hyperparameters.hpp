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

#ifndef BPTF_MODEL_HYPERPARAMETERS_HPP
#define BPTF_MODEL_HYPERPARAMETERS_HPP

#include <bptf/math/mathlayer.hpp>
#include <bptf/util/random.hpp>

namespace bptf {

  /**
   * The Gaussian prior handed to the row samplers of one factor for one
   * sweep: mean mu and precision Lambda.
   */
  struct gaussian_hyper {
    vec mu;
    mat Lambda;
  };

  /**
   * Draws (mu, Lambda) for an exchangeable factor F (one entity per row)
   * from its Normal-Wishart posterior with prior pseudo-count beta0 and
   * identity prior inverse scale:
   *
   *   W^-1   = I + (F - Fbar)^T (F - Fbar) + n beta0 / (n + beta0) Fbar Fbar^T
   *   Lambda ~ Wishart(W, n + R)
   *   mu     ~ N(n / (n + beta0) Fbar, [(n + beta0) Lambda]^-1)
   */
  gaussian_hyper sample_normal_wishart(const mat& F, double beta0,
                                       random::generator& gen);

  /**
   * Draws (mu, Lambda) for the temporal factor X under its random walk
   * prior. The scale comes from the first differences dX = X[1:] - X[:-1]
   * and the initial row:
   *
   *   W^-1   = I + dX^T dX + beta0 / (beta0 + 1) X[0] X[0]^T
   *   Lambda ~ Wishart(W, d3 + R)
   *   mu     ~ N(X[0] / (beta0 + 1), [(beta0 + 1) Lambda]^-1)
   */
  gaussian_hyper sample_random_walk_hyper(const mat& X, double beta0,
                                          random::generator& gen);

} // end of namespace bptf

#endif
