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

#ifndef BPTF_MODEL_FACTOR_SAMPLERS_HPP
#define BPTF_MODEL_FACTOR_SAMPLERS_HPP

#include <cstddef>
#include <bptf/math/mathlayer.hpp>
#include <bptf/model/hyperparameters.hpp>
#include <bptf/parallel/thread_pool.hpp>
#include <bptf/util/random.hpp>

namespace bptf {

  /**
   * Conditional posterior of one factor row (or time step) given the
   * other two factors. With design matrix D (one row per column of the
   * unfolding, the Khatri-Rao product of the other two factors), noise
   * weighted mask row w and noise weighted value row y:
   *
   *   precision = D^T diag(w) D
   *   linear    = D^T y
   *
   * The prior terms are added by the caller.
   */
  void row_contribution(const mat& design,
                        const mat& weighted_mask, const mat& weighted_values,
                        int row, mat& precision, vec& linear);

  /**
   * Resamples every row of an exchangeable factor (U or V) from its
   * Gaussian conditional posterior
   *
   *   N(P_i^-1 (l_i + Lambda mu), P_i^-1),  P_i = contribution_i + Lambda
   *
   * Rows are split into contiguous ranges, one per pool worker. Row i
   * draws from a private generator seeded with integer_mix(sweep_seed + i)
   * so the result does not depend on the pool size. All rows read the same
   * design and hyperparameters and each range writes only its own rows.
   * A failure in any range is rethrown here after every range finished.
   */
  void sample_entity_factor(mat& factor, const mat& design,
                            const mat& weighted_mask,
                            const mat& weighted_values,
                            const gaussian_hyper& hyper,
                            size_t sweep_seed, thread_pool& pool);

  /**
   * Resamples the temporal factor X under its random walk prior, one time
   * step after the other in increasing t. Each step reads the current
   * values of its neighbours, so X[t-1] has already been redrawn in this
   * sweep while X[t+1] still holds the previous sweep's value.
   *
   *   t = 0:        N((X[1] + mu) / 2, (P_0 + 2 Lambda)^-1)
   *   0 < t < last: precision P_t + 2 Lambda,
   *                 linear l_t + Lambda (X[t-1] + X[t+1])
   *   t = last:     precision P_t + Lambda, linear l_t + Lambda X[t-1]
   *
   * Requires at least two time steps.
   */
  void sample_temporal_factor(mat& X, const mat& design,
                              const mat& weighted_mask,
                              const mat& weighted_values,
                              const gaussian_hyper& hyper,
                              random::generator& gen);

} // end of namespace bptf

#endif
