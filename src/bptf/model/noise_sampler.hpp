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

#ifndef BPTF_MODEL_NOISE_SAMPLER_HPP
#define BPTF_MODEL_NOISE_SAMPLER_HPP

#include <bptf/math/dense_tensor.hpp>
#include <bptf/model/observed_tensor.hpp>
#include <bptf/util/random.hpp>

namespace bptf {

  //! Shape and rate of a Gamma distribution (mean shape / rate)
  struct gamma_posterior {
    double shape;
    double rate;
  };

  /**
   * Gamma conditional posterior of the noise precision tau:
   *   shape = 1e-6 + 0.5 * (number of observed entries)
   *   rate  = 1e-6 + 0.5 * sum over observed entries of (y - y_hat)^2
   */
  gamma_posterior noise_posterior(const observed_tensor& observed,
                                  const dense_tensor& tensor_hat);

  //! Draws tau ~ Gamma(shape, scale = 1 / rate)
  double sample_noise_precision(const observed_tensor& observed,
                                const dense_tensor& tensor_hat,
                                random::generator& gen);

} // end of namespace bptf

#endif
