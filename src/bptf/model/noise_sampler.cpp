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

#include <bptf/model/noise_sampler.hpp>
#include <bptf/logger/assertions.hpp>

namespace bptf {

  static const double NOISE_PRIOR_SHAPE = 1e-6;
  static const double NOISE_PRIOR_RATE = 1e-6;

  gamma_posterior noise_posterior(const observed_tensor& observed,
                                  const dense_tensor& tensor_hat) {
    ASSERT_TRUE(observed.values.same_shape(tensor_hat));
    double sqerr = 0;
    for (size_t k = 0; k < tensor_hat.size(); ++k) {
      if (observed.mask[k] != 0) {
        const double residual = observed.values[k] - tensor_hat[k];
        sqerr += residual * residual;
      }
    }
    gamma_posterior post;
    post.shape = NOISE_PRIOR_SHAPE + 0.5 * observed.num_observed;
    post.rate = NOISE_PRIOR_RATE + 0.5 * sqerr;
    return post;
  }

  double sample_noise_precision(const observed_tensor& observed,
                                const dense_tensor& tensor_hat,
                                random::generator& gen) {
    const gamma_posterior post = noise_posterior(observed, tensor_hat);
    return gen.gamma(post.shape, 1.0 / post.rate);
  }

} // end of namespace bptf
