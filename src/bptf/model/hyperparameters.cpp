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

#include <bptf/model/hyperparameters.hpp>
#include <bptf/math/prob.hpp>
#include <bptf/logger/assertions.hpp>

namespace bptf {

  namespace {
    // Shared tail of both updates: invert the posterior inverse scale
    // through its Cholesky factor, draw Lambda, then draw mu with the
    // precision kappa * Lambda.
    gaussian_hyper draw_hyper(const mat& inv_scale, double df,
                              const vec& mean0, double kappa,
                              random::generator& gen) {
      gaussian_hyper hyper;
      const mat scale = inv_sympd(inv_scale, "hyperparameter scale");
      hyper.Lambda = wishrnd(scale, df, gen);
      hyper.mu = mvnrnd_precision(mean0, kappa * hyper.Lambda, gen);
      return hyper;
    }
  }

  gaussian_hyper sample_normal_wishart(const mat& F, double beta0,
                                       random::generator& gen) {
    ASSERT_GT(F.rows(), 0);
    const double n = F.rows();
    const int rank = F.cols();
    const vec Fbar = F.colwise().mean().transpose();
    const mat centered = F.rowwise() - Fbar.transpose();
    const double temp = n / (n + beta0);
    const mat inv_scale = eye(rank) + centered.transpose() * centered
      + temp * beta0 * outer_product(Fbar, Fbar);
    return draw_hyper(inv_scale, n + rank, temp * Fbar, n + beta0, gen);
  }

  gaussian_hyper sample_random_walk_hyper(const mat& X, double beta0,
                                          random::generator& gen) {
    ASSERT_GE(X.rows(), 2);
    const int d3 = X.rows();
    const int rank = X.cols();
    const vec x0 = X.row(0).transpose();
    const mat dx = X.bottomRows(d3 - 1) - X.topRows(d3 - 1);
    const mat inv_scale = eye(rank) + dx.transpose() * dx
      + beta0 * outer_product(x0, x0) / (beta0 + 1);
    return draw_hyper(inv_scale, d3 + rank, x0 / (beta0 + 1), beta0 + 1, gen);
  }

} // end of namespace bptf
