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

#include <boost/bind.hpp>
#include <bptf/model/factor_samplers.hpp>
#include <bptf/math/prob.hpp>
#include <bptf/util/integer_mix.hpp>
#include <bptf/logger/assertions.hpp>

namespace bptf {

  void row_contribution(const mat& design,
                        const mat& weighted_mask, const mat& weighted_values,
                        int row, mat& precision, vec& linear) {
    precision.noalias() = design.transpose() *
      weighted_mask.row(row).transpose().asDiagonal() * design;
    linear.noalias() = design.transpose() * weighted_values.row(row).transpose();
  }


  namespace {

    /**
     * Everything a row range reads. Owned by the caller of
     * sample_entity_factor until run_ranges returns.
     */
    struct entity_row_job {
      mat* factor;
      const mat* design;
      const mat* weighted_mask;
      const mat* weighted_values;
      const mat* Lambda;
      vec prior_linear;   // Lambda * mu
      size_t sweep_seed;

      void run(size_t begin, size_t end) {
        const int rank = design->cols();
        mat precision(rank, rank);
        vec linear(rank);
        for (int i = int(begin); i < int(end); ++i) {
          row_contribution(*design, *weighted_mask, *weighted_values, i,
                           precision, linear);
          precision += *Lambda;
          linear += prior_linear;
          random::generator rowgen(integer_mix(uint32_t(sweep_seed + i)));
          factor->row(i) = mvnrnd_canonical(precision, linear, rowgen).transpose();
        }
      }
    };

  }


  void sample_entity_factor(mat& factor, const mat& design,
                            const mat& weighted_mask,
                            const mat& weighted_values,
                            const gaussian_hyper& hyper,
                            size_t sweep_seed, thread_pool& pool) {
    ASSERT_EQ(weighted_mask.rows(), factor.rows());
    ASSERT_EQ(weighted_values.rows(), factor.rows());
    ASSERT_EQ(weighted_mask.cols(), design.rows());
    ASSERT_EQ(design.cols(), factor.cols());

    entity_row_job job;
    job.factor = &factor;
    job.design = &design;
    job.weighted_mask = &weighted_mask;
    job.weighted_values = &weighted_values;
    job.Lambda = &hyper.Lambda;
    job.prior_linear = hyper.Lambda * hyper.mu;
    job.sweep_seed = sweep_seed;

    pool.run_ranges(size_t(factor.rows()),
                    boost::bind(&entity_row_job::run, &job, _1, _2));
  }


  void sample_temporal_factor(mat& X, const mat& design,
                              const mat& weighted_mask,
                              const mat& weighted_values,
                              const gaussian_hyper& hyper,
                              random::generator& gen) {
    ASSERT_GE(X.rows(), 2);
    ASSERT_EQ(weighted_mask.rows(), X.rows());
    ASSERT_EQ(weighted_mask.cols(), design.rows());

    const int d3 = X.rows();
    const int rank = X.cols();
    const mat& Lambda = hyper.Lambda;
    mat precision(rank, rank);
    vec linear(rank);
    for (int t = 0; t < d3; ++t) {
      row_contribution(design, weighted_mask, weighted_values, t,
                       precision, linear);
      if (t == 0) {
        const vec mean = 0.5 * (X.row(1).transpose() + hyper.mu);
        X.row(t) = mvnrnd_precision(mean, precision + 2 * Lambda, gen).transpose();
      }
      else if (t == d3 - 1) {
        linear += Lambda * X.row(t - 1).transpose();
        X.row(t) = mvnrnd_canonical(precision + Lambda, linear, gen).transpose();
      }
      else {
        linear += Lambda * (X.row(t - 1) + X.row(t + 1)).transpose();
        X.row(t) = mvnrnd_canonical(precision + 2 * Lambda, linear, gen).transpose();
      }
    }
  }

} // end of namespace bptf
