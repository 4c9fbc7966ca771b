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
#include <limits>

#include <cxxtest/TestSuite.h>

#include <bptf/math/prob.hpp>
#include <bptf/model/hyperparameters.hpp>
#include <bptf/model/factor_samplers.hpp>
#include <bptf/model/noise_sampler.hpp>
#include <bptf/parallel/thread_pool.hpp>

using namespace bptf;

class SamplersTestSuite : public CxxTest::TestSuite {
public:

  void test_row_contribution() {
    mat design(3, 2);
    design << 1, 2,
              0, 1,
              3, -1;
    mat mask(1, 3), values(1, 3);
    mask << 1, 0, 2;
    values << 5, 7, -2;
    mat P(2, 2);
    vec l(2);
    row_contribution(design, mask, values, 0, P, l);
    mat expected_P = zeros(2, 2);
    vec expected_l = zeros(2);
    for (int k = 0; k < 3; ++k) {
      const vec d = design.row(k).transpose();
      expected_P += mask(0, k) * outer_product(d, d);
      expected_l += values(0, k) * d;
    }
    TS_ASSERT((P - expected_P).cwiseAbs().maxCoeff() < 1e-12);
    TS_ASSERT((l - expected_l).cwiseAbs().maxCoeff() < 1e-12);
  }

  void test_entity_factor_recovers_rows() {
    random::generator gen(5);
    const mat truth = randn(6, 2, 1.0, gen);
    const mat design = randn(9, 2, 1.0, gen);
    const double tau = 1e6;
    const mat mask = tau * mat::Ones(6, 9);
    const mat values = tau * truth * design.transpose();
    gaussian_hyper hyper;
    hyper.mu = zeros(2);
    hyper.Lambda = eye(2);

    thread_pool pool(3);
    mat factor = zeros(6, 2);
    sample_entity_factor(factor, design, mask, values, hyper, 1234, pool);
    TS_ASSERT((factor - truth).cwiseAbs().maxCoeff() < 0.01);
  }

  void test_entity_factor_independent_of_threads() {
    random::generator gen(6);
    const mat design = randn(12, 3, 1.0, gen);
    const mat mask = mat::Ones(10, 12);
    const mat values = randn(10, 12, 1.0, gen);
    gaussian_hyper hyper;
    hyper.mu = randn(3, gen);
    hyper.Lambda = 2 * eye(3);

    thread_pool one(1), four(4);
    mat a = zeros(10, 3), b = zeros(10, 3);
    sample_entity_factor(a, design, mask, values, hyper, 99, one);
    sample_entity_factor(b, design, mask, values, hyper, 99, four);
    TS_ASSERT_EQUALS((a - b).cwiseAbs().maxCoeff(), 0.0);

    mat c = zeros(10, 3);
    sample_entity_factor(c, design, mask, values, hyper, 100, four);
    TS_ASSERT((a - c).cwiseAbs().maxCoeff() > 0);
  }

  void test_temporal_factor_left_to_right() {
    random::generator gen(7);
    // no observations and a tight random walk: each row follows its
    // neighbors, and the left neighbor is already updated
    mat X(4, 2);
    X << 0, 0,
         2, 2,
         4, 4,
         6, 6;
    const mat design = randn(6, 2, 1.0, gen);
    const mat mask = zeros(4, 6);
    const mat values = zeros(4, 6);
    gaussian_hyper hyper;
    hyper.mu = zeros(2);
    hyper.Lambda = 1e6 * eye(2);
    sample_temporal_factor(X, design, mask, values, hyper, gen);
    const double expected[4] = { 1.0, 2.5, 4.25, 4.25 };
    for (int t = 0; t < 4; ++t) {
      for (int r = 0; r < 2; ++r) TS_ASSERT_DELTA(X(t, r), expected[t], 0.01);
    }
  }

  void test_temporal_factor_follows_data() {
    random::generator gen(8);
    const mat truth = randn(5, 2, 1.0, gen);
    const mat design = randn(8, 2, 1.0, gen);
    const double tau = 1e6;
    const mat mask = tau * mat::Ones(5, 8);
    const mat values = tau * truth * design.transpose();
    gaussian_hyper hyper;
    hyper.mu = zeros(2);
    hyper.Lambda = eye(2);
    mat X = zeros(5, 2);
    X.row(1) = truth.row(1);
    sample_temporal_factor(X, design, mask, values, hyper, gen);
    // the first step is drawn from its random walk neighbors alone
    for (int t = 1; t < 5; ++t) {
      for (int r = 0; r < 2; ++r) TS_ASSERT_DELTA(X(t, r), truth(t, r), 0.01);
    }
  }

  void test_normal_wishart_concentrates() {
    random::generator gen(9);
    const size_t n = 5000;
    mat F(n, 2);
    for (size_t i = 0; i < n; ++i) {
      F(i, 0) = gen.gaussian(1, 0.5);
      F(i, 1) = gen.gaussian(-1, 0.5);
    }
    const gaussian_hyper hyper = sample_normal_wishart(F, 1.0, gen);
    TS_ASSERT_DELTA(hyper.Lambda(0, 0), 4.0, 0.4);
    TS_ASSERT_DELTA(hyper.Lambda(1, 1), 4.0, 0.4);
    TS_ASSERT_DELTA(hyper.Lambda(0, 1), 0.0, 0.4);
    TS_ASSERT_DELTA(hyper.mu(0), 1.0, 0.05);
    TS_ASSERT_DELTA(hyper.mu(1), -1.0, 0.05);
  }

  void test_random_walk_hyper_concentrates() {
    random::generator gen(10);
    const size_t d3 = 5000;
    mat X = zeros(d3, 2);
    for (size_t t = 1; t < d3; ++t) {
      X(t, 0) = X(t - 1, 0) + gen.gaussian(0, 0.5);
      X(t, 1) = X(t - 1, 1) + gen.gaussian(0, 0.5);
    }
    const gaussian_hyper hyper = sample_random_walk_hyper(X, 1.0, gen);
    TS_ASSERT_DELTA(hyper.Lambda(0, 0), 4.0, 0.4);
    TS_ASSERT_DELTA(hyper.Lambda(1, 1), 4.0, 0.4);
    TS_ASSERT_DELTA(hyper.Lambda(0, 1), 0.0, 0.4);
    TS_ASSERT_EQUALS(hyper.mu.size(), 2);
  }

  void test_noise_posterior() {
    const observed_tensor obs =
      make_observed_tensor(dense_tensor(10, 10, 10, 1.0), MISSING_AS_NAN);
    const gamma_posterior post = noise_posterior(obs, dense_tensor(10, 10, 10));
    TS_ASSERT_DELTA(post.shape, 1e-6 + 500, 1e-9);
    TS_ASSERT_DELTA(post.rate, 1e-6 + 500, 1e-9);
  }

  void test_noise_precision_zero_residual() {
    random::generator gen(11);
    dense_tensor values(10, 10, 10, 1.0);
    values[3] = std::numeric_limits<double>::quiet_NaN();
    const observed_tensor obs = make_observed_tensor(values, MISSING_AS_NAN);
    // the unobserved entry does not contribute to the residual
    dense_tensor tensor_hat(10, 10, 10, 1.0);
    tensor_hat[3] = 100;
    const gamma_posterior post = noise_posterior(obs, tensor_hat);
    TS_ASSERT_DELTA(post.shape, 1e-6 + 0.5 * 999, 1e-9);
    TS_ASSERT_DELTA(post.rate, 1e-6, 1e-12);

    const size_t ndraws = 2000;
    double sum = 0;
    for (size_t i = 0; i < ndraws; ++i) {
      sum += sample_noise_precision(obs, tensor_hat, gen);
    }
    const double expected = post.shape / post.rate;
    TS_ASSERT_DELTA(sum / ndraws / expected, 1.0, 0.01);
  }
};
