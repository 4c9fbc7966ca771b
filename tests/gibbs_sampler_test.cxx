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

#include <algorithm>
#include <cmath>
#include <iostream>
#include <limits>

#include <cxxtest/TestSuite.h>

#include <bptf/model/gibbs_sampler.hpp>

using namespace bptf;

namespace {

  // A rank 2 temporal tensor with smooth time factors and 20% of the
  // entries hidden.
  struct synthetic_problem {
    dense_tensor reference;
    dense_tensor sparse;
    factor_matrices truth;

    synthetic_problem(size_t d1, size_t d2, size_t d3, size_t seed) {
      random::generator gen(seed);
      const size_t rank = 2;
      truth.U = mat(d1, rank);
      truth.V = mat(d2, rank);
      truth.X = mat(d3, rank);
      for (size_t i = 0; i < d1; ++i)
        for (size_t r = 0; r < rank; ++r) truth.U(i, r) = gen.uniform<double>(0.5, 1.5);
      for (size_t j = 0; j < d2; ++j)
        for (size_t r = 0; r < rank; ++r) truth.V(j, r) = gen.uniform<double>(0.5, 1.5);
      for (size_t t = 1; t < d3; ++t) {
        truth.X(t, 0) = 1 + 0.1 * t;
        truth.X(t, 1) = 1 + 0.3 * std::sin(0.7 * t);
      }
      // the first time step sits at the stationary point of its
      // boundary update
      truth.X.row(0) = (2.0 / 3) * truth.X.row(1);

      reference = cp_reconstruct(truth.U, truth.V, truth.X);
      for (size_t k = 0; k < reference.size(); ++k) {
        reference[k] += gen.gaussian(0, 0.01);
      }
      sparse = reference;
      for (size_t k = 0; k < sparse.size(); ++k) {
        if (gen.uniform<double>(0, 1) < 0.2) {
          sparse[k] = std::numeric_limits<double>::quiet_NaN();
        }
      }
    }
  };

  bptf_options small_options() {
    bptf_options opts;
    opts.rank = 2;
    opts.burn_iter = 5;
    opts.gibbs_iter = 5;
    opts.show_iter = 5;
    opts.seed = 17;
    return opts;
  }

  double max_abs(const dense_tensor& T) {
    double ret = 0;
    for (size_t k = 0; k < T.size(); ++k) ret = std::max(ret, std::fabs(T[k]));
    return ret;
  }
}


class GibbsSamplerTestSuite : public CxxTest::TestSuite {
public:

  void test_reconstruction_after_step() {
    synthetic_problem problem(4, 3, 6, 1);
    random::generator gen(2);
    const factor_matrices init = random_factors(4, 3, 6, 2, 0.5, gen);
    gibbs_sampler sampler(problem.reference, problem.sparse, init, small_options());
    TS_ASSERT_EQUALS(sampler.state().sweep, (size_t)0);
    TS_ASSERT_EQUALS(sampler.state().tau, 1.0);
    for (size_t s = 0; s < 3; ++s) {
      sampler.step();
      const chain_state& chain = sampler.state();
      TS_ASSERT_EQUALS(chain.sweep, s + 1);
      const factor_matrices& f = chain.factors;
      for (size_t t = 0; t < 6; ++t) {
        for (size_t j = 0; j < 3; ++j) {
          for (size_t i = 0; i < 4; ++i) {
            double expected = 0;
            for (int r = 0; r < 2; ++r) expected += f.U(i, r) * f.V(j, r) * f.X(t, r);
            TS_ASSERT_DELTA(chain.tensor_hat(i, j, t), expected, 1e-10);
          }
        }
      }
    }
    TS_ASSERT(sampler.state().tau > 0);
  }

  void test_determinism() {
    synthetic_problem problem(5, 4, 6, 3);
    random::generator gen(4);
    const factor_matrices init = random_factors(5, 4, 6, 2, 0.5, gen);
    bptf_options opts = small_options();
    opts.ncpus = 1;
    gibbs_sampler a(problem.reference, problem.sparse, init, opts);
    opts.ncpus = 4;
    gibbs_sampler b(problem.reference, problem.sparse, init, opts);
    const bptf_result ra = a.run();
    const bptf_result rb = b.run();
    TS_ASSERT_EQUALS((ra.factors.U - rb.factors.U).cwiseAbs().maxCoeff(), 0.0);
    TS_ASSERT_EQUALS((ra.factors.V - rb.factors.V).cwiseAbs().maxCoeff(), 0.0);
    TS_ASSERT_EQUALS((ra.factors.X - rb.factors.X).cwiseAbs().maxCoeff(), 0.0);
    for (size_t k = 0; k < ra.tensor_hat.size(); ++k) {
      TS_ASSERT_EQUALS(ra.tensor_hat[k], rb.tensor_hat[k]);
    }
    TS_ASSERT_EQUALS(ra.error.rmse, rb.error.rmse);

    opts.seed = 18;
    gibbs_sampler c(problem.reference, problem.sparse, init, opts);
    const bptf_result rc = c.run();
    TS_ASSERT((ra.factors.U - rc.factors.U).cwiseAbs().maxCoeff() > 0);
  }

  void test_phases() {
    synthetic_problem problem(4, 4, 5, 5);
    random::generator gen(6);
    const factor_matrices init = random_factors(4, 4, 5, 2, 0.5, gen);
    bptf_options opts = small_options();
    opts.burn_iter = 4;
    opts.gibbs_iter = 3;
    opts.show_iter = 2;
    gibbs_sampler sampler(problem.reference, problem.sparse, init, opts);
    const bptf_result result = sampler.run();
    TS_ASSERT_EQUALS(result.burn_sweeps, (size_t)4);
    TS_ASSERT_EQUALS(result.sampling_sweeps, (size_t)3);
    TS_ASSERT(!result.interrupted);
    TS_ASSERT_EQUALS(sampler.state().sweep, (size_t)7);
    TS_ASSERT(!std::isnan(result.error.rmse));
    TS_ASSERT_EQUALS(result.error.rmse,
                     sampler.held_out_error(result.tensor_hat).rmse);
  }

  void test_delay_tau() {
    synthetic_problem problem(4, 4, 5, 7);
    random::generator gen(8);
    const factor_matrices init = random_factors(4, 4, 5, 2, 0.5, gen);
    bptf_options opts = small_options();
    opts.delay_tau = 3;
    gibbs_sampler sampler(problem.reference, problem.sparse, init, opts);
    for (size_t s = 0; s < 3; ++s) {
      sampler.step();
      TS_ASSERT_EQUALS(sampler.state().tau, 1.0);
    }
    sampler.step();
    TS_ASSERT_DIFFERS(sampler.state().tau, 1.0);
  }

  void test_zero_convention() {
    synthetic_problem problem(4, 4, 5, 9);
    dense_tensor sparse = problem.sparse;
    for (size_t k = 0; k < sparse.size(); ++k) {
      if (std::isnan(sparse[k])) sparse[k] = 0;
    }
    random::generator gen(10);
    const factor_matrices init = random_factors(4, 4, 5, 2, 0.5, gen);
    bptf_options opts = small_options();
    opts.missing = "zero";
    gibbs_sampler zero_sampler(problem.reference, sparse, init, opts);
    opts.missing = "nan";
    gibbs_sampler nan_sampler(problem.reference, problem.sparse, init, opts);
    TS_ASSERT_EQUALS(zero_sampler.observed().num_observed,
                     nan_sampler.observed().num_observed);
    TS_ASSERT_EQUALS(zero_sampler.held_out_positions().size(),
                     nan_sampler.held_out_positions().size());
    TS_ASSERT(!nan_sampler.held_out_positions().empty());
  }

  void test_invalid_inputs_are_fatal() {
    synthetic_problem problem(4, 4, 5, 11);
    random::generator gen(12);
    const factor_matrices init = random_factors(4, 4, 5, 2, 0.5, gen);
    const bptf_options opts = small_options();

    // reference and observed tensors disagree
    const dense_tensor other(4, 4, 6);
    TS_ASSERT_THROWS(gibbs_sampler(other, problem.sparse, init, opts), const char*);

    // initial factor with the wrong number of rows
    factor_matrices bad = init;
    bad.V = mat::Zero(3, 2);
    TS_ASSERT_THROWS(gibbs_sampler(problem.reference, problem.sparse, bad, opts),
                     const char*);

    // initial factors of a different rank
    bptf_options rank3 = opts;
    rank3.rank = 3;
    TS_ASSERT_THROWS(gibbs_sampler(problem.reference, problem.sparse, init, rank3),
                     const char*);

    // a single time step
    const dense_tensor flat(4, 4, 1, 1.0);
    factor_matrices flat_init = init;
    flat_init.X = mat::Ones(1, 2);
    TS_ASSERT_THROWS(gibbs_sampler(flat, flat, flat_init, opts), const char*);

    bptf_options no_burn = opts;
    no_burn.burn_iter = 0;
    TS_ASSERT_THROWS(gibbs_sampler(problem.reference, problem.sparse, init, no_burn),
                     const char*);

    bptf_options bad_missing = opts;
    bad_missing.missing = "empty";
    TS_ASSERT_THROWS(gibbs_sampler(problem.reference, problem.sparse, init, bad_missing),
                     const char*);
  }

  void test_non_finite_initial_factors_are_fatal() {
    synthetic_problem problem(4, 4, 5, 23);
    random::generator gen(24);
    const factor_matrices init = random_factors(4, 4, 5, 2, 0.5, gen);
    const bptf_options opts = small_options();

    factor_matrices bad = init;
    bad.U(0, 0) = std::numeric_limits<double>::quiet_NaN();
    TS_ASSERT_THROWS(gibbs_sampler(problem.reference, problem.sparse, bad, opts),
                     const char*);

    bad = init;
    bad.X(2, 1) = std::numeric_limits<double>::infinity();
    TS_ASSERT_THROWS(gibbs_sampler(problem.reference, problem.sparse, bad, opts),
                     const char*);
  }

  void test_empty_held_out_gives_nan() {
    synthetic_problem problem(4, 4, 5, 13);
    random::generator gen(14);
    const factor_matrices init = random_factors(4, 4, 5, 2, 0.5, gen);
    bptf_options opts = small_options();
    opts.burn_iter = 2;
    opts.gibbs_iter = 2;
    // nothing is hidden
    gibbs_sampler sampler(problem.reference, problem.reference, init, opts);
    TS_ASSERT(sampler.held_out_positions().empty());
    const bptf_result result = sampler.run();
    TS_ASSERT(std::isnan(result.error.mape));
    TS_ASSERT(std::isnan(result.error.rmse));
    TS_ASSERT_EQUALS(result.sampling_sweeps, (size_t)2);
  }

  void test_stop_before_first_sweep() {
    synthetic_problem problem(4, 4, 5, 15);
    random::generator gen(16);
    const factor_matrices init = random_factors(4, 4, 5, 2, 0.5, gen);
    gibbs_sampler sampler(problem.reference, problem.sparse, init, small_options());
    TS_ASSERT(!sampler.stop_was_requested());
    sampler.request_stop();
    TS_ASSERT(sampler.stop_was_requested());
    const bptf_result result = sampler.run();
    TS_ASSERT(result.interrupted);
    TS_ASSERT_EQUALS(result.burn_sweeps, (size_t)0);
    TS_ASSERT_EQUALS(result.sampling_sweeps, (size_t)0);
    // the reconstruction of the initial factors is reported
    const dense_tensor initial = cp_reconstruct(init.U, init.V, init.X);
    for (size_t k = 0; k < initial.size(); ++k) {
      TS_ASSERT_EQUALS(result.tensor_hat[k], initial[k]);
    }
  }

  void test_recovers_held_out_entries() {
    synthetic_problem problem(4, 4, 10, 2012);
    random::generator gen(99);
    const factor_matrices init = random_factors(4, 4, 10, 2, 0.5, gen);
    bptf_options opts;
    opts.rank = 2;
    opts.burn_iter = 200;
    opts.gibbs_iter = 100;
    opts.show_iter = 100;
    opts.seed = 5;
    gibbs_sampler sampler(problem.reference, problem.sparse, init, opts);
    TS_ASSERT(!sampler.held_out_positions().empty());
    const bptf_result result = sampler.run();
    TS_ASSERT_EQUALS(result.sampling_sweeps, (size_t)100);
    const double scale = max_abs(problem.reference);
    std::cout << "held-out RMSE " << result.error.rmse << " MAPE "
              << result.error.mape << " data scale " << scale << std::endl;
    TS_ASSERT_LESS_THAN(result.error.rmse, 0.1 * scale);
  }
};
