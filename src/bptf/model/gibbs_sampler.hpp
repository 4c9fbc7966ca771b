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

#ifndef BPTF_MODEL_GIBBS_SAMPLER_HPP
#define BPTF_MODEL_GIBBS_SAMPLER_HPP

#include <csignal>
#include <vector>
#include <bptf/math/mathlayer.hpp>
#include <bptf/math/dense_tensor.hpp>
#include <bptf/model/bptf_options.hpp>
#include <bptf/model/metrics.hpp>
#include <bptf/model/observed_tensor.hpp>
#include <bptf/model/runtime_counters.hpp>
#include <bptf/parallel/thread_pool.hpp>
#include <bptf/util/random.hpp>

namespace bptf {

  //! Initial (or final) U (d1 x R), V (d2 x R) and X (d3 x R)
  struct factor_matrices {
    mat U;
    mat V;
    mat X;
  };

  //! Draws every factor entry from N(0, stdev^2)
  factor_matrices random_factors(size_t d1, size_t d2, size_t d3, size_t rank,
                                 double stdev, random::generator& gen);

  /**
   * The mutable state of the Markov chain. Only the driving thread
   * modifies it, and only between sweeps is it observable.
   */
  struct chain_state {
    factor_matrices factors;
    double tau;               //noise precision
    size_t sweep;             //completed sweeps
    dense_tensor tensor_hat;  //reconstruction from the current factors
  };

  struct bptf_result {
    dense_tensor tensor_hat;  //posterior mean reconstruction
    factor_matrices factors;  //factors of the last completed sweep
    error_metrics error;      //held-out MAPE and RMSE of tensor_hat
    size_t burn_sweeps;       //completed burn-in sweeps
    size_t sampling_sweeps;   //sweeps averaged into tensor_hat
    bool interrupted;
  };

  /**
   * Bayesian probabilistic tensor factorization by Gibbs sampling.
   *
   * Each sweep redraws U, V and X (each from its conditional posterior
   * given the freshly updated others), rebuilds the reconstruction and
   * redraws the noise precision tau. Sweeps after the burn-in are
   * averaged into the posterior mean reconstruction.
   *
   * The reference tensor is used for held-out error only. All input
   * checks happen in the constructor and failures are fatal.
   */
  class gibbs_sampler {
  public:
    gibbs_sampler(const dense_tensor& reference,
                  const dense_tensor& sparse,
                  const factor_matrices& init,
                  const bptf_options& opts);

    /**
     * Runs burn_iter + gibbs_iter sweeps (fewer if stopped) and returns
     * the posterior mean reconstruction with its held-out error.
     */
    bptf_result run();

    /** Performs one full sweep of the chain. */
    void step();

    //! Asks run() to return after the current sweep. Signal safe.
    void request_stop() { stop_requested = 1; }

    bool stop_was_requested() const { return stop_requested != 0; }

    const chain_state& state() const { return chain; }

    const observed_tensor& observed() const { return obs; }

    const std::vector<size_t>& held_out_positions() const { return held_out; }

    //! MAPE and RMSE of an estimate over the held-out positions
    error_metrics held_out_error(const dense_tensor& estimate) const;

    const runtime_counters& counters() const { return perf; }

  private:
    void check_inputs(const dense_tensor& reference,
                      const dense_tensor& sparse,
                      const factor_matrices& init) const;

    void report_checkpoint(size_t iteration, const std::vector<double>& held_out_sum,
                           size_t count);

    const bptf_options opts;
    const dense_tensor reference;
    observed_tensor obs;
    std::vector<size_t> held_out;

    // per mode unfoldings of the mask and of the zero filled values
    mat mask_unfolded[3];
    mat values_unfolded[3];

    chain_state chain;
    random::generator gen;
    thread_pool pool;
    runtime_counters perf;
    volatile std::sig_atomic_t stop_requested;

    // not copyable
    gibbs_sampler(const gibbs_sampler&);
    gibbs_sampler& operator=(const gibbs_sampler&);
  };

} // end of namespace bptf

#endif
