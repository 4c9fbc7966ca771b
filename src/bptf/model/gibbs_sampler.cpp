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
#include <iostream>
#include <sstream>
#include <bptf/model/gibbs_sampler.hpp>
#include <bptf/model/hyperparameters.hpp>
#include <bptf/model/factor_samplers.hpp>
#include <bptf/model/noise_sampler.hpp>
#include <bptf/math/prob.hpp>
#include <bptf/util/timer.hpp>
#include <bptf/logger/logger.hpp>

namespace bptf {

  factor_matrices random_factors(size_t d1, size_t d2, size_t d3, size_t rank,
                                 double stdev, random::generator& gen) {
    factor_matrices ret;
    ret.U = randn(d1, rank, stdev, gen);
    ret.V = randn(d2, rank, stdev, gen);
    ret.X = randn(d3, rank, stdev, gen);
    return ret;
  }


  gibbs_sampler::gibbs_sampler(const dense_tensor& reference_tensor,
                               const dense_tensor& sparse,
                               const factor_matrices& init,
                               const bptf_options& options) :
    opts(options), reference(reference_tensor), gen(options.seed),
    pool(options.ncpus), stop_requested(0) {
    opts.validate();
    check_inputs(reference, sparse, init);

    const missing_convention convention = opts.convention();
    obs = make_observed_tensor(sparse, convention);
    held_out = find_held_out(reference, sparse, convention);
    for (size_t mode = 0; mode < 3; ++mode) {
      mask_unfolded[mode] = obs.mask.unfold(mode);
      values_unfolded[mode] = obs.values.unfold(mode);
    }

    chain.factors = init;
    chain.tau = 1;
    chain.sweep = 0;
    chain.tensor_hat = cp_reconstruct(init.U, init.V, init.X);

    logstream(LOG_INFO) << "Tensor " << sparse.shape_string() << " with "
                        << obs.num_observed << " observed and "
                        << held_out.size() << " held-out entries" << std::endl;
    if (obs.num_observed == 0) {
      logstream(LOG_WARNING) << "The observed tensor has no observed entries"
                             << std::endl;
    }
    if (held_out.empty()) {
      logstream(LOG_WARNING) << "No held-out positions: the reference is zero"
                             << " wherever the observed tensor is missing."
                             << " MAPE and RMSE will be NaN" << std::endl;
    }
  }


  void gibbs_sampler::check_inputs(const dense_tensor& reference,
                                   const dense_tensor& sparse,
                                   const factor_matrices& init) const {
    if (!reference.same_shape(sparse)) {
      logstream(LOG_FATAL) << "Reference tensor is " << reference.shape_string()
                           << " but the observed tensor is "
                           << sparse.shape_string() << std::endl;
    }
    const mat* factors[3] = { &init.U, &init.V, &init.X };
    const char* names[3] = { "U", "V", "X" };
    for (size_t mode = 0; mode < 3; ++mode) {
      const mat& F = *factors[mode];
      if (size_t(F.rows()) != sparse.dim(mode) || size_t(F.cols()) != opts.rank) {
        logstream(LOG_FATAL) << "Initial factor " << names[mode] << " is "
                             << F.rows() << " x " << F.cols() << ", expected "
                             << sparse.dim(mode) << " x " << opts.rank
                             << " for a " << sparse.shape_string()
                             << " tensor" << std::endl;
      }
      if (!F.allFinite()) {
        logstream(LOG_FATAL) << "Initial factor " << names[mode]
                             << " has NaN or infinite entries" << std::endl;
      }
    }
    if (sparse.dim(0) == 0 || sparse.dim(1) == 0) {
      logstream(LOG_FATAL) << "Empty tensor " << sparse.shape_string() << std::endl;
    }
    if (sparse.dim(2) < 2) {
      logstream(LOG_FATAL) << "The temporal mode needs at least 2 steps, got "
                           << sparse.dim(2) << std::endl;
    }
  }


  error_metrics gibbs_sampler::held_out_error(const dense_tensor& estimate) const {
    return evaluate_positions(reference, estimate, held_out);
  }


  void gibbs_sampler::step() {
    factor_matrices& f = chain.factors;
    const double tau = chain.tau;
    timer ti;

    // U given V, X
    ti.start();
    const gaussian_hyper hyper_u = sample_normal_wishart(f.U, opts.beta0, gen);
    perf.add(HYPER_SAMPLE_STEP, ti.current_time());
    ti.start();
    {
      const mat design = khatri_rao(f.X, f.V);
      const mat weighted_mask = tau * mask_unfolded[0];
      const mat weighted_values = tau * values_unfolded[0];
      sample_entity_factor(f.U, design, weighted_mask, weighted_values,
                           hyper_u, gen.seed_value(), pool);
    }
    perf.add(ENTITY_SAMPLE_STEP, ti.current_time());

    // V given the new U and X
    ti.start();
    const gaussian_hyper hyper_v = sample_normal_wishart(f.V, opts.beta0, gen);
    perf.add(HYPER_SAMPLE_STEP, ti.current_time());
    ti.start();
    {
      const mat design = khatri_rao(f.X, f.U);
      const mat weighted_mask = tau * mask_unfolded[1];
      const mat weighted_values = tau * values_unfolded[1];
      sample_entity_factor(f.V, design, weighted_mask, weighted_values,
                           hyper_v, gen.seed_value(), pool);
    }
    perf.add(ENTITY_SAMPLE_STEP, ti.current_time());

    // X given the new U and V
    ti.start();
    const gaussian_hyper hyper_x = sample_random_walk_hyper(f.X, opts.beta0, gen);
    perf.add(HYPER_SAMPLE_STEP, ti.current_time());
    ti.start();
    {
      const mat design = khatri_rao(f.V, f.U);
      const mat weighted_mask = tau * mask_unfolded[2];
      const mat weighted_values = tau * values_unfolded[2];
      sample_temporal_factor(f.X, design, weighted_mask, weighted_values,
                             hyper_x, gen);
    }
    perf.add(TEMPORAL_SAMPLE_STEP, ti.current_time());

    ti.start();
    cp_reconstruct(f.U, f.V, f.X, chain.tensor_hat);
    perf.add(RECONSTRUCT_STEP, ti.current_time());

    if (chain.sweep >= opts.delay_tau) {
      ti.start();
      chain.tau = sample_noise_precision(obs, chain.tensor_hat, gen);
      perf.add(NOISE_SAMPLE_STEP, ti.current_time());
    }
    ++chain.sweep;
  }


  void gibbs_sampler::report_checkpoint(size_t iteration,
                                        const std::vector<double>& held_out_sum,
                                        size_t count) {
    std::vector<double> estimate(held_out_sum);
    for (size_t k = 0; k < estimate.size(); ++k) estimate[k] /= count;
    const std::vector<double> truth = gather(reference, held_out);
    const double mape = compute_mape(truth, estimate);
    const double rmse = compute_rmse(truth, estimate);
    std::cout << "Iter: " << iteration << std::endl;
    std::cout << "MAPE: " << mape << std::endl;
    std::cout << "RMSE: " << rmse << std::endl;
    std::cout << std::endl;
  }


  bptf_result gibbs_sampler::run() {
    timer runtime;
    const size_t total = opts.burn_iter + opts.gibbs_iter;
    std::stringstream config;
    opts.print(config);
    logstream(LOG_INFO) << "Starting BPTF Gibbs sampler. " << config.str() << std::endl;

    bptf_result result;
    result.burn_sweeps = 0;
    result.sampling_sweeps = 0;
    result.interrupted = false;

    // running sum of the held-out predictions since the last checkpoint
    std::vector<double> held_out_sum(held_out.size(), 0);
    size_t held_out_count = 0;
    dense_tensor posterior_sum(reference.dim(0), reference.dim(1), reference.dim(2));

    for (size_t it = 0; it < total; ++it) {
      if (stop_requested) {
        result.interrupted = true;
        logstream(LOG_WARNING) << "Stop requested, ending the chain after "
                               << it << " sweeps" << std::endl;
        break;
      }
      step();

      timer ti;
      for (size_t k = 0; k < held_out.size(); ++k) {
        held_out_sum[k] += chain.tensor_hat[held_out[k]];
      }
      ++held_out_count;
      if ((it + 1) % opts.show_iter == 0 && it < opts.burn_iter) {
        report_checkpoint(it + 1, held_out_sum, held_out_count);
        std::fill(held_out_sum.begin(), held_out_sum.end(), 0.0);
        held_out_count = 0;
      }
      if (it + 1 > opts.burn_iter) {
        posterior_sum += chain.tensor_hat;
        ++result.sampling_sweeps;
      }
      else {
        ++result.burn_sweeps;
      }
      perf.add(METRICS_STEP, ti.current_time());
    }

    if (result.sampling_sweeps > 0) {
      posterior_sum *= 1.0 / result.sampling_sweeps;
      result.tensor_hat = posterior_sum;
    }
    else {
      logstream(LOG_WARNING) << "No sampling sweep completed, reporting the"
                             << " reconstruction of the last sweep" << std::endl;
      result.tensor_hat = chain.tensor_hat;
    }
    result.factors = chain.factors;
    result.error = held_out_error(result.tensor_hat);

    logstream(LOG_INFO) << "Finished " << chain.sweep << " sweeps in "
                        << runtime.current_time() << " seconds. MAPE: "
                        << result.error.mape << " RMSE: " << result.error.rmse
                        << std::endl;
    return result;
  }

} // end of namespace bptf
