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

/**
 * Bayesian probabilistic tensor factorization of a (d1 x d2 x d3)
 * tensor whose third mode is time. Reads the observed tensor and the
 * reference tensor, runs the Gibbs sampler and reports the held-out
 * MAPE and RMSE of the posterior mean reconstruction.
 */

#include <csignal>
#include <cstdlib>
#include <limits>
#include <bptf.hpp>


namespace {
  // the running sampler, stopped by SIGINT and SIGTERM
  bptf::gibbs_sampler* active_sampler = NULL;

  void stop_handler(int) {
    if (active_sampler != NULL) active_sampler->request_stop();
  }

  bptf::mat load_or_draw(const std::string& filename, size_t rows, size_t rank,
                         double stdev, bptf::random::generator& gen) {
    if (!filename.empty()) return bptf::read_factor(filename);
    return bptf::randn(rows, rank, stdev, gen);
  }
}


int main(int argc, char** argv) {
  global_logger().set_log_level(LOG_INFO);

  const std::string description =
    "Bayesian probabilistic tensor factorization by Gibbs sampling";
  bptf::command_line_options clopts(description);
  std::string reference_file, observed_file;
  std::string init_u, init_v, init_x;
  std::string output_prefix, logfile;
  bptf::bptf_options opts;

  clopts.attach_option("observed", &observed_file,
                       "observed tensor file, missing entries absent or nan (required)");
  clopts.add_positional("observed");
  clopts.attach_option("reference", &reference_file,
                       "complete reference tensor used for the held-out error (required)");
  clopts.attach_option("init_u", &init_u, "initial U factor file (d1 x rank)");
  clopts.attach_option("init_v", &init_v, "initial V factor file (d2 x rank)");
  clopts.attach_option("init_x", &init_x, "initial X factor file (d3 x rank)");
  clopts.attach_option("output", &output_prefix,
                       "write <output>.U, <output>.V, <output>.X and <output>.tensor");
  clopts.attach_option("logfile", &logfile, "also write the log to this file");
  opts.init_command_line_options(clopts);

  if (!clopts.parse(argc, argv)) {
    std::cout << "Error in parsing command line arguments." << std::endl;
    return EXIT_FAILURE;
  }
  if (!clopts.is_set("observed") || !clopts.is_set("reference")) {
    std::cout << "Both --observed and --reference must be given." << std::endl;
    clopts.print_description();
    return EXIT_FAILURE;
  }
  if (!logfile.empty() && !global_logger().set_log_file(logfile)) {
    logstream(LOG_ERROR) << "Cannot open log file " << logfile << std::endl;
    return EXIT_FAILURE;
  }

  try {
    opts.validate();
    const double absent = opts.convention() == bptf::MISSING_AS_NAN ?
      std::numeric_limits<double>::quiet_NaN() : 0.0;
    const bptf::dense_tensor reference = bptf::read_tensor(reference_file, 0.0);
    const bptf::dense_tensor observed = bptf::read_tensor(observed_file, absent);

    bptf::random::generator gen(opts.seed);
    bptf::factor_matrices init;
    init.U = load_or_draw(init_u, observed.dim(0), opts.rank, opts.init_scale, gen);
    init.V = load_or_draw(init_v, observed.dim(1), opts.rank, opts.init_scale, gen);
    init.X = load_or_draw(init_x, observed.dim(2), opts.rank, opts.init_scale, gen);

    bptf::gibbs_sampler sampler(reference, observed, init, opts);
    bptf::timer runtime;
    active_sampler = &sampler;
    signal(SIGINT, stop_handler);
    signal(SIGTERM, stop_handler);
    const bptf::bptf_result result = sampler.run();
    signal(SIGINT, SIG_DFL);
    signal(SIGTERM, SIG_DFL);
    active_sampler = NULL;

    std::cout << "Final MAPE: " << result.error.mape << std::endl;
    std::cout << "Final RMSE: " << result.error.rmse << std::endl;
    std::cout << "Finished in " << runtime << " seconds" << std::endl;
    if (result.interrupted) {
      std::cout << "Interrupted after " << result.burn_sweeps << " burn-in and "
                << result.sampling_sweeps << " sampling sweeps" << std::endl;
    }
    sampler.counters().print(std::cout);

    if (!output_prefix.empty()) {
      const char* suffix[3] = { ".U", ".V", ".X" };
      const bptf::mat* factor[3] = { &result.factors.U, &result.factors.V,
                                     &result.factors.X };
      for (size_t mode = 0; mode < 3; ++mode) {
        bptf::write_factor(output_prefix + suffix[mode], *factor[mode]);
      }
      bptf::write_tensor(output_prefix + ".tensor", result.tensor_hat);
      logstream(LOG_INFO) << "Wrote factors and reconstruction to "
                          << output_prefix << ".*" << std::endl;
    }
  }
  catch (const char* error) {
    active_sampler = NULL;
    logstream(LOG_ERROR) << "bptf failed: " << error << std::endl;
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}

