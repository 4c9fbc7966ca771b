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

#include <cstdlib>
#include <limits>
#include <vector>
#include <bptf.hpp>

#include <bptf/macros_def.hpp>


int main(int argc, char** argv) {
  global_logger().set_log_level(LOG_INFO);
  global_logger().set_log_to_console(true);

  // Parse command line options -----------------------------------------------
  const std::string description =
    "Creates a synthetic low rank temporal tensor with hidden entries";
  bptf::command_line_options clopts(description);
  std::string prefix  = "synthetic";
  size_t d1           = 30;
  size_t d2           = 20;
  size_t d3           = 50;
  size_t rank         = 3;
  double missing_rate = 0.2;
  double noise        = 0;
  double drift        = 0.1;
  size_t seed         = 31413;

  clopts.attach_option("prefix", &prefix, prefix,
                       "Writes <prefix>.reference and <prefix>.observed");
  clopts.attach_option("d1", &d1, d1, "Size of the first mode.");
  clopts.attach_option("d2", &d2, d2, "Size of the second mode.");
  clopts.attach_option("d3", &d3, d3, "Number of time steps.");
  clopts.attach_option("rank", &rank, rank, "Rank of the ground truth factors.");
  clopts.attach_option("missing_rate", &missing_rate, missing_rate,
                       "Fraction of entries hidden from the observed tensor.");
  clopts.attach_option("noise", &noise, noise,
                       "Standard deviation of the additive Gaussian noise.");
  clopts.attach_option("drift", &drift, drift,
                       "Standard deviation of the temporal random walk steps.");
  clopts.attach_option("seed", &seed, seed, "Random seed.");

  if (!clopts.parse(argc, argv)) {
    std::cout << "Error in parsing command line arguments." << std::endl;
    return EXIT_FAILURE;
  }

  try {
    ASSERT_GT(rank, size_t(0));
    ASSERT_GE(d3, size_t(2));
    if (!(missing_rate >= 0 && missing_rate < 1)) {
      logstream(LOG_FATAL) << "missing_rate must be in [0, 1), got "
                           << missing_rate << std::endl;
    }
    bptf::random::generator gen(seed);

    std::cout << "Constructing latent factors" << std::endl;
    const bptf::mat U = bptf::randn(d1, rank, 1.0, gen);
    const bptf::mat V = bptf::randn(d2, rank, 1.0, gen);
    // the temporal factor follows a Gaussian random walk
    bptf::mat X = bptf::randn(d3, rank, drift, gen);
    X.row(0) = bptf::randn(rank, gen).transpose();
    for (size_t t = 1; t < d3; ++t) X.row(t) += X.row(t - 1);

    std::cout << "Constructing the " << d1 << " x " << d2 << " x " << d3
              << " tensor" << std::endl;
    bptf::dense_tensor reference = bptf::cp_reconstruct(U, V, X);
    if (noise > 0) {
      for (size_t k = 0; k < reference.size(); ++k)
        reference[k] += gen.gaussian(0, noise);
    }

    std::vector<size_t> hidden;
    for (size_t k = 0; k < reference.size(); ++k) {
      if (gen.uniform<double>(0, 1) < missing_rate) hidden.push_back(k);
    }
    bptf::dense_tensor observed = reference;
    foreach(size_t k, hidden) {
      observed[k] = std::numeric_limits<double>::quiet_NaN();
    }

    std::cout << "Hiding " << hidden.size() << " of " << reference.size()
              << " entries" << std::endl;
    bptf::write_tensor(prefix + ".reference", reference);
    bptf::write_tensor(prefix + ".observed", observed,
                       std::numeric_limits<double>::quiet_NaN());
    std::cout << "Wrote " << prefix << ".reference and " << prefix
              << ".observed" << std::endl;
  }
  catch (const char* error) {
    logstream(LOG_ERROR) << "make_synthetic_tensor_data failed: " << error
                         << std::endl;
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
} // end of main

#include <bptf/macros_undef.hpp>
