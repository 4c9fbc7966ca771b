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

#include <bptf/model/bptf_options.hpp>
#include <bptf/logger/logger.hpp>

namespace bptf {

  void bptf_options::init_command_line_options(command_line_options& clopts) {
    clopts.attach_option("rank", &rank, rank, "latent rank of the factorization");
    clopts.attach_option("burn_iter", &burn_iter, burn_iter, "number of burn-in sweeps");
    clopts.attach_option("gibbs_iter", &gibbs_iter, gibbs_iter, "number of sweeps averaged into the posterior mean");
    clopts.attach_option("beta0", &beta0, beta0, "prior pseudo-count of the hyperparameter priors");
    clopts.attach_option("show_iter", &show_iter, show_iter, "print held-out error every show_iter burn-in sweeps");
    clopts.attach_option("seed", &seed, seed, "random seed");
    clopts.attach_option("ncpus", &ncpus, ncpus, "number of worker threads for the factor row samplers");
    clopts.attach_option("delay_tau", &delay_tau, delay_tau, "start sampling tau (noise precision) after delay_tau sweeps");
    clopts.attach_option("init_scale", &init_scale, init_scale, "standard deviation of the random factor initialization");
    clopts.attach_option("missing", &missing, missing, "missing entries of the observed tensor: nan (absent = NaN) or zero (absent = 0)");
  }

  void bptf_options::validate() const {
    missing_convention parsed;
    if (rank == 0) {
      logstream(LOG_FATAL) << "rank must be positive" << std::endl;
    }
    if (burn_iter == 0 || gibbs_iter == 0) {
      logstream(LOG_FATAL) << "burn_iter and gibbs_iter must be positive, got "
                           << burn_iter << " and " << gibbs_iter << std::endl;
    }
    if (!(beta0 > 0)) {
      logstream(LOG_FATAL) << "beta0 must be positive, got " << beta0 << std::endl;
    }
    if (show_iter == 0) {
      logstream(LOG_FATAL) << "show_iter must be positive" << std::endl;
    }
    if (ncpus == 0) {
      logstream(LOG_FATAL) << "ncpus must be positive" << std::endl;
    }
    if (!(init_scale >= 0)) {
      logstream(LOG_FATAL) << "init_scale must not be negative, got "
                           << init_scale << std::endl;
    }
    if (!parse_missing_convention(missing, parsed)) {
      logstream(LOG_FATAL) << "Unknown missing-value convention '" << missing
                           << "'. Options are {nan, zero}" << std::endl;
    }
  }

  missing_convention bptf_options::convention() const {
    missing_convention parsed = MISSING_AS_NAN;
    if (!parse_missing_convention(missing, parsed)) {
      logstream(LOG_FATAL) << "Unknown missing-value convention '" << missing
                           << "'" << std::endl;
    }
    return parsed;
  }

  void bptf_options::print(std::ostream& out) const {
    out << "rank: " << rank
        << " burn_iter: " << burn_iter
        << " gibbs_iter: " << gibbs_iter
        << " beta0: " << beta0
        << " show_iter: " << show_iter
        << " seed: " << seed
        << " ncpus: " << ncpus
        << " delay_tau: " << delay_tau
        << " init_scale: " << init_scale
        << " missing: " << missing;
  }

} // end of namespace bptf
