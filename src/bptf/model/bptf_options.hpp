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

#ifndef BPTF_MODEL_BPTF_OPTIONS_HPP
#define BPTF_MODEL_BPTF_OPTIONS_HPP

#include <string>
#include <iostream>
#include <bptf/model/observed_tensor.hpp>
#include <bptf/util/command_line_options.hpp>

namespace bptf {

  /**
   * Run parameters of the Gibbs sampler.
   */
  class bptf_options {
  public:
    size_t rank;        //latent rank R shared by U, V and X
    size_t burn_iter;   //sweeps discarded before averaging
    size_t gibbs_iter;  //sweeps averaged into the posterior mean
    double beta0;       //prior pseudo-count of the Normal-Wishart priors
    size_t show_iter;   //burn-in diagnostic interval, in sweeps
    size_t seed;
    size_t ncpus;       //worker threads of the row samplers
    size_t delay_tau;   //sweeps during which tau keeps its initial value
    double init_scale;  //stdev of the random factor initialization
    std::string missing;//"nan" or "zero"

    bptf_options() :
      rank(10), burn_iter(1000), gibbs_iter(200), beta0(1), show_iter(200),
      seed(0), ncpus(2), delay_tau(0), init_scale(0.1), missing("nan") { }

    void init_command_line_options(command_line_options& clopts);

    /** Checks the ranges of every field. Violations are fatal. */
    void validate() const;

    //! The parsed missing-value convention. Requires validate() to pass.
    missing_convention convention() const;

    void print(std::ostream& out) const;
  };

} // end of namespace bptf

#endif
