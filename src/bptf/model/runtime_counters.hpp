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

#ifndef BPTF_MODEL_RUNTIME_COUNTERS_HPP
#define BPTF_MODEL_RUNTIME_COUNTERS_HPP

#include <iostream>

namespace bptf {

  enum countervals {
    HYPER_SAMPLE_STEP = 0,
    ENTITY_SAMPLE_STEP = 1,
    TEMPORAL_SAMPLE_STEP = 2,
    RECONSTRUCT_STEP = 3,
    NOISE_SAMPLE_STEP = 4,
    METRICS_STEP = 5,
    MAX_COUNTER = 6
  };

  extern const char* countername[];

  /**
   * Cumulative seconds spent in each phase of a sweep.
   */
  struct runtime_counters {
    double counter[MAX_COUNTER];

    runtime_counters() { reset(); }

    void reset() {
      for (int i = 0; i < MAX_COUNTER; ++i) counter[i] = 0;
    }

    inline void add(countervals which, double seconds) {
      counter[which] += seconds;
    }

    //! prints every nonzero counter on its own line
    void print(std::ostream& out) const;
  };

} // end of namespace bptf

#endif
