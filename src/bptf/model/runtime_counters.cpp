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

#include <bptf/model/runtime_counters.hpp>

namespace bptf {

  const char* countername[] = {"HYPER_SAMPLE_STEP", "ENTITY_SAMPLE_STEP",
    "TEMPORAL_SAMPLE_STEP", "RECONSTRUCT_STEP", "NOISE_SAMPLE_STEP",
    "METRICS_STEP"};

  void runtime_counters::print(std::ostream& out) const {
    for (int i = 0; i < MAX_COUNTER; i++) {
      if (counter[i] > 0)
        out << "Performance counters are: " << i << ") " << countername[i]
            << ", " << counter[i] << std::endl;
    }
  }

} // end of namespace bptf
