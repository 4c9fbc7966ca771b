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

#include <bptf/util/random.hpp>
#include <bptf/util/integer_mix.hpp>

namespace bptf {
  namespace random {

    void generator::seed(size_t number) {
      // a 64 bit seed is folded into the 32 bit seeding engine
      const boost::uint32_t folded =
        boost::uint32_t(number) ^ integer_mix(boost::uint32_t(boost::uint64_t(number) >> 32));
      boost::rand48 seeder((boost::int32_t(folded)));
      mut.lock();
      real_rng.seed(boost::uint32_t(seeder()));
      discrete_rng.seed(boost::uint32_t(seeder()));
      mut.unlock();
    }
  } // end of random
} // end of bptf
