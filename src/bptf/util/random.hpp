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


#ifndef BPTF_RANDOM_HPP
#define BPTF_RANDOM_HPP

#include <cstddef>
#include <boost/cstdint.hpp>
#include <boost/random.hpp>
#include <bptf/parallel/pthread_tools.hpp>

namespace bptf {

  /**
   * \ingroup random
   * Explicitly seeded random number generation on the Boost.Random
   * engines. Every sampler owns its generator, so a run is reproducible
   * from its seed.
   */
  namespace random {

    namespace detail {
      // integers are drawn from [min, max] on the discrete engine
      template<typename IntType>
      struct uniform_draw {
        template<typename RealEngine, typename DiscreteEngine>
        static IntType draw(RealEngine&, DiscreteEngine& discrete,
                            IntType min, IntType max) {
          return boost::random::uniform_int_distribution<IntType>(min, max)(discrete);
        }
      };
      // doubles are drawn from [min, max) on the real engine
      template<>
      struct uniform_draw<double> {
        template<typename RealEngine, typename DiscreteEngine>
        static double draw(RealEngine& real, DiscreteEngine&,
                           double min, double max) {
          return boost::random::uniform_real_distribution<double>(min, max)(real);
        }
      };
    }


    /**
     * Holds a real and a discrete engine, both seeded from one number.
     * Calls are serialized, so a generator may be shared between threads,
     * but the sampler gives each row its own generator instead.
     */
    class generator {
    public:
      typedef boost::lagged_fibonacci607 real_rng_type;
      typedef boost::mt11213b            discrete_rng_type;

      //! Engines in their default seeded state
      generator() { }

      explicit generator(size_t number) { seed(number); }

      //! Reseeds both engines from number
      void seed(size_t number);

      template<typename NumType>
      NumType uniform(const NumType min, const NumType max) {
        mut.lock();
        const NumType result =
          detail::uniform_draw<NumType>::draw(real_rng, discrete_rng, min, max);
        mut.unlock();
        return result;
      }

      double gaussian(const double mean = 0, const double stdev = 1) {
        boost::random::normal_distribution<double> dist(mean, stdev);
        mut.lock();
        const double result = dist(real_rng);
        mut.unlock();
        return result;
      }

      //! Gamma draw with mean shape * scale
      double gamma(const double shape, const double scale) {
        boost::random::gamma_distribution<double> dist(shape, scale);
        mut.lock();
        const double result = dist(real_rng);
        mut.unlock();
        return result;
      }

      double chi_squared(const double df) {
        boost::random::chi_squared_distribution<double> dist(df);
        mut.lock();
        const double result = dist(real_rng);
        mut.unlock();
        return result;
      }

      //! A number for seeding a child generator
      size_t seed_value() {
        mut.lock();
        const size_t result = size_t(discrete_rng());
        mut.unlock();
        return result;
      }

    private:
      real_rng_type real_rng;
      discrete_rng_type discrete_rng;
      mutex mut;

      generator(const generator&);
      generator& operator=(const generator&);
    };

  } // end of random
} // end of bptf

#endif
