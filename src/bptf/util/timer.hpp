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

#ifndef BPTF_TIMER_HPP
#define BPTF_TIMER_HPP

#include <sys/time.h>
#include <iostream>

namespace bptf {

  /**
   * \ingroup util
   * A simple class that can be used for
   * benchmarking/timing up to microsecond resolution.
   */
  class timer {
  private:
    timeval start_time_;
  public:
    timer() { start(); }

    //! Starts the timer.
    void start() { gettimeofday(&start_time_, NULL); }

    /**
     * Returns the number of seconds since start() was called.
     */
    double current_time() const {
      timeval current_time;
      gettimeofday(&current_time, NULL);
      double answer =
        (double)(current_time.tv_sec - start_time_.tv_sec) +
        ((double)(current_time.tv_usec - start_time_.tv_usec))/1.0E6;
       return answer;
    }
  }; // end of Timer

} // end of bptf namespace

/**
 * Convenience function. Allows you to call "cout << ti" where ti is
 * a timer object and it will print the number of seconds elapsed
 * since ti.start() was called.
 */
std::ostream&  operator<<(std::ostream& out, const bptf::timer& t);

#endif
