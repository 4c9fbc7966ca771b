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


#ifndef BPTF_THREAD_POOL_HPP
#define BPTF_THREAD_POOL_HPP

#include <vector>
#include <boost/function.hpp>
#include <bptf/parallel/pthread_tools.hpp>

namespace bptf {

  /**
   * \ingroup util
   * A fixed set of worker threads that process the rows of a factor.
   *
   * run_ranges() splits [0, nitems) into at most size() contiguous
   * ranges and hands one range at a time to each idle worker. It returns
   * once every range has finished. A const char* thrown by a range (a
   * LOG_FATAL line or a failed ASSERT) does not stop the other ranges: the
   * first one recorded is rethrown from run_ranges() and the others are
   * logged. The pool is reusable after a failure.
   *
   * run_ranges() may only be called from one thread at a time.
   */
  class thread_pool {
  public:
    typedef boost::function<void (size_t begin, size_t end)> range_function;

    /// Starts nthreads workers, or a single one if nthreads is 0
    explicit thread_pool(size_t nthreads);

    /// Stops and joins the workers
    ~thread_pool();

    size_t size() const { return workers.size(); }

    void run_ranges(size_t nitems, const range_function& body);

  private:
    void worker_loop();

    std::vector<thread> workers;

    // everything below is protected by mut
    mutex mut;
    conditional work_ready;
    conditional work_done;
    const range_function* current_body;
    size_t total_items;
    size_t range_length;
    size_t next_begin;
    size_t unfinished_ranges;
    std::vector<const char*> failures;
    bool stopping;

    thread_pool(const thread_pool&);
    thread_pool& operator=(const thread_pool&);
  };

}
#endif
