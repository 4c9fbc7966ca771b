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


#include <algorithm>
#include <boost/bind.hpp>
#include <bptf/parallel/thread_pool.hpp>

namespace bptf {

  thread_pool::thread_pool(size_t nthreads)
    : workers(std::max<size_t>(nthreads, 1)),
      current_body(NULL), total_items(0), range_length(0),
      next_begin(0), unfinished_ranges(0), stopping(false) {
    for (size_t i = 0; i < workers.size(); ++i) {
      workers[i].launch(boost::bind(&thread_pool::worker_loop, this));
    }
  }


  thread_pool::~thread_pool() {
    mut.lock();
    stopping = true;
    work_ready.broadcast();
    mut.unlock();
    for (size_t i = 0; i < workers.size(); ++i) workers[i].join();
  }


  void thread_pool::worker_loop() {
    mut.lock();
    while (true) {
      while (!stopping && next_begin >= total_items) work_ready.wait(mut);
      if (stopping) break;
      const size_t begin = next_begin;
      const size_t end = std::min(total_items, begin + range_length);
      next_begin = end;
      const range_function& body = *current_body;
      mut.unlock();

      const char* failure = NULL;
      try {
        body(begin, end);
      }
      catch (const char* c) {
        failure = c;
      }

      mut.lock();
      if (failure != NULL) failures.push_back(failure);
      if (--unfinished_ranges == 0) work_done.signal();
    }
    mut.unlock();
  }


  void thread_pool::run_ranges(size_t nitems, const range_function& body) {
    if (nitems == 0) return;
    mut.lock();
    range_length = (nitems + workers.size() - 1) / workers.size();
    unfinished_ranges = (nitems + range_length - 1) / range_length;
    current_body = &body;
    next_begin = 0;
    total_items = nitems;
    work_ready.broadcast();
    while (unfinished_ranges > 0) work_done.wait(mut);
    total_items = 0;
    next_begin = 0;
    current_body = NULL;
    std::vector<const char*> raised;
    raised.swap(failures);
    mut.unlock();

    if (raised.empty()) return;
    for (size_t i = 1; i < raised.size(); ++i) {
      logstream(LOG_ERROR) << "Another row range also failed: " << raised[i]
                           << std::endl;
    }
    throw raised[0];
  }

}
