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


#include <cstring>
#include <bptf/parallel/pthread_tools.hpp>

namespace bptf {

  void* thread::run_routine(void* routine) {
    boost::function<void (void)>* fn =
      static_cast<boost::function<void (void)>*>(routine);
    (*fn)();
    delete fn;
    return NULL;
  }

  void thread::launch(const boost::function<void (void)>& routine) {
    ASSERT_FALSE(m_started);
    boost::function<void (void)>* fn = new boost::function<void (void)>(routine);
    const int error = pthread_create(&m_handle, NULL, &thread::run_routine, fn);
    if (error != 0) {
      delete fn;
      logstream(LOG_FATAL) << "Cannot create a worker thread: "
                           << strerror(error) << std::endl;
    }
    m_started = true;
  }

  void thread::join() {
    if (!m_started) return;
    const int error = pthread_join(m_handle, NULL);
    if (error != 0) {
      logstream(LOG_ERROR) << "Cannot join a worker thread: "
                           << strerror(error) << std::endl;
    }
    m_started = false;
  }

} // namespace bptf
