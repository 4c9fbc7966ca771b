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


#ifndef BPTF_PTHREAD_TOOLS_HPP
#define BPTF_PTHREAD_TOOLS_HPP

#include <pthread.h>
#include <boost/function.hpp>
#include <bptf/logger/assertions.hpp>

namespace bptf {

  /// Non-copyable pthread mutex
  class mutex {
  public:
    mutex() { ASSERT_EQ(pthread_mutex_init(&m_mut, NULL), 0); }
    ~mutex() { pthread_mutex_destroy(&m_mut); }
    void lock() const { ASSERT_EQ(pthread_mutex_lock(&m_mut), 0); }
    void unlock() const { ASSERT_EQ(pthread_mutex_unlock(&m_mut), 0); }
  private:
    friend class conditional;
    mutable pthread_mutex_t m_mut;
    mutex(const mutex&);
    mutex& operator=(const mutex&);
  };


  /// Condition variable waited on with a locked bptf::mutex
  class conditional {
  public:
    conditional() { ASSERT_EQ(pthread_cond_init(&m_cond, NULL), 0); }
    ~conditional() { pthread_cond_destroy(&m_cond); }
    void wait(const mutex& mut) const {
      ASSERT_EQ(pthread_cond_wait(&m_cond, &mut.m_mut), 0);
    }
    void signal() const { ASSERT_EQ(pthread_cond_signal(&m_cond), 0); }
    void broadcast() const { ASSERT_EQ(pthread_cond_broadcast(&m_cond), 0); }
  private:
    mutable pthread_cond_t m_cond;
    conditional(const conditional&);
    conditional& operator=(const conditional&);
  };


  /**
   * A joinable worker thread. The routine must not throw: thread_pool
   * catches range failures itself and hands them to its caller.
   */
  class thread {
  public:
    thread() : m_started(false) { }

    /// Starts routine on a new thread. Failing to create it is fatal
    void launch(const boost::function<void (void)>& routine);

    /// Waits for the routine to return. Does nothing if never launched
    void join();

  private:
    static void* run_routine(void* routine);

    pthread_t m_handle;
    bool m_started;
  };

} // namespace bptf
#endif
