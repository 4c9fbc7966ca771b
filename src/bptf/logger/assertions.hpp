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

// Assertion macros in the spirit of the Google logging CHECK macros.
// A failed assertion logs the condition, writes a back trace and throws
// the C string "assertion failure", which thread_pool::run_ranges forwards
// to its caller.

#ifndef BPTF_LOGGER_ASSERTIONS_HPP
#define BPTF_LOGGER_ASSERTIONS_HPP

#include <iostream>
#include <bptf/logger/logger.hpp>

#define BPTF_ASSERTION_FAILED()                 \
  do {                                          \
    write_back_trace();                         \
    throw("assertion failure");                 \
  } while(0)

#define ASSERT_TRUE(condition)                                          \
  do {                                                                  \
    if (__builtin_expect(!(condition), 0)) {                            \
      logstream(LOG_ERROR) << "Check failed: " << #condition            \
                           << std::endl;                                \
      BPTF_ASSERTION_FAILED();                                          \
    }                                                                   \
  } while(0)

#define ASSERT_FALSE(condition) ASSERT_TRUE(!(condition))

#define BPTF_ASSERT_OP(op, val1, val2)                                  \
  do {                                                                  \
    const __typeof__(val1) _bptf_v1 = (val1);                           \
    const __typeof__(val2) _bptf_v2 = (val2);                           \
    if (__builtin_expect(!(_bptf_v1 op _bptf_v2), 0)) {                 \
      logstream(LOG_ERROR) << "Check failed: " << #val1 << " "          \
                           << #op << " " << #val2 << " ["               \
                           << _bptf_v1 << " " << #op << " "             \
                           << _bptf_v2 << "]" << std::endl;             \
      BPTF_ASSERTION_FAILED();                                          \
    }                                                                   \
  } while(0)

#define ASSERT_EQ(val1, val2) BPTF_ASSERT_OP(==, val1, val2)
#define ASSERT_NE(val1, val2) BPTF_ASSERT_OP(!=, val1, val2)
#define ASSERT_LE(val1, val2) BPTF_ASSERT_OP(<=, val1, val2)
#define ASSERT_LT(val1, val2) BPTF_ASSERT_OP(<, val1, val2)
#define ASSERT_GE(val1, val2) BPTF_ASSERT_OP(>=, val1, val2)
#define ASSERT_GT(val1, val2) BPTF_ASSERT_OP(>, val1, val2)

#endif
