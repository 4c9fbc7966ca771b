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

#include <cmath>
#include <limits>

#include <cxxtest/TestSuite.h>

#include <bptf/model/observed_tensor.hpp>

using namespace bptf;

const double nan_value = std::numeric_limits<double>::quiet_NaN();

class ObservedTensorTestSuite : public CxxTest::TestSuite {
public:
  void test_parse_convention() {
    missing_convention c = MISSING_AS_ZERO;
    TS_ASSERT(parse_missing_convention("nan", c));
    TS_ASSERT_EQUALS(c, MISSING_AS_NAN);
    TS_ASSERT(parse_missing_convention("zero", c));
    TS_ASSERT_EQUALS(c, MISSING_AS_ZERO);
    TS_ASSERT(!parse_missing_convention("NaN ", c));
    TS_ASSERT_EQUALS(std::string(missing_convention_name(MISSING_AS_NAN)), "nan");
  }

  void test_nan_mask() {
    dense_tensor sparse(3, 1, 1);
    sparse[0] = 1.0;
    sparse[1] = nan_value;
    sparse[2] = 2.0;
    const observed_tensor obs = make_observed_tensor(sparse, MISSING_AS_NAN);
    TS_ASSERT_EQUALS(obs.num_observed, (size_t)2);
    TS_ASSERT_EQUALS(obs.mask[0], 1.0);
    TS_ASSERT_EQUALS(obs.mask[1], 0.0);
    TS_ASSERT_EQUALS(obs.mask[2], 1.0);
    TS_ASSERT_EQUALS(obs.values[0], 1.0);
    TS_ASSERT_EQUALS(obs.values[1], 0.0);
    TS_ASSERT_EQUALS(obs.values[2], 2.0);
  }

  void test_zero_mask() {
    dense_tensor sparse(3, 1, 1);
    sparse[0] = 1.0;
    sparse[1] = 0.0;
    sparse[2] = -2.0;
    const observed_tensor obs = make_observed_tensor(sparse, MISSING_AS_ZERO);
    TS_ASSERT_EQUALS(obs.num_observed, (size_t)2);
    TS_ASSERT_EQUALS(obs.mask[1], 0.0);
    TS_ASSERT_EQUALS(obs.values[2], -2.0);

    // under the nan convention an exact zero is an observation
    const observed_tensor obs_nan = make_observed_tensor(sparse, MISSING_AS_NAN);
    TS_ASSERT_EQUALS(obs_nan.num_observed, (size_t)3);
  }

  void test_nan_under_zero_convention_is_fatal() {
    dense_tensor sparse(2, 1, 1);
    sparse[0] = nan_value;
    TS_ASSERT_THROWS(make_observed_tensor(sparse, MISSING_AS_ZERO), const char*);
  }

  void test_infinite_observed_entry_is_fatal() {
    dense_tensor sparse(2, 1, 1);
    sparse[0] = 1.0;
    sparse[1] = std::numeric_limits<double>::infinity();
    TS_ASSERT_THROWS(make_observed_tensor(sparse, MISSING_AS_NAN), const char*);
    TS_ASSERT_THROWS(make_observed_tensor(sparse, MISSING_AS_ZERO), const char*);
  }

  void test_held_out() {
    // dense = [[1, 0], [2, 3]], sparse = [[1, nan], [2, 0]]
    dense_tensor dense(2, 2, 1), sparse(2, 2, 1);
    dense(0, 0, 0) = 1;  dense(0, 1, 0) = 0;
    dense(1, 0, 0) = 2;  dense(1, 1, 0) = 3;
    sparse(0, 0, 0) = 1; sparse(0, 1, 0) = nan_value;
    sparse(1, 0, 0) = 2; sparse(1, 1, 0) = 0;
    std::vector<size_t> held = find_held_out(dense, sparse, MISSING_AS_NAN);
    // read row-major, the dense value at the hidden position (0, 1) is 0, so
    // the hidden entry has no ground truth, and (1, 1) is observed
    TS_ASSERT(held.empty());

    // swap so that the hidden entry carries ground truth
    dense(0, 1, 0) = 3;  dense(1, 1, 0) = 0;
    held = find_held_out(dense, sparse, MISSING_AS_NAN);
    TS_ASSERT_EQUALS(held.size(), (size_t)1);
    TS_ASSERT_EQUALS(held[0], sparse.linear_index(0, 1, 0));
  }

  void test_held_out_zero_convention() {
    dense_tensor dense(2, 2, 1), sparse(2, 2, 1);
    dense(0, 0, 0) = 1;  dense(0, 1, 0) = 4;
    dense(1, 0, 0) = 2;  dense(1, 1, 0) = 0;
    sparse(0, 0, 0) = 1; sparse(0, 1, 0) = 0;
    sparse(1, 0, 0) = 2; sparse(1, 1, 0) = 0;
    const std::vector<size_t> held = find_held_out(dense, sparse, MISSING_AS_ZERO);
    TS_ASSERT_EQUALS(held.size(), (size_t)1);
    TS_ASSERT_EQUALS(held[0], sparse.linear_index(0, 1, 0));
  }

  void test_held_out_shape_mismatch() {
    TS_ASSERT_THROWS(find_held_out(dense_tensor(2, 2, 2), dense_tensor(2, 2, 3),
                                   MISSING_AS_NAN), const char*);
  }
};
