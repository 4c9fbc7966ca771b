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
#include <fstream>
#include <limits>

#include <cxxtest/TestSuite.h>

#include <bptf/io/tensor_io.hpp>

using namespace bptf;

class TensorIOTestSuite : public CxxTest::TestSuite {
  void write_file(const std::string& filename, const std::string& contents) {
    std::ofstream fout(filename.c_str());
    fout << contents;
  }

public:
  void test_read_tensor() {
    write_file("tensor_io_test.tensor",
               "% a comment\n"
               "2 2 3 3\n"
               "0 0 0 1.5\n"
               "# another comment\n"
               "\n"
               "1 1 2 -2\n"
               "0 1 1 nan\n");
    const double nan_value = std::numeric_limits<double>::quiet_NaN();
    const dense_tensor T = read_tensor("tensor_io_test.tensor", nan_value);
    TS_ASSERT_EQUALS(T.dim(0), (size_t)2);
    TS_ASSERT_EQUALS(T.dim(1), (size_t)2);
    TS_ASSERT_EQUALS(T.dim(2), (size_t)3);
    TS_ASSERT_EQUALS(T(0, 0, 0), 1.5);
    TS_ASSERT_EQUALS(T(1, 1, 2), -2.0);
    TS_ASSERT(std::isnan(T(0, 1, 1)));
    TS_ASSERT(std::isnan(T(1, 0, 0)));

    const dense_tensor Z = read_tensor("tensor_io_test.tensor", 0.0);
    TS_ASSERT_EQUALS(Z(1, 0, 0), 0.0);
  }

  void test_write_then_read() {
    dense_tensor T(2, 3, 2);
    for (size_t k = 0; k < T.size(); ++k) T[k] = 0.1 * k + 1.0 / 3;
    T[4] = 0;
    write_tensor("tensor_io_test.dense", T);
    const dense_tensor dense = read_tensor("tensor_io_test.dense", -1.0);
    for (size_t k = 0; k < T.size(); ++k) TS_ASSERT_EQUALS(dense[k], T[k]);

    // zero entries are left out and come back as the absent value
    write_tensor("tensor_io_test.sparse", T, 0.0);
    const dense_tensor sparse = read_tensor("tensor_io_test.sparse", -1.0);
    TS_ASSERT_EQUALS(sparse[4], -1.0);
    TS_ASSERT_EQUALS(sparse[5], T[5]);
  }

  void test_factor_file() {
    mat F(3, 2);
    F << 1, 2.5,
         -3, 1e-10,
         0, 7;
    write_factor("tensor_io_test.factor", F);
    const mat G = read_factor("tensor_io_test.factor");
    TS_ASSERT_EQUALS(G.rows(), 3);
    TS_ASSERT_EQUALS(G.cols(), 2);
    TS_ASSERT_EQUALS((F - G).cwiseAbs().maxCoeff(), 0.0);
  }

  void test_malformed_files_are_fatal() {
    TS_ASSERT_THROWS(read_tensor("tensor_io_test.does_not_exist", 0.0), const char*);

    write_file("tensor_io_test.bad_header", "2 2\n");
    TS_ASSERT_THROWS(read_tensor("tensor_io_test.bad_header", 0.0), const char*);

    write_file("tensor_io_test.out_of_range", "2 2 2 1\n2 0 0 1\n");
    TS_ASSERT_THROWS(read_tensor("tensor_io_test.out_of_range", 0.0), const char*);

    write_file("tensor_io_test.short", "2 2 2 3\n0 0 0 1\n1 1 1 2\n");
    TS_ASSERT_THROWS(read_tensor("tensor_io_test.short", 0.0), const char*);

    write_file("tensor_io_test.bad_value", "2 2 2 1\n0 0 0 abc\n");
    TS_ASSERT_THROWS(read_tensor("tensor_io_test.bad_value", 0.0), const char*);

    write_file("tensor_io_test.bad_factor", "2 2\n1 2\n3\n");
    TS_ASSERT_THROWS(read_factor("tensor_io_test.bad_factor"), const char*);
  }
};
