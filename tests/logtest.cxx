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

#include <string>
#include <fstream>

#include <cxxtest/TestSuite.h>

#include <bptf/logger/logger.hpp>

namespace {
  std::string read_file(const std::string& fname) {
    std::ifstream fin(fname.c_str());
    return std::string((std::istreambuf_iterator<char>(fin)),
                       std::istreambuf_iterator<char>());
  }
}

class LogTestSuite: public CxxTest::TestSuite {
 public:
  void test_log_file_and_level() {
    global_logger().set_log_level(LOG_INFO);
    TS_ASSERT(global_logger().set_log_file("logtest.logger"));
    global_logger().set_log_to_console(false);
    logstream(LOG_INFO) << "sweep " << 3 << " only in the file" << std::endl;
    global_logger().set_log_to_console(true);
    logstream(LOG_WARNING) << "no held-out positions" << std::endl;
    logstream(LOG_DEBUG) << "below the log level, never printed" << std::endl;
    // a line without std::endl is written when the statement ends
    logstream(LOG_INFO) << "unterminated line";
    global_logger().set_log_file("");
    logstream(LOG_ERROR) << "console only" << std::endl;

    const std::string contents = read_file("logtest.logger");
    TS_ASSERT(contents.find("INFO:     logtest.cxx(") != std::string::npos);
    TS_ASSERT(contents.find("sweep 3 only in the file\n") != std::string::npos);
    TS_ASSERT(contents.find("WARNING:  ") != std::string::npos);
    TS_ASSERT(contents.find("unterminated line\n") != std::string::npos);
    TS_ASSERT(contents.find("never printed") == std::string::npos);
    TS_ASSERT(contents.find("console only") == std::string::npos);
  }

  void test_unopenable_log_file() {
    TS_ASSERT(!global_logger().set_log_file("no_such_directory/run.log"));
    TS_ASSERT(global_logger().set_log_file(""));
  }

  void test_fatal_throws() {
    TS_ASSERT_THROWS(logstream(LOG_FATAL) << "fatal stream " << 42 << std::endl,
                     const char*);
    // fatal lines throw even when the level filters everything else
    global_logger().set_log_level(LOG_FATAL);
    TS_ASSERT_THROWS(logstream(LOG_FATAL) << "still fatal" << std::endl,
                     const char*);
    global_logger().set_log_level(LOG_INFO);
    logstream(LOG_INFO) << "logging continues after a fatal line" << std::endl;
  }

  void test_assertions() {
    int i = 1;
    int j = 2;
    ASSERT_LT(i, j);
    ASSERT_LE(i, j);
    ASSERT_NE(i, j);
    std::string a = "abc";
    std::string b = "cde";
    ASSERT_EQ(a, a);
    ASSERT_NE(a, b);
    ASSERT_FALSE(i == j);
    TS_ASSERT_THROWS(ASSERT_GT(i, j), const char*);
    TS_ASSERT_THROWS(ASSERT_TRUE(i == j), const char*);
  }
};
