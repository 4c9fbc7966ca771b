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


#include <execinfo.h>
#include <cxxabi.h>
#include <pthread.h>
#include <unistd.h>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <string>

namespace {

  /** backtrace_symbols gives "binary(mangled+offset) [address]". Returns
   * the frame with the mangled name replaced by its demangled form. */
  std::string readable_frame(const char* frame) {
    const std::string text(frame);
    const size_t open = text.find('(');
    const size_t plus = text.find('+', open);
    if (open == std::string::npos || plus == std::string::npos || plus == open + 1) {
      return text;
    }
    const std::string mangled = text.substr(open + 1, plus - open - 1);
    int status = 0;
    char* name = abi::__cxa_demangle(mangled.c_str(), NULL, NULL, &status);
    if (name == NULL) return text;
    const std::string result = text.substr(0, open + 1) + name + text.substr(plus);
    free(name);
    return result;
  }

  pthread_mutex_t trace_lock = PTHREAD_MUTEX_INITIALIZER;
  bool trace_started = false;

}

void write_back_trace() {
  void* frames[256];
  const int depth = backtrace(frames, 256);
  char** symbols = backtrace_symbols(frames, depth);
  if (symbols == NULL) return;

  std::ostringstream filename;
  filename << "backtrace." << getpid();

  pthread_mutex_lock(&trace_lock);
  // the first trace of a process replaces an older file with the same pid
  std::ofstream out(filename.str().c_str(),
                    trace_started ? std::ios::app : std::ios::trunc);
  if (out.is_open()) {
    trace_started = true;
    for (int i = 0; i < depth; ++i) out << readable_frame(symbols[i]) << "\n";
    out << "\n";
  }
  pthread_mutex_unlock(&trace_lock);
  free(symbols);
}
