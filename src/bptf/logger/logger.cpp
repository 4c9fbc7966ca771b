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
#include <iostream>
#include <bptf/logger/logger.hpp>

namespace {
  const char* level_tags[] = { "DEBUG:    ",
                               "INFO:     ",
                               "WARNING:  ",
                               "ERROR:    ",
                               "FATAL:    " };

  // bold red for errors, bold green for warnings
  const char* console_color(int level) {
    if (level >= LOG_ERROR) return "\033[1;31m";
    if (level == LOG_WARNING) return "\033[1;32m";
    return NULL;
  }
}

log_sink& global_logger() {
  static log_sink sink;
  return sink;
}


log_sink::log_sink() : to_console(true), min_level(LOG_INFO) {
  pthread_mutex_init(&mut, NULL);
}

log_sink::~log_sink() {
  if (fout.is_open()) fout.close();
  pthread_mutex_destroy(&mut);
}

bool log_sink::set_log_file(const std::string& file) {
  pthread_mutex_lock(&mut);
  if (fout.is_open()) fout.close();
  fout.clear();
  bool opened = true;
  if (!file.empty()) {
    fout.open(file.c_str(), std::ios::out | std::ios::trunc);
    opened = fout.is_open();
  }
  pthread_mutex_unlock(&mut);
  return opened;
}

void log_sink::write(int level, const std::string& line) {
  pthread_mutex_lock(&mut);
  if (fout.is_open()) {
    fout << line;
    fout.flush();
  }
  if (to_console) {
#ifdef COLOROUTPUT
    const char* color = console_color(level);
    if (color != NULL) std::cerr << color << line << "\033[0m";
    else std::cerr << line;
#else
    std::cerr << line;
#endif
  }
  pthread_mutex_unlock(&mut);
}


log_line::log_line(int lvl, const char* file, const char* function, int line)
  : level(lvl), active(global_logger().accepts(lvl)) {
  if (!active) return;
  const char* slash = strrchr(file, '/');
  if (slash != NULL) file = slash + 1;
  buffer << level_tags[level] << file << "(" << function << ":" << line << "): ";
}

log_line::~log_line() {
  if (active && buffer.tellp() > 0) {
    buffer << "\n";
    global_logger().write(level, buffer.str());
  }
}

void log_line::finish() {
  buffer << "\n";
  global_logger().write(level, buffer.str());
  buffer.str("");
  active = false;
}

log_line& log_line::operator<<(std::ostream& (*manip)(std::ostream&)) {
  typedef std::ostream& (*manip_type)(std::ostream&);
  if (manip != manip_type(std::endl)) {
    if (active) manip(buffer);
    return *this;
  }
  if (active) finish();
  if (level == LOG_FATAL) {
    write_back_trace();
    throw "log fatal";
  }
  return *this;
}
