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


#ifndef BPTF_LOGGER_LOGGER_HPP
#define BPTF_LOGGER_LOGGER_HPP

#include <fstream>
#include <sstream>
#include <string>
#include <pthread.h>

/**
 * \def LOG_FATAL
 *   The run cannot continue. Ending the line throws "log fatal"
 * \def LOG_ERROR
 *   A failure the caller reports and recovers from
 * \def LOG_WARNING
 *   A degenerate but legal condition, e.g. no held-out entries
 * \def LOG_INFO
 *   Progress of a run
 * \def LOG_DEBUG
 *   Debugging purposes only
 */
#define LOG_FATAL 4
#define LOG_ERROR 3
#define LOG_WARNING 2
#define LOG_INFO 1
#define LOG_DEBUG 0

/**
 * \def logstream(lvl)
 *   Starts a log line tagged with the file, function and line of the
 *   call site. The line is written when std::endl is streamed into it.
 */
#define logstream(lvl) (log_line(lvl, __FILE__, __func__, __LINE__))

/** Appends a back trace of the calling thread to backtrace.<pid>.
    Defined in backtrace.cpp */
void write_back_trace();

/**
  Destination of every log line: stderr and, optionally, a file.
  Lines below the log level are dropped, except fatal ones.
*/
class log_sink {
 public:
  log_sink();
  ~log_sink();

  /** Closes the current log file and, if file is not empty, truncates
      and opens file for all later lines. Returns false if file cannot
      be opened. */
  bool set_log_file(const std::string& file);

  /// Lines go to stderr as well as the log file when consoleout is true
  void set_log_to_console(bool consoleout) { to_console = consoleout; }

  void set_log_level(int level) { min_level = level; }

  bool accepts(int level) const {
    return level == LOG_FATAL || (level >= LOG_DEBUG && level >= min_level);
  }

  /// Writes one complete line atomically
  void write(int level, const std::string& line);

 private:
  pthread_mutex_t mut;
  std::ofstream fout;
  bool to_console;
  int min_level;
};

log_sink& global_logger();

/**
  A single log statement. Each logstream() call builds its own
  log_line, so threads never share a buffer.
*/
class log_line {
 public:
  log_line(int level, const char* file, const char* function, int line);

  /// Flushes text that was never ended with std::endl
  ~log_line();

  template <typename T>
  log_line& operator<<(const T& value) {
    if (active) buffer << value;
    return *this;
  }

  /// std::endl writes the line. A fatal line then throws "log fatal"
  log_line& operator<<(std::ostream& (*manip)(std::ostream&));

 private:
  void finish();

  std::ostringstream buffer;
  int level;
  bool active;
};

#include <bptf/logger/assertions.hpp>

#endif
