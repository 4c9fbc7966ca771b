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
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <vector>
#include <limits>
#include <iomanip>
#include <bptf/io/tensor_io.hpp>
#include <bptf/logger/logger.hpp>

namespace bptf {

  namespace {

    // Next line which is neither empty nor a comment. False at end of file.
    bool next_data_line(std::istream& in, std::string& line, size_t& lineno) {
      while (std::getline(in, line)) {
        ++lineno;
        const size_t first = line.find_first_not_of(" \t\r");
        if (first == std::string::npos) continue;
        if (line[first] == '%' || line[first] == '#') continue;
        return true;
      }
      return false;
    }

    // strtod accepts nan and inf, stream extraction does not
    bool parse_double(const std::string& token, double& value) {
      const char* begin = token.c_str();
      char* end = NULL;
      value = strtod(begin, &end);
      return end != begin && *end == '\0';
    }

    bool parse_index(const std::string& token, size_t& value) {
      const char* begin = token.c_str();
      char* end = NULL;
      if (token.empty() || token[0] == '-') return false;
      value = strtoul(begin, &end, 10);
      return end != begin && *end == '\0';
    }

    std::vector<std::string> tokenize(const std::string& line) {
      std::vector<std::string> tokens;
      std::istringstream strm(line);
      std::string token;
      while (strm >> token) tokens.push_back(token);
      return tokens;
    }

    void open_or_die(std::ifstream& fin, const std::string& filename) {
      fin.open(filename.c_str());
      if (!fin.good()) {
        logstream(LOG_FATAL) << "Cannot open " << filename << " for reading"
                             << std::endl;
      }
    }

    void open_or_die(std::ofstream& fout, const std::string& filename) {
      fout.open(filename.c_str());
      if (!fout.good()) {
        logstream(LOG_FATAL) << "Cannot open " << filename << " for writing"
                             << std::endl;
      }
      fout << std::setprecision(std::numeric_limits<double>::digits10 + 2);
    }
  }


  dense_tensor read_tensor(const std::string& filename, double absent_value) {
    std::ifstream fin;
    open_or_die(fin, filename);
    std::string line;
    size_t lineno = 0;
    if (!next_data_line(fin, line, lineno)) {
      logstream(LOG_FATAL) << filename << ": missing \"d1 d2 d3 nnz\" header"
                           << std::endl;
    }
    std::vector<std::string> tokens = tokenize(line);
    size_t header[4];
    if (tokens.size() != 4 ||
        !parse_index(tokens[0], header[0]) || !parse_index(tokens[1], header[1]) ||
        !parse_index(tokens[2], header[2]) || !parse_index(tokens[3], header[3])) {
      logstream(LOG_FATAL) << filename << ":" << lineno
                           << ": expected \"d1 d2 d3 nnz\", got \"" << line
                           << "\"" << std::endl;
    }
    dense_tensor tensor(header[0], header[1], header[2], absent_value);
    const size_t nnz = header[3];
    for (size_t k = 0; k < nnz; ++k) {
      if (!next_data_line(fin, line, lineno)) {
        logstream(LOG_FATAL) << filename << ": expected " << nnz
                             << " entries but found only " << k << std::endl;
      }
      tokens = tokenize(line);
      size_t i = 0, j = 0, t = 0;
      double value = 0;
      if (tokens.size() != 4 || !parse_index(tokens[0], i) ||
          !parse_index(tokens[1], j) || !parse_index(tokens[2], t) ||
          !parse_double(tokens[3], value)) {
        logstream(LOG_FATAL) << filename << ":" << lineno
                             << ": expected \"i j t value\", got \"" << line
                             << "\"" << std::endl;
      }
      if (i >= tensor.dim(0) || j >= tensor.dim(1) || t >= tensor.dim(2)) {
        logstream(LOG_FATAL) << filename << ":" << lineno << ": index ("
                             << i << ", " << j << ", " << t
                             << ") outside of a " << tensor.shape_string()
                             << " tensor" << std::endl;
      }
      tensor(i, j, t) = value;
    }
    logstream(LOG_INFO) << "Read " << tensor.shape_string() << " tensor with "
                        << nnz << " entries from " << filename << std::endl;
    return tensor;
  }


  void write_tensor(const std::string& filename, const dense_tensor& tensor) {
    std::ofstream fout;
    open_or_die(fout, filename);
    fout << tensor.dim(0) << " " << tensor.dim(1) << " " << tensor.dim(2)
         << " " << tensor.size() << "\n";
    for (size_t t = 0; t < tensor.dim(2); ++t)
      for (size_t j = 0; j < tensor.dim(1); ++j)
        for (size_t i = 0; i < tensor.dim(0); ++i)
          fout << i << " " << j << " " << t << " " << tensor(i, j, t) << "\n";
    if (!fout.good()) {
      logstream(LOG_FATAL) << "Failed writing " << filename << std::endl;
    }
  }


  void write_tensor(const std::string& filename, const dense_tensor& tensor,
                    double skip_value) {
    const bool skip_nan = std::isnan(skip_value);
    size_t nnz = 0;
    for (size_t k = 0; k < tensor.size(); ++k) {
      const bool skip = skip_nan ? std::isnan(tensor[k]) : tensor[k] == skip_value;
      if (!skip) ++nnz;
    }
    std::ofstream fout;
    open_or_die(fout, filename);
    fout << tensor.dim(0) << " " << tensor.dim(1) << " " << tensor.dim(2)
         << " " << nnz << "\n";
    for (size_t t = 0; t < tensor.dim(2); ++t) {
      for (size_t j = 0; j < tensor.dim(1); ++j) {
        for (size_t i = 0; i < tensor.dim(0); ++i) {
          const double value = tensor(i, j, t);
          const bool skip = skip_nan ? std::isnan(value) : value == skip_value;
          if (!skip) fout << i << " " << j << " " << t << " " << value << "\n";
        }
      }
    }
    if (!fout.good()) {
      logstream(LOG_FATAL) << "Failed writing " << filename << std::endl;
    }
  }


  mat read_factor(const std::string& filename) {
    std::ifstream fin;
    open_or_die(fin, filename);
    std::string line;
    size_t lineno = 0;
    size_t rows = 0, cols = 0;
    std::vector<std::string> tokens;
    if (!next_data_line(fin, line, lineno) ||
        (tokens = tokenize(line)).size() != 2 ||
        !parse_index(tokens[0], rows) || !parse_index(tokens[1], cols)) {
      logstream(LOG_FATAL) << filename << ": expected a \"rows cols\" header"
                           << std::endl;
    }
    mat factor(rows, cols);
    for (size_t r = 0; r < rows; ++r) {
      if (!next_data_line(fin, line, lineno)) {
        logstream(LOG_FATAL) << filename << ": expected " << rows
                             << " rows but found only " << r << std::endl;
      }
      tokens = tokenize(line);
      if (tokens.size() != cols) {
        logstream(LOG_FATAL) << filename << ":" << lineno << ": expected "
                             << cols << " values, got " << tokens.size()
                             << std::endl;
      }
      for (size_t c = 0; c < cols; ++c) {
        double value = 0;
        if (!parse_double(tokens[c], value)) {
          logstream(LOG_FATAL) << filename << ":" << lineno
                               << ": not a number: " << tokens[c] << std::endl;
        }
        factor(r, c) = value;
      }
    }
    return factor;
  }


  void write_factor(const std::string& filename, const mat& factor) {
    std::ofstream fout;
    open_or_die(fout, filename);
    fout << factor.rows() << " " << factor.cols() << "\n";
    for (int r = 0; r < factor.rows(); ++r) {
      for (int c = 0; c < factor.cols(); ++c) {
        if (c > 0) fout << " ";
        fout << factor(r, c);
      }
      fout << "\n";
    }
    if (!fout.good()) {
      logstream(LOG_FATAL) << "Failed writing " << filename << std::endl;
    }
  }

} // end of namespace bptf
