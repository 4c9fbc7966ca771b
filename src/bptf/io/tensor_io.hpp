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

#ifndef BPTF_IO_TENSOR_IO_HPP
#define BPTF_IO_TENSOR_IO_HPP

#include <string>
#include <bptf/math/mathlayer.hpp>
#include <bptf/math/dense_tensor.hpp>

namespace bptf {

  /**
   * Reads a tensor in coordinate text format:
   * \verbatim
   % comment lines start with % or #
   d1 d2 d3 nnz
   i j t value        (nnz lines, 0-based indices)
   \endverbatim
   * Entries which are not listed are set to absent_value (0 for a
   * reference tensor, NaN or 0 for an observed tensor). A value may be
   * written as nan. Malformed input is fatal.
   */
  dense_tensor read_tensor(const std::string& filename, double absent_value);

  /**
   * Writes a tensor in the coordinate format read by read_tensor.
   * The first form lists every entry. The second leaves out the entries
   * equal to skip_value (the NaN entries when skip_value is NaN).
   */
  void write_tensor(const std::string& filename, const dense_tensor& tensor);
  void write_tensor(const std::string& filename, const dense_tensor& tensor,
                    double skip_value);

  /**
   * Reads a dense matrix: a "rows cols" line followed by rows lines of
   * cols values.
   */
  mat read_factor(const std::string& filename);

  void write_factor(const std::string& filename, const mat& factor);

} // end of namespace bptf

#endif
