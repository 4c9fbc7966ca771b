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

#ifndef BPTF_MODEL_OBSERVED_TENSOR_HPP
#define BPTF_MODEL_OBSERVED_TENSOR_HPP

#include <string>
#include <vector>
#include <bptf/math/dense_tensor.hpp>

namespace bptf {

  /**
   * How missing entries are marked in an observed tensor.
   * MISSING_AS_NAN: missing entries are NaN, every other entry (zeros
   * included) is observed.
   * MISSING_AS_ZERO: missing entries are exactly zero, every nonzero
   * entry is observed.
   */
  enum missing_convention {
    MISSING_AS_NAN,
    MISSING_AS_ZERO
  };

  //! "nan" or "zero"
  const char* missing_convention_name(missing_convention convention);

  //! Parses "nan" or "zero". Returns false on any other string.
  bool parse_missing_convention(const std::string& name,
                                missing_convention& convention);

  //! True if the entry counts as missing under the convention
  bool is_missing(double value, missing_convention convention);

  /**
   * The observed tensor in the form the samplers consume: a zero filled
   * value tensor and a 0/1 mask, both constant for the run.
   */
  struct observed_tensor {
    dense_tensor values;
    dense_tensor mask;
    size_t num_observed;
    observed_tensor() : num_observed(0) { }
  };

  //! Converts a sparse tensor into zero filled values plus mask.
  //! A non-finite observed entry is fatal.
  observed_tensor make_observed_tensor(const dense_tensor& sparse,
                                       missing_convention convention);

  /**
   * Linear indices of the held-out positions: the reference is nonzero
   * there and the sparse tensor is missing there. Shapes must match.
   */
  std::vector<size_t> find_held_out(const dense_tensor& reference,
                                    const dense_tensor& sparse,
                                    missing_convention convention);

} // end of namespace bptf

#endif
