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
#include <bptf/model/observed_tensor.hpp>
#include <bptf/logger/logger.hpp>

namespace bptf {

  const char* missing_convention_name(missing_convention convention) {
    return convention == MISSING_AS_NAN ? "nan" : "zero";
  }

  bool parse_missing_convention(const std::string& name,
                                missing_convention& convention) {
    if (name == "nan") convention = MISSING_AS_NAN;
    else if (name == "zero") convention = MISSING_AS_ZERO;
    else return false;
    return true;
  }

  bool is_missing(double value, missing_convention convention) {
    if (convention == MISSING_AS_NAN) return std::isnan(value);
    return value == 0;
  }

  observed_tensor make_observed_tensor(const dense_tensor& sparse,
                                       missing_convention convention) {
    observed_tensor ret;
    ret.values = dense_tensor(sparse.dim(0), sparse.dim(1), sparse.dim(2));
    ret.mask = dense_tensor(sparse.dim(0), sparse.dim(1), sparse.dim(2));
    for (size_t k = 0; k < sparse.size(); ++k) {
      if (!is_missing(sparse[k], convention)) {
        if (!std::isfinite(sparse[k])) {
          logstream(LOG_FATAL) << "Observed entry " << sparse[k]
                               << " at linear index " << k << " is not finite"
                               << " (missing-value convention: "
                               << missing_convention_name(convention) << ")"
                               << std::endl;
        }
        ret.values[k] = sparse[k];
        ret.mask[k] = 1;
        ++ret.num_observed;
      }
    }
    return ret;
  }

  std::vector<size_t> find_held_out(const dense_tensor& reference,
                                    const dense_tensor& sparse,
                                    missing_convention convention) {
    if (!reference.same_shape(sparse)) {
      logstream(LOG_FATAL) << "Reference tensor is " << reference.shape_string()
                           << " but the observed tensor is "
                           << sparse.shape_string() << std::endl;
    }
    std::vector<size_t> positions;
    for (size_t k = 0; k < reference.size(); ++k) {
      if (reference[k] != 0 && is_missing(sparse[k], convention)) {
        positions.push_back(k);
      }
    }
    return positions;
  }

} // end of namespace bptf
