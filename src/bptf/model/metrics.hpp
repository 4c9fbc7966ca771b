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

#ifndef BPTF_MODEL_METRICS_HPP
#define BPTF_MODEL_METRICS_HPP

#include <vector>
#include <bptf/math/dense_tensor.hpp>

namespace bptf {

  struct error_metrics {
    double mape;
    double rmse;
  };

  //! mean(|truth - estimate| / truth). NaN for empty input.
  double compute_mape(const std::vector<double>& truth,
                      const std::vector<double>& estimate);

  //! sqrt(mean((truth - estimate)^2)). NaN for empty input.
  double compute_rmse(const std::vector<double>& truth,
                      const std::vector<double>& estimate);

  //! Values of a tensor at the given linear indices
  std::vector<double> gather(const dense_tensor& tensor,
                             const std::vector<size_t>& positions);

  //! MAPE and RMSE of estimate against truth over the given positions
  error_metrics evaluate_positions(const dense_tensor& truth,
                                   const dense_tensor& estimate,
                                   const std::vector<size_t>& positions);

} // end of namespace bptf

#endif
