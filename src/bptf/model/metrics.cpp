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
#include <limits>
#include <bptf/model/metrics.hpp>
#include <bptf/logger/assertions.hpp>

namespace bptf {

  double compute_mape(const std::vector<double>& truth,
                      const std::vector<double>& estimate) {
    ASSERT_EQ(truth.size(), estimate.size());
    if (truth.empty()) return std::numeric_limits<double>::quiet_NaN();
    double sum = 0;
    for (size_t k = 0; k < truth.size(); ++k) {
      sum += std::fabs(truth[k] - estimate[k]) / truth[k];
    }
    return sum / truth.size();
  }

  double compute_rmse(const std::vector<double>& truth,
                      const std::vector<double>& estimate) {
    ASSERT_EQ(truth.size(), estimate.size());
    if (truth.empty()) return std::numeric_limits<double>::quiet_NaN();
    double sum = 0;
    for (size_t k = 0; k < truth.size(); ++k) {
      const double diff = truth[k] - estimate[k];
      sum += diff * diff;
    }
    return std::sqrt(sum / truth.size());
  }

  std::vector<double> gather(const dense_tensor& tensor,
                             const std::vector<size_t>& positions) {
    std::vector<double> ret(positions.size());
    for (size_t k = 0; k < positions.size(); ++k) {
      ASSERT_LT(positions[k], tensor.size());
      ret[k] = tensor[positions[k]];
    }
    return ret;
  }

  error_metrics evaluate_positions(const dense_tensor& truth,
                                   const dense_tensor& estimate,
                                   const std::vector<size_t>& positions) {
    const std::vector<double> y = gather(truth, positions);
    const std::vector<double> yhat = gather(estimate, positions);
    error_metrics ret;
    ret.mape = compute_mape(y, yhat);
    ret.rmse = compute_rmse(y, yhat);
    return ret;
  }

} // end of namespace bptf
