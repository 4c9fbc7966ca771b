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

#ifndef BPTF_MASTER_INCLUDES
#define BPTF_MASTER_INCLUDES

#include <bptf/logger/logger.hpp>
#include <bptf/parallel/pthread_tools.hpp>
#include <bptf/parallel/thread_pool.hpp>
#include <bptf/util/timer.hpp>
#include <bptf/util/random.hpp>
#include <bptf/util/command_line_options.hpp>
#include <bptf/math/mathlayer.hpp>
#include <bptf/math/prob.hpp>
#include <bptf/math/dense_tensor.hpp>
#include <bptf/model/bptf_options.hpp>
#include <bptf/model/observed_tensor.hpp>
#include <bptf/model/gibbs_sampler.hpp>
#include <bptf/io/tensor_io.hpp>

#endif
