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


#include <iostream>
#include <bptf/util/command_line_options.hpp>

namespace bptf {

  namespace po = boost::program_options;

  void command_line_options::print_description() const {
    std::cout << desc << std::endl;
  }

  bool command_line_options::parse(int argc, const char* const* argv) {
    try {
      po::store(po::command_line_parser(argc, argv)
                .options(desc).positional(positional).run(), vm);
      po::notify(vm);
    }
    catch (const po::error& error) {
      std::cout << "Invalid syntax: " << error.what() << "\n" << std::endl;
      print_description();
      return false;
    }
    if (vm.count("help")) {
      print_description();
      return false;
    }
    return true;
  }

  bool command_line_options::is_set(const std::string& name) const {
    const po::variables_map::const_iterator it = vm.find(name);
    return it != vm.end() && !it->second.defaulted();
  }

}
