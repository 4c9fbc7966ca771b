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


#ifndef BPTF_COMMAND_LINE_OPTIONS
#define BPTF_COMMAND_LINE_OPTIONS

#include <string>
#include <boost/program_options.hpp>
#include <bptf/logger/assertions.hpp>

namespace bptf {

  /**
   * Thin layer over boost::program_options used by the tools. Options
   * are bound to variables which parse() fills in:
   *
   * \code
   *   bptf::command_line_options clopts("Tensor factorization");
   *   clopts.attach_option("observed", &observed_file, "observed tensor");
   *   clopts.add_positional("observed");
   *   clopts.attach_option("rank", &rank, rank, "latent rank");
   *   if (!clopts.parse(argc, argv)) return EXIT_FAILURE;
   * \endcode
   *
   * --help is always accepted.
   */
  class command_line_options {
  public:
    explicit command_line_options(const std::string& caption)
      : desc(caption) {
      desc.add_options()("help", "Print this help message.");
    }

    /// Prints the --help text to stdout
    void print_description() const;

    /// Binds an option without default. The variable must outlive parse()
    template<typename T>
    void attach_option(const std::string& name, T* target,
                       const std::string& help) {
      ASSERT_TRUE(target != NULL);
      desc.add_options()(name.c_str(),
                         boost::program_options::value<T>(target),
                         help.c_str());
    }

    /// Binds an option whose value is default_value unless given
    template<typename T>
    void attach_option(const std::string& name, T* target,
                       const T& default_value, const std::string& help) {
      ASSERT_TRUE(target != NULL);
      desc.add_options()(name.c_str(),
                         boost::program_options::value<T>(target)
                           ->default_value(default_value),
                         help.c_str());
    }

    /// The next bare argument on the command line fills this option
    void add_positional(const std::string& name) {
      positional.add(name.c_str(), 1);
    }

    /**
     * Parses the arguments into the attached variables. Prints the help
     * text and returns false on a syntax error or when --help is given.
     */
    bool parse(int argc, const char* const* argv);

    /// True if the user gave the option, as opposed to its default
    bool is_set(const std::string& name) const;

  private:
    boost::program_options::options_description desc;
    boost::program_options::positional_options_description positional;
    boost::program_options::variables_map vm;
  };

} // end namespace bptf

#endif
