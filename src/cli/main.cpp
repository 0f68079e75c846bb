// Licensed to the Apache Software Foundation (ASF) under one
// or more contributor license agreements.  See the NOTICE file
// distributed with this work for additional information
// regarding copyright ownership.  The ASF licenses this file
// to you under the Apache License, Version 2.0 (the
// "License"); you may not use this file except in compliance
// with the License.  You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include <stdlib.h>

#include <iostream>
#include <string>

#include <stout/flags.hpp>
#include <stout/foreach.hpp>
#include <stout/none.hpp>
#include <stout/option.hpp>
#include <stout/path.hpp>
#include <stout/try.hpp>

#include "cli/guard.hpp"

#include "logging/logging.hpp"

using namespace bulwark::internal;

using std::cerr;
using std::cout;
using std::endl;


int main(int argc, char** argv)
{
  guard::Flags flags;
  flags.setUsageMessage("Usage: " + Path(argv[0]).basename() + " [options]");

  // Load flags from environment and command line.
  Try<flags::Warnings> load = flags.load("BULWARK_", argc, argv);

  if (flags.help) {
    cout << flags.usage() << endl;
    return EXIT_SUCCESS;
  }

  if (load.isError()) {
    cerr << flags.usage(load.error()) << endl;
    return EXIT_FAILURE;
  }

  Option<Error> error = guard::validate(flags);
  if (error.isSome()) {
    cerr << flags.usage(error->message) << endl;
    return EXIT_FAILURE;
  }

  logging::initialize(argv[0], true, flags);

  // Log any flag warnings (after logging is initialized).
  foreach (const flags::Warning& warning, load->warnings) {
    LOG(WARNING) << warning.message;
  }

  return guard::run(flags, cout, cerr);
}
