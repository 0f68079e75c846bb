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

#ifndef __CLI_GUARD_HPP__
#define __CLI_GUARD_HPP__

#include <sys/types.h>

#include <ostream>
#include <string>

#include <stout/error.hpp>
#include <stout/flags.hpp>
#include <stout/option.hpp>
#include <stout/try.hpp>

#include "logging/flags.hpp"

namespace bulwark {
namespace internal {
namespace guard {

class Flags : public virtual logging::Flags
{
public:
  Flags();

  Option<std::string> procfs;
  Option<std::string> directory;
  Option<uid_t> owner;
  std::string mode;
  Option<std::string> host_path;
  Option<std::string> rootfs;
  Option<std::string> container_path;
};


// Parses permission bits given in octal, e.g. "0755".
Try<mode_t> parseMode(const std::string& value);


// Returns an error if the flags do not name a runnable set of actions.
Option<Error> validate(const Flags& flags);


// Runs the requested actions in order (procfs, directory, host path,
// container path), writing results to `out` and failures to `err`.
// Stops at the first failure. Returns the process exit status.
int run(const Flags& flags, std::ostream& out, std::ostream& err);

} // namespace guard {
} // namespace internal {
} // namespace bulwark {

#endif // __CLI_GUARD_HPP__
