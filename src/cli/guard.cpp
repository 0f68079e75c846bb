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
#include <unistd.h>

#include <string>

#include <glog/logging.h>

#include <stout/nothing.hpp>

#include <bulwark/directory.hpp>
#include <bulwark/error.hpp>
#include <bulwark/paths.hpp>
#include <bulwark/procfs.hpp>

#include "cli/guard.hpp"

using std::endl;
using std::ostream;
using std::string;

namespace bulwark {
namespace internal {
namespace guard {

Flags::Flags()
{
  add(&Flags::procfs,
      "procfs",
      "Verify that the given path is backed by procfs");

  add(&Flags::directory,
      "directory",
      "Create the given directory if needed and verify its owner\n"
      "and mode (see --owner and --mode)");

  add(&Flags::owner,
      "owner",
      "Expected owner uid of --directory (defaults to the\n"
      "effective uid)");

  add(&Flags::mode,
      "mode",
      "Permission bits, in octal, that --directory must carry",
      "0755");

  add(&Flags::host_path,
      "host_path",
      "Print the given absolute host path relative to a container root");

  add(&Flags::rootfs,
      "rootfs",
      "Container root filesystem that --container_path is joined to");

  add(&Flags::container_path,
      "container_path",
      "Absolute path inside the container to print as a host path\n"
      "(requires --rootfs)");
}


Try<mode_t> parseMode(const string& value)
{
  if (value.empty()) {
    return Error("Mode is empty");
  }

  char* end = nullptr;
  unsigned long mode = ::strtoul(value.c_str(), &end, 8);
  if (*end != '\0' || value[0] == '-' || mode > 07777) {
    return Error("Invalid mode '" + value + "'");
  }

  return static_cast<mode_t>(mode);
}


Option<Error> validate(const Flags& flags)
{
  if (flags.container_path.isSome() && flags.rootfs.isNone()) {
    return Error("--container_path requires --rootfs");
  }

  if (flags.procfs.isNone() &&
      flags.directory.isNone() &&
      flags.host_path.isNone() &&
      flags.container_path.isNone()) {
    return Error("Nothing to do");
  }

  if (flags.directory.isSome()) {
    Try<mode_t> mode = parseMode(flags.mode);
    if (mode.isError()) {
      return Error(mode.error());
    }
  }

  return None();
}


static int fail(const FsError& error, ostream& err)
{
  LOG(ERROR) << error.type << ": " << error.message;
  err << error.message << endl;
  return EXIT_FAILURE;
}


int run(const Flags& flags, ostream& out, ostream& err)
{
  Option<Error> error = validate(flags);
  if (error.isSome()) {
    err << error->message << endl;
    return EXIT_FAILURE;
  }

  if (flags.procfs.isSome()) {
    Try<Nothing, FsError> ensure = procfs::ensure(flags.procfs.get());
    if (ensure.isError()) {
      return fail(ensure.error(), err);
    }

    LOG(INFO) << "'" << flags.procfs.get() << "' is on procfs";
  }

  if (flags.directory.isSome()) {
    // Already validated above.
    const mode_t mode = parseMode(flags.mode).get();

    const directory::Spec spec(
        flags.directory.get(),
        flags.owner.isSome() ? flags.owner.get() : ::geteuid(),
        mode);

    Try<Nothing, FsError> ensure = directory::ensure(spec);
    if (ensure.isError()) {
      return fail(ensure.error(), err);
    }

    LOG(INFO) << "Directory '" << spec.path << "' is owned by uid "
              << spec.owner << " and carries mode " << flags.mode;
  }

  if (flags.host_path.isSome()) {
    Try<string, FsError> relative =
      paths::toContainerRelative(flags.host_path.get());

    if (relative.isError()) {
      return fail(relative.error(), err);
    }

    out << relative.get() << endl;
  }

  if (flags.container_path.isSome()) {
    Try<string, FsError> joined =
      paths::joinAbsolute(flags.rootfs.get(), flags.container_path.get());

    if (joined.isError()) {
      return fail(joined.error(), err);
    }

    out << joined.get() << endl;
  }

  return EXIT_SUCCESS;
}

} // namespace guard {
} // namespace internal {
} // namespace bulwark {
