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

#include <errno.h>

#include <sys/stat.h>
#include <sys/types.h>

#include <iomanip>
#include <sstream>
#include <string>

#include <glog/logging.h>

#include <stout/error.hpp>
#include <stout/path.hpp>
#include <stout/stringify.hpp>

#include <stout/os/exists.hpp>
#include <stout/os/mkdir.hpp>

#include <bulwark/directory.hpp>

using std::string;

namespace bulwark {
namespace directory {

// Formats permission bits the way `ls` and `chmod` users read them.
static string octal(mode_t mode)
{
  std::ostringstream out;
  out << std::oct << std::setfill('0') << std::setw(4) << (mode & 07777);
  return out.str();
}


static Try<Nothing, FsError> create(const Spec& spec)
{
  // Parents are created with the default mode, only the leaf gets
  // `spec.mode`.
  const string parent = Path(spec.path).dirname();

  Try<Nothing> mkdir = os::mkdir(parent);
  if (mkdir.isError()) {
    return FsError(
        FsError::DIRECTORY_CREATION_FAILED,
        "Failed to create directory '" + spec.path + "': Failed to create "
        "parent directory '" + parent + "': " + mkdir.error());
  }

  // Somebody else creating the leaf first is not an error here, the
  // verification that follows decides whether it is acceptable.
  if (::mkdir(spec.path.c_str(), spec.mode) < 0) {
    if (errno != EEXIST) {
      return FsError(
          FsError::DIRECTORY_CREATION_FAILED,
          ErrnoError("Failed to create directory '" + spec.path + "'").message);
    }

    VLOG(1) << "Directory '" << spec.path << "' appeared before it could "
            << "be created";
  } else {
    VLOG(1) << "Created directory '" << spec.path << "' with mode "
            << octal(spec.mode);
  }

  return Nothing();
}


Try<Nothing, FsError> ensure(const Spec& spec)
{
  if (!os::exists(spec.path)) {
    Try<Nothing, FsError> created = create(spec);
    if (created.isError()) {
      return created.error();
    }
  }

  // Never trust what the creation above implies: the path may have
  // existed already, or may have been changed since.
  struct stat s;
  if (::stat(spec.path.c_str(), &s) < 0) {
    return FsError(
        FsError::DIRECTORY_ATTRIBUTE_MISMATCH,
        ErrnoError("Failed to get metadata for '" + spec.path + "'").message);
  }

  if (!S_ISDIR(s.st_mode)) {
    return FsError(
        FsError::DIRECTORY_ATTRIBUTE_MISMATCH,
        "'" + spec.path + "' is not a directory");
  }

  if (s.st_uid != spec.owner) {
    return FsError(
        FsError::DIRECTORY_ATTRIBUTE_MISMATCH,
        "Directory '" + spec.path + "' is owned by uid " +
        stringify(s.st_uid) + ", expected uid " + stringify(spec.owner));
  }

  if ((s.st_mode & spec.mode) != spec.mode) {
    return FsError(
        FsError::DIRECTORY_ATTRIBUTE_MISMATCH,
        "Directory '" + spec.path + "' has mode " + octal(s.st_mode) +
        " which does not include the expected mode " + octal(spec.mode));
  }

  return Nothing();
}

} // namespace directory {
} // namespace bulwark {
