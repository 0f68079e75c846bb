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

#include <fcntl.h>

#include <string>

#include <stout/error.hpp>

#include <stout/os/mkdir.hpp>
#include <stout/os/open.hpp>
#include <stout/os/stat.hpp>
#include <stout/os/write.hpp>

#include <bulwark/utils.hpp>

using std::string;

namespace bulwark {
namespace utils {

string cgroupPath(
    const Option<string>& cgroupsPath,
    const string& containerId)
{
  if (cgroupsPath.isSome()) {
    return cgroupsPath.get();
  }

  return containerId;
}


Try<Nothing> writeFile(const string& path, const string& contents)
{
  Try<Nothing> write = os::write(path, contents);
  if (write.isError()) {
    return Error("Failed to write to '" + path + "': " + write.error());
  }

  return Nothing();
}


Try<Nothing> createDirAll(const string& path)
{
  Try<Nothing> mkdir = os::mkdir(path);
  if (mkdir.isError()) {
    return Error(
        "Failed to create directory '" + path + "': " + mkdir.error());
  }

  if (!os::stat::isdir(path)) {
    return Error(
        "Failed to create directory '" + path + "': Path exists and is "
        "not a directory");
  }

  return Nothing();
}


Try<int_fd> open(const string& path)
{
  Try<int_fd> fd = os::open(path, O_RDONLY | O_CLOEXEC);
  if (fd.isError()) {
    return Error("Failed to open '" + path + "': " + fd.error());
  }

  return fd;
}

} // namespace utils {
} // namespace bulwark {
