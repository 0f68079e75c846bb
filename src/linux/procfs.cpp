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

#include <glog/logging.h>

#include <stout/stringify.hpp>
#include <stout/try.hpp>

#include <stout/os/close.hpp>
#include <stout/os/open.hpp>

#include <bulwark/procfs.hpp>

#include "linux/fs.hpp"

using std::string;

namespace bulwark {
namespace procfs {

Try<Nothing, FsError> ensure(const string& path)
{
  Try<int_fd> fd = os::open(path, O_RDONLY | O_CLOEXEC);
  if (fd.isError()) {
    return FsError(
        FsError::OPEN_FAILED,
        "Failed to open '" + path + "': " + fd.error());
  }

  Try<Nothing, FsError> result = ensure(fd.get(), path);

  Try<Nothing> close = os::close(fd.get());
  if (close.isError()) {
    LOG(WARNING) << "Failed to close '" << path << "': " << close.error();
  }

  return result;
}


Try<Nothing, FsError> ensure(int_fd fd, const string& path)
{
  // NOTE: The type must come from the descriptor. Asking for the type
  // of `path` again would let a mount placed over it in the meantime
  // go unnoticed.
  Try<uint32_t> type = internal::fs::type(fd);
  if (type.isError()) {
    return FsError(
        FsError::NOT_PROCFS,
        "Failed to get the filesystem type of '" + path + "': " +
        type.error());
  }

  if (type.get() != FS_TYPE_PROC) {
    Try<string> name = internal::fs::typeName(type.get());

    return FsError(
        FsError::NOT_PROCFS,
        "'" + path + "' is not on procfs (filesystem type " +
        (name.isSome() ? name.get() : stringify(type.get())) + ")");
  }

  VLOG(2) << "Verified that '" << path << "' is on procfs";

  return Nothing();
}

} // namespace procfs {
} // namespace bulwark {
