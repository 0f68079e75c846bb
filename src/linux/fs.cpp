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

#include "linux/fs.hpp"

#include <sys/vfs.h>

#include <string>

#include <stout/error.hpp>
#include <stout/hashmap.hpp>
#include <stout/stringify.hpp>

using std::string;

namespace bulwark {
namespace internal {
namespace fs {

Try<uint32_t> type(int_fd fd)
{
  struct statfs buf;
  if (::fstatfs(fd, &buf) < 0) {
    return ErrnoError();
  }
  return (uint32_t) buf.f_type;
}


Try<uint32_t> type(const string& path)
{
  struct statfs buf;
  if (::statfs(path.c_str(), &buf) < 0) {
    return ErrnoError();
  }
  return (uint32_t) buf.f_type;
}


Try<string> typeName(uint32_t fsType)
{
  // `typeNames` maps a filesystem id to its filesystem type name.
  hashmap<uint32_t, string> typeNames = {
    {FS_TYPE_AUFS      , "aufs"},
    {FS_TYPE_BTRFS     , "btrfs"},
    {FS_TYPE_CGROUP    , "cgroup"},
    {FS_TYPE_CGROUP2   , "cgroup2"},
    {FS_TYPE_DEVPTS    , "devpts"},
    {FS_TYPE_EXTFS     , "extfs"},
    {FS_TYPE_FUSE      , "fuse"},
    {FS_TYPE_NFSFS     , "nfsfs"},
    {FS_TYPE_OVERLAY   , "overlay"},
    {FS_TYPE_PROC      , "proc"},
    {FS_TYPE_RAMFS     , "ramfs"},
    {FS_TYPE_SQUASHFS  , "squashfs"},
    {FS_TYPE_SYSFS     , "sysfs"},
    {FS_TYPE_TMPFS     , "tmpfs"},
    {FS_TYPE_XFS       , "xfs"},
    {FS_TYPE_ZFS       , "zfs"}
  };

  if (!typeNames.contains(fsType)) {
    return Error("Unexpected filesystem type '" + stringify(fsType) + "'");
  }

  return typeNames[fsType];
}

} // namespace fs {
} // namespace internal {
} // namespace bulwark {
