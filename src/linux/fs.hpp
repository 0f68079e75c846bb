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

#ifndef __LINUX_FS_HPP__
#define __LINUX_FS_HPP__

#include <stdint.h>

#include <string>

#include <stout/try.hpp>

#include <stout/os/int_fd.hpp>

// Define FS_TYPE_* magic numbers for filesystem types.
// http://man7.org/linux/man-pages/man2/fstatfs64.2.html
#define FS_TYPE_AUFS 0x61756673
#define FS_TYPE_BTRFS 0x9123683E
#define FS_TYPE_CGROUP 0x0027e0eb
#define FS_TYPE_CGROUP2 0x63677270
#define FS_TYPE_DEVPTS 0x00001cd1
#define FS_TYPE_EXTFS 0x0000EF53
#define FS_TYPE_FUSE 0x65735546
#define FS_TYPE_NFSFS 0x00006969
#define FS_TYPE_OVERLAY 0x794C7630
#define FS_TYPE_PROC 0x00009fa0
#define FS_TYPE_RAMFS 0x858458f6
#define FS_TYPE_SQUASHFS 0x73717368
#define FS_TYPE_SYSFS 0x62656572
#define FS_TYPE_TMPFS 0x01021994
#define FS_TYPE_XFS 0x58465342
#define FS_TYPE_ZFS 0x2fc12fc1

namespace bulwark {
namespace internal {
namespace fs {

// Returns the filesystem type id of the filesystem containing the
// file referred to by an open descriptor.
Try<uint32_t> type(int_fd fd);


// Returns a filesystem type id, given a path. The path is resolved by
// name; use the descriptor variant when the answer must describe a
// file that is already open.
Try<uint32_t> type(const std::string& path);


// Returns the filesystem type name, given a filesystem type id.
Try<std::string> typeName(uint32_t fsType);

} // namespace fs {
} // namespace internal {
} // namespace bulwark {

#endif // __LINUX_FS_HPP__
