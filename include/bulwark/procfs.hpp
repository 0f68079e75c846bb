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

#ifndef __BULWARK_PROCFS_HPP__
#define __BULWARK_PROCFS_HPP__

#include <string>

#include <stout/nothing.hpp>
#include <stout/try.hpp>

#include <stout/os/int_fd.hpp>

#include <bulwark/error.hpp>

namespace bulwark {
namespace procfs {

// Verifies that `path` is backed by procfs and not by a filesystem
// mounted over it (see CVE-2019-16884). The path is opened once and
// the filesystem type is read from that descriptor; it is never
// resolved by name a second time. The result must not be cached:
// check immediately before trusting what is read from the path.
Try<Nothing, FsError> ensure(const std::string& path);


// Same as above for a descriptor the caller already holds and is about
// to use. `path` is only used for error messages.
Try<Nothing, FsError> ensure(int_fd fd, const std::string& path);

} // namespace procfs {
} // namespace bulwark {

#endif // __BULWARK_PROCFS_HPP__
