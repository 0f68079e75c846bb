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

#ifndef __BULWARK_UTILS_HPP__
#define __BULWARK_UTILS_HPP__

#include <string>

#include <stout/nothing.hpp>
#include <stout/option.hpp>
#include <stout/try.hpp>

#include <stout/os/int_fd.hpp>

namespace bulwark {
namespace utils {

// Returns the cgroups path to use for a container: the configured one
// if present, otherwise one named after the container.
std::string cgroupPath(
    const Option<std::string>& cgroupsPath,
    const std::string& containerId);


Try<Nothing> writeFile(const std::string& path, const std::string& contents);


// Creates `path` and all missing parents.
Try<Nothing> createDirAll(const std::string& path);


// Opens `path` read-only with close-on-exec set. The caller owns the
// returned descriptor.
Try<int_fd> open(const std::string& path);

} // namespace utils {
} // namespace bulwark {

#endif // __BULWARK_UTILS_HPP__
