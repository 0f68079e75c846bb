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

#ifndef __BULWARK_PATHS_HPP__
#define __BULWARK_PATHS_HPP__

#include <string>

#include <stout/try.hpp>

#include <bulwark/error.hpp>

namespace bulwark {
namespace paths {

// Converts an absolute host path into the equivalent path relative
// to a container root by stripping exactly the leading '/'. All other
// components, including trailing separators, are kept as-is.
// Returns an INVALID_PATH error for a relative (or empty) path.
Try<std::string, FsError> toContainerRelative(const std::string& hostPath);


// Prefixes `base` to `fragment` without reinterpreting `fragment`:
// no '..' collapsing and no symlink resolution happens here, callers
// that need containment must canonicalize the result separately.
// `fragment` must be absolute or empty (a no-op join); a non-empty
// relative fragment is rejected with an INVALID_PATH error.
//
// NOTE: When `base` ends with a separator and `fragment` starts with
// one, the result carries a single separator at the seam, e.g.
// joinAbsolute("rootfs/", "/etc") == "rootfs/etc".
Try<std::string, FsError> joinAbsolute(
    const std::string& base,
    const std::string& fragment);

} // namespace paths {
} // namespace bulwark {

#endif // __BULWARK_PATHS_HPP__
