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

#include <string>

#include <stout/path.hpp>
#include <stout/strings.hpp>

#include <bulwark/paths.hpp>

using std::string;

namespace bulwark {
namespace paths {

Try<string, FsError> toContainerRelative(const string& hostPath)
{
  if (!path::is_absolute(hostPath)) {
    return FsError(
        FsError::INVALID_PATH,
        "Relative path '" + hostPath + "' cannot be converted to a path "
        "in the container");
  }

  return hostPath.substr(1);
}


Try<string, FsError> joinAbsolute(const string& base, const string& fragment)
{
  if (!fragment.empty() && !path::is_absolute(fragment)) {
    return FsError(
        FsError::INVALID_PATH,
        "Cannot join '" + fragment + "' to '" + base + "' because it is "
        "not an absolute path");
  }

  if (strings::endsWith(base, "/") && strings::startsWith(fragment, "/")) {
    return base + fragment.substr(1);
  }

  return base + fragment;
}

} // namespace paths {
} // namespace bulwark {
