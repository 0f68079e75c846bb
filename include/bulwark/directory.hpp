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

#ifndef __BULWARK_DIRECTORY_HPP__
#define __BULWARK_DIRECTORY_HPP__

#include <sys/types.h>

#include <string>

#include <stout/nothing.hpp>
#include <stout/try.hpp>

#include <bulwark/error.hpp>

namespace bulwark {
namespace directory {

// Describes a directory that must exist with the given owner and at
// least the given permission bits.
// Every field must be given up front; there is no default owner or
// mode.
struct Spec
{
  Spec(const std::string& _path, uid_t _owner, mode_t _mode)
    : path(_path), owner(_owner), mode(_mode) {}

  std::string path;
  uid_t owner;
  mode_t mode;
};


// Creates `spec.path` (and any missing parents) if it does not exist,
// then re-reads its metadata from disk and verifies that it is a
// directory owned by `spec.owner` carrying every bit of `spec.mode`.
// Extra permission bits on an existing directory are tolerated, which
// also means this cannot be used to tighten a directory's permissions.
// The requested mode is only applied to the leaf; new parents get the
// default mode. The new leaf is subject to the process umask.
//
// This is a best-effort check: the directory may be replaced between
// creation and verification. Callers that need a hard guarantee should
// hold an open descriptor across both steps.
Try<Nothing, FsError> ensure(const Spec& spec);

} // namespace directory {
} // namespace bulwark {

#endif // __BULWARK_DIRECTORY_HPP__
