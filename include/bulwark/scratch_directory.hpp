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

#ifndef __BULWARK_SCRATCH_DIRECTORY_HPP__
#define __BULWARK_SCRATCH_DIRECTORY_HPP__

#include <string>

#include <process/owned.hpp>

#include <stout/option.hpp>
#include <stout/try.hpp>

#include <bulwark/error.hpp>

namespace bulwark {

// Owns a directory tree on disk for the lifetime of the object. The
// directory is created by `create` and removed (recursively) either by
// an explicit call to `remove` or when the object is destroyed,
// whichever comes first. Nothing else may delete the tree while it is
// owned. Not thread-safe.
class ScratchDirectory
{
public:
  // Creates `path` and any missing parents.
  static Try<process::Owned<ScratchDirectory>, FsError> create(
      const std::string& path);

  ~ScratchDirectory();

  // Returns the owned path. It is a fatal error to call this after the
  // directory has been removed.
  const std::string& path() const;

  // Removes the directory tree. Failures are logged and otherwise
  // ignored; calling this more than once is a no-op.
  void remove();

  bool removed() const { return path_.isNone(); }

private:
  explicit ScratchDirectory(const std::string& path);

  ScratchDirectory(const ScratchDirectory&) = delete;
  ScratchDirectory& operator=(const ScratchDirectory&) = delete;

  Option<std::string> path_;
};


// Creates a scratch directory named `name` under the system temporary
// directory, e.g. for a test fixture.
Try<process::Owned<ScratchDirectory>, FsError> createScratchDirectory(
    const std::string& name);

} // namespace bulwark {

#endif // __BULWARK_SCRATCH_DIRECTORY_HPP__
