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

#include <glog/logging.h>

#include <stout/check.hpp>
#include <stout/path.hpp>

#include <stout/os/mkdir.hpp>
#include <stout/os/rmdir.hpp>
#include <stout/os/stat.hpp>
#include <stout/os/temp.hpp>

#include <bulwark/scratch_directory.hpp>

using process::Owned;

using std::string;

namespace bulwark {

Try<Owned<ScratchDirectory>, FsError> ScratchDirectory::create(
    const string& path)
{
  Try<Nothing> mkdir = os::mkdir(path);
  if (mkdir.isError()) {
    return FsError(
        FsError::DIRECTORY_CREATION_FAILED,
        "Failed to create directory '" + path + "': " + mkdir.error());
  }

  // `os::mkdir` accepts anything already at `path`. Owning a regular
  // file would mean deleting it on removal.
  if (!os::stat::isdir(path)) {
    return FsError(
        FsError::DIRECTORY_CREATION_FAILED,
        "Failed to create directory '" + path + "': Path exists and is "
        "not a directory");
  }

  VLOG(1) << "Created scratch directory '" << path << "'";

  return Owned<ScratchDirectory>(new ScratchDirectory(path));
}


ScratchDirectory::ScratchDirectory(const string& path)
  : path_(path) {}


ScratchDirectory::~ScratchDirectory()
{
  remove();
}


const string& ScratchDirectory::path() const
{
  CHECK_SOME(path_) << "Scratch directory has already been removed";
  return path_.get();
}


void ScratchDirectory::remove()
{
  if (path_.isNone()) {
    return;
  }

  Try<Nothing> rmdir = os::rmdir(path_.get());
  if (rmdir.isError()) {
    LOG(WARNING) << "Failed to remove scratch directory '" << path_.get()
                 << "': " << rmdir.error();
  } else {
    VLOG(1) << "Removed scratch directory '" << path_.get() << "'";
  }

  path_ = None();
}


Try<Owned<ScratchDirectory>, FsError> createScratchDirectory(
    const string& name)
{
  return ScratchDirectory::create(path::join(os::temp(), name));
}

} // namespace bulwark {
