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

#include <unistd.h>

#include <string>

#include <gtest/gtest.h>

#include <process/owned.hpp>

#include <stout/gtest.hpp>
#include <stout/path.hpp>
#include <stout/stringify.hpp>
#include <stout/strings.hpp>
#include <stout/try.hpp>

#include <stout/os/exists.hpp>
#include <stout/os/mkdir.hpp>
#include <stout/os/read.hpp>
#include <stout/os/rmdir.hpp>
#include <stout/os/stat.hpp>
#include <stout/os/temp.hpp>
#include <stout/os/touch.hpp>
#include <stout/os/write.hpp>

#include <stout/tests/utils.hpp>

#include <bulwark/error.hpp>
#include <bulwark/scratch_directory.hpp>

using process::Owned;

using std::string;

namespace bulwark {
namespace internal {
namespace tests {

class ScratchDirectoryTest : public TemporaryDirectoryTest {};


TEST_F(ScratchDirectoryTest, Create)
{
  const string path = path::join(sandbox.get(), "staging", "rootfs");

  Try<Owned<ScratchDirectory>, FsError> scratch =
    ScratchDirectory::create(path);

  ASSERT_FALSE(scratch.isError()) << scratch.error().message;

  EXPECT_EQ(path, scratch.get()->path());
  EXPECT_FALSE(scratch.get()->removed());
  EXPECT_TRUE(os::stat::isdir(path));
}


TEST_F(ScratchDirectoryTest, CreateExisting)
{
  const string path = path::join(sandbox.get(), "existing");
  ASSERT_SOME(os::mkdir(path));

  Try<Owned<ScratchDirectory>, FsError> scratch =
    ScratchDirectory::create(path);

  ASSERT_FALSE(scratch.isError()) << scratch.error().message;
  EXPECT_TRUE(os::stat::isdir(path));
}


TEST_F(ScratchDirectoryTest, CreateFailure)
{
  const string file = path::join(sandbox.get(), "file");
  ASSERT_SOME(os::touch(file));

  Try<Owned<ScratchDirectory>, FsError> scratch =
    ScratchDirectory::create(path::join(file, "scratch"));

  ASSERT_TRUE(scratch.isError());
  EXPECT_EQ(FsError::DIRECTORY_CREATION_FAILED, scratch.error().type);
}


// A regular file at the path must be neither adopted nor deleted.
TEST_F(ScratchDirectoryTest, CreateOverRegularFile)
{
  const string file = path::join(sandbox.get(), "file");
  ASSERT_SOME(os::write(file, "data"));

  {
    Try<Owned<ScratchDirectory>, FsError> scratch =
      ScratchDirectory::create(file);

    ASSERT_TRUE(scratch.isError());
    EXPECT_EQ(FsError::DIRECTORY_CREATION_FAILED, scratch.error().type);
    EXPECT_TRUE(strings::contains(scratch.error().message, file))
      << scratch.error().message;
  }

  EXPECT_SOME_EQ("data", os::read(file));
}


TEST_F(ScratchDirectoryTest, Remove)
{
  const string path = path::join(sandbox.get(), "scratch");

  Try<Owned<ScratchDirectory>, FsError> scratch =
    ScratchDirectory::create(path);

  ASSERT_FALSE(scratch.isError()) << scratch.error().message;

  ASSERT_SOME(os::mkdir(path::join(path, "a", "b")));
  ASSERT_SOME(os::write(path::join(path, "a", "b", "file"), "data"));

  scratch.get()->remove();

  EXPECT_TRUE(scratch.get()->removed());
  EXPECT_FALSE(os::exists(path));

  // Removing again is a no-op.
  scratch.get()->remove();

  EXPECT_TRUE(scratch.get()->removed());
}


TEST_F(ScratchDirectoryTest, RemovedOnDestruction)
{
  const string path = path::join(sandbox.get(), "scratch");

  {
    Try<Owned<ScratchDirectory>, FsError> scratch =
      ScratchDirectory::create(path);

    ASSERT_FALSE(scratch.isError()) << scratch.error().message;
    ASSERT_TRUE(os::stat::isdir(path));
  }

  EXPECT_FALSE(os::exists(path));
}


TEST_F(ScratchDirectoryTest, DestructionAfterRemove)
{
  const string path = path::join(sandbox.get(), "scratch");

  {
    Try<Owned<ScratchDirectory>, FsError> scratch =
      ScratchDirectory::create(path);

    ASSERT_FALSE(scratch.isError()) << scratch.error().message;

    scratch.get()->remove();

    // Somebody else is free to use the path once it has been removed.
    ASSERT_SOME(os::mkdir(path));
  }

  EXPECT_TRUE(os::stat::isdir(path));
}


TEST_F(ScratchDirectoryTest, RemoveToleratesMissingDirectory)
{
  const string path = path::join(sandbox.get(), "scratch");

  Try<Owned<ScratchDirectory>, FsError> scratch =
    ScratchDirectory::create(path);

  ASSERT_FALSE(scratch.isError()) << scratch.error().message;

  ASSERT_SOME(os::rmdir(path));

  scratch.get()->remove();

  EXPECT_TRUE(scratch.get()->removed());
}


TEST_F(ScratchDirectoryTest, PathAfterRemove)
{
  Try<Owned<ScratchDirectory>, FsError> scratch =
    ScratchDirectory::create(path::join(sandbox.get(), "scratch"));

  ASSERT_FALSE(scratch.isError()) << scratch.error().message;

  scratch.get()->remove();

  EXPECT_DEATH(scratch.get()->path(), "already been removed");
}


TEST_F(ScratchDirectoryTest, CreateScratchDirectory)
{
  const string name = "ScratchDirectoryTest-" + stringify(::getpid());
  const string path = path::join(os::temp(), name);

  {
    Try<Owned<ScratchDirectory>, FsError> scratch =
      createScratchDirectory(name);

    ASSERT_FALSE(scratch.isError()) << scratch.error().message;

    EXPECT_EQ(path, scratch.get()->path());
    EXPECT_TRUE(os::stat::isdir(path));
  }

  EXPECT_FALSE(os::exists(path));
}

} // namespace tests {
} // namespace internal {
} // namespace bulwark {
