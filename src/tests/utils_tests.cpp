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

#include <gtest/gtest.h>

#include <stout/gtest.hpp>
#include <stout/none.hpp>
#include <stout/path.hpp>
#include <stout/strings.hpp>
#include <stout/try.hpp>

#include <stout/os/close.hpp>
#include <stout/os/read.hpp>
#include <stout/os/stat.hpp>

#include <stout/tests/utils.hpp>

#include <bulwark/utils.hpp>

using std::string;

namespace bulwark {
namespace internal {
namespace tests {

class UtilsTest : public TemporaryDirectoryTest {};


TEST_F(UtilsTest, CgroupPath)
{
  EXPECT_EQ(
      "sample_container_id",
      utils::cgroupPath(None(), "sample_container_id"));

  EXPECT_EQ(
      "/bulwark",
      utils::cgroupPath(string("/bulwark"), "sample_container_id"));
}


TEST_F(UtilsTest, WriteFile)
{
  const string path = path::join(sandbox.get(), "file");

  ASSERT_SOME(utils::writeFile(path, "first"));
  EXPECT_SOME_EQ("first", os::read(path));

  // Existing contents are replaced.
  ASSERT_SOME(utils::writeFile(path, "second"));
  EXPECT_SOME_EQ("second", os::read(path));

  EXPECT_ERROR(
      utils::writeFile(path::join(sandbox.get(), "missing", "file"), "data"));
}


TEST_F(UtilsTest, CreateDirAll)
{
  const string path = path::join(sandbox.get(), "a", "b", "c");

  ASSERT_SOME(utils::createDirAll(path));
  EXPECT_TRUE(os::stat::isdir(path));

  // Already existing is fine.
  EXPECT_SOME(utils::createDirAll(path));

  // An existing regular file is not.
  const string file = path::join(sandbox.get(), "file");
  ASSERT_SOME(utils::writeFile(file, "data"));

  Try<Nothing> createDirAll = utils::createDirAll(file);
  ASSERT_ERROR(createDirAll);
  EXPECT_TRUE(strings::contains(createDirAll.error(), "not a directory"));
  EXPECT_SOME_EQ("data", os::read(file));
}


TEST_F(UtilsTest, Open)
{
  const string path = path::join(sandbox.get(), "file");
  ASSERT_SOME(utils::writeFile(path, "data"));

  Try<int_fd> fd = utils::open(path);
  ASSERT_SOME(fd);
  EXPECT_SOME(os::close(fd.get()));

  Try<int_fd> missing = utils::open(path::join(sandbox.get(), "missing"));
  ASSERT_ERROR(missing);
  EXPECT_TRUE(strings::contains(missing.error(), "missing"));
}

} // namespace tests {
} // namespace internal {
} // namespace bulwark {
