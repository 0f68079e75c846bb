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

#ifndef __BULWARK_ERROR_HPP__
#define __BULWARK_ERROR_HPP__

#include <ostream>
#include <string>

#include <stout/error.hpp>

namespace bulwark {

// Represents the errors that can be returned by the filesystem guards
// via a `Try` that has failed. The message always names the path
// involved and, where there is one, the underlying cause.
class FsError : public Error
{
public:
  enum Type
  {
    INVALID_PATH,                 // Wrongly relative or absolute input.
    DIRECTORY_CREATION_FAILED,    // mkdir failed; carries the cause.
    DIRECTORY_ATTRIBUTE_MISMATCH, // Wrong owner, mode, or not a directory.
    OPEN_FAILED,                  // Could not open a path for inspection.
    NOT_PROCFS                    // Filesystem type is not procfs.
  };

  FsError(Type _type, const std::string& _message)
    : Error(_message), type(_type) {}

  Type type;
};


std::ostream& operator<<(std::ostream& stream, const FsError::Type& type);

} // namespace bulwark {

#endif // __BULWARK_ERROR_HPP__
