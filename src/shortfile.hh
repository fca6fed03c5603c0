/***************************************************************
 *
 * Copyright (C) 2024, Pelican Project, Morgridge Institute for Research
 *
 * Licensed under the Apache License, Version 2.0 (the "License"); you
 * may not use this file except in compliance with the License.  You may
 * obtain a copy of the License at
 *
 *    http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 *
 ***************************************************************/

#pragma once

#include <string>

// Read the entire (small) file into `contents`.  On failure, returns false
// and leaves errno set from the failing system call.
bool readShortFile(const std::string &fileName, std::string &contents);

// Write `contents` to the file, creating or truncating it.  `flags` are
// OR'd into the open(2) flags (e.g., O_EXCL).
bool writeShortFile(const std::string &fileName, const std::string &contents,
					int flags);
