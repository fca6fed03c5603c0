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
#include <string_view>
#include <vector>

namespace AWSv4Impl {

// Size of a SHA-256 digest; also the size of a derived signing key.
constexpr size_t SHA256_LENGTH = 32;

// Percent-encode the input.  Letters, digits, '-', '_', '.' and '~' are
// never encoded; neither is any character in `extraSafe`.  All other bytes
// become %XY with uppercase hex digits.
std::string amazonURLEncode(std::string_view input,
							std::string_view extraSafe = "");

// Encode an object key for use as a path; '/' is left literal.
std::string pathEncode(std::string_view original);

void convertMessageDigestToLowercaseHex(const unsigned char *messageDigest,
										unsigned int mdLength,
										std::string &hexEncoded);

bool doSha256(std::string_view payload, unsigned char *messageDigest,
			  unsigned int *mdLength);

// One HMAC-SHA256 step; `messageDigest` must hold at least SHA256_LENGTH
// bytes.
bool doHmacSha256(const unsigned char *key, size_t keyLength,
				  std::string_view data, unsigned char *messageDigest,
				  unsigned int *mdLength);

// Derive the SigV4 signing key:
//   kDate    = HMAC("AWS4" + secret, date)
//   kRegion  = HMAC(kDate, region)
//   kService = HMAC(kRegion, service)
//   kSigning = HMAC(kService, "aws4_request")
bool deriveSigningKey(const std::string &secretAccessKey,
					  std::string_view date, std::string_view region,
					  std::string_view service,
					  std::vector<unsigned char> &signingKey);

// Lowercase-hex HMAC-SHA256 of `stringToSign` under a derived signing key.
bool signWithKey(const std::vector<unsigned char> &signingKey,
				 std::string_view stringToSign, std::string &signature);

} // namespace AWSv4Impl
