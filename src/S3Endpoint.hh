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

#include <stdexcept>
#include <string>

namespace S3Presign {

class MalformedEndpoint : public std::runtime_error {
  public:
	explicit MalformedEndpoint(const std::string &msg)
		: std::runtime_error(msg) {}
};

// The parsed form of a bucket endpoint URL.  Both path-style
// ("https://s3.amazonaws.com/my-bucket/") and virtual-hosted style
// ("https://my-bucket.s3.amazonaws.com/") endpoints are accepted; the
// difference only shows up in the canonical URI prefix.
class S3Endpoint {
  public:
	// Throws MalformedEndpoint if the URL can't be parsed, has no host, or
	// isn't http(s).
	explicit S3Endpoint(const std::string &bucketEndpointURL);

	// scheme://host[:port], with no path and no trailing slash.
	const std::string &getEndpointURL() const { return m_endpoint_url; }

	// host[:port]; goes verbatim into the signed `host` header.
	const std::string &getBucketHost() const { return m_bucket_host; }

	// The URL path with trailing slashes removed; empty for virtual-hosted
	// style endpoints and "/bucket" for path-style ones.
	const std::string &getCanonicalURIPrefix() const {
		return m_canonical_uri_prefix;
	}

	const std::string &getScheme() const { return m_scheme; }

	// Build a bucket endpoint URL from a service URL (e.g.,
	// "https://s3.us-west-2.amazonaws.com"), a bucket name, and a URL style
	// ("path" or "virtual").
	static bool FromServiceURL(const std::string &serviceURL,
							   const std::string &bucket,
							   const std::string &urlStyle,
							   std::string &bucketEndpointURL,
							   std::string &err);

	// Recover the bucket endpoint URL from a URL that some other signer
	// presigned for `dummyKey`: everything before the first occurrence of
	// the key.  This lets us follow whatever endpoint logic the other
	// signer has rather than reverse-engineering it.
	static bool FromPresignedURL(const std::string &presignedURL,
								 const std::string &dummyKey,
								 std::string &bucketEndpointURL,
								 std::string &err);

	// A random hex key suitable for FromPresignedURL.
	static bool GenerateDummyKey(std::string &key);

  private:
	static bool ParseURL(const std::string &url, std::string &scheme,
						 std::string &host, std::string &path,
						 std::string &err);

	std::string m_scheme;
	std::string m_endpoint_url;
	std::string m_bucket_host;
	std::string m_canonical_uri_prefix;
};

} // namespace S3Presign
