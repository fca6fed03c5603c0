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

#include "S3Endpoint.hh"
#include "AWSv4-impl.hh"
#include "stl_string_utils.hh"

#include <curl/curl.h>
#include <openssl/rand.h>

#include <algorithm>
#include <cctype>
#include <memory>

using namespace S3Presign;

namespace {

struct CurlFree {
	void operator()(char *ptr) const { curl_free(ptr); }
};

// Fetch one part of a parsed URL.  Returns the curl result so the caller can
// distinguish an absent part (e.g., CURLUE_NO_PORT) from a real failure.
CURLUcode getURLPart(CURLU *handle, CURLUPart what, std::string &result) {
	char *raw = nullptr;
	auto rc = curl_url_get(handle, what, &raw, 0);
	std::unique_ptr<char, CurlFree> value(raw);
	if (rc == CURLUE_OK && value) {
		result = value.get();
	} else {
		result.clear();
	}
	return rc;
}

} // namespace

S3Endpoint::S3Endpoint(const std::string &bucketEndpointURL) {
	std::string path, err;
	if (!ParseURL(bucketEndpointURL, m_scheme, m_bucket_host, path, err)) {
		throw MalformedEndpoint(err);
	}

	// The canonical path must include the bucket's name for path-style
	// URLs; it must then not be repeated in the endpoint URL.
	m_canonical_uri_prefix = path;
	rtrimslashes(m_canonical_uri_prefix);
	m_endpoint_url = m_scheme + "://" + m_bucket_host;
}

bool S3Endpoint::ParseURL(const std::string &url, std::string &scheme,
						  std::string &host, std::string &path,
						  std::string &err) {
	// curl would happily guess at a scheme-less URL; we don't.
	if (url.find("://") == std::string::npos) {
		err = "Bucket endpoint URL '" + url + "' has no scheme";
		return false;
	}

	std::unique_ptr<CURLU, decltype(&curl_url_cleanup)> handle(
		curl_url(), &curl_url_cleanup);
	if (!handle) {
		err = "Failed to allocate a URL handle";
		return false;
	}
	auto rc = curl_url_set(handle.get(), CURLUPART_URL, url.c_str(),
						   CURLU_PATH_AS_IS | CURLU_NON_SUPPORT_SCHEME);
	if (rc != CURLUE_OK) {
		formatstr(err, "Failed to parse bucket endpoint URL '%s': %s",
				  url.c_str(), curl_url_strerror(rc));
		return false;
	}

	if (getURLPart(handle.get(), CURLUPART_SCHEME, scheme) != CURLUE_OK) {
		err = "Bucket endpoint URL '" + url + "' has no scheme";
		return false;
	}
	std::transform(scheme.begin(), scheme.end(), scheme.begin(), ::tolower);
	if (scheme != "http" && scheme != "https") {
		err = "Bucket endpoint URL '" + url +
			  "' not of a known protocol (http[s])";
		return false;
	}

	if (getURLPart(handle.get(), CURLUPART_HOST, host) != CURLUE_OK ||
		host.empty()) {
		err = "Bucket endpoint URL '" + url + "' has no host";
		return false;
	}

	// Only an explicitly-given port is part of the authority; the host
	// header must match what the client will send.
	std::string port;
	rc = getURLPart(handle.get(), CURLUPART_PORT, port);
	if (rc == CURLUE_OK) {
		host += ":" + port;
	} else if (rc != CURLUE_NO_PORT) {
		formatstr(err, "Failed to parse port of bucket endpoint URL '%s': %s",
				  url.c_str(), curl_url_strerror(rc));
		return false;
	}

	rc = getURLPart(handle.get(), CURLUPART_PATH, path);
	if (rc != CURLUE_OK) {
		formatstr(err, "Failed to parse path of bucket endpoint URL '%s': %s",
				  url.c_str(), curl_url_strerror(rc));
		return false;
	}
	return true;
}

bool S3Endpoint::FromServiceURL(const std::string &serviceURL,
								const std::string &bucket,
								const std::string &urlStyle,
								std::string &bucketEndpointURL,
								std::string &err) {
	if (bucket.empty()) {
		err = "A bucket name is required to build a bucket endpoint";
		return false;
	}

	std::string scheme, host, path;
	if (!ParseURL(serviceURL, scheme, host, path, err)) {
		return false;
	}
	rtrimslashes(path);

	if (urlStyle == "path") {
		// Path-style: the bucket is the first component of the resource.
		bucketEndpointURL = scheme + "://" + host + path + "/" + bucket + "/";
	} else if (urlStyle == "virtual") {
		// Virtual-style: the bucket is prepended to the host.
		bucketEndpointURL = scheme + "://" + bucket + "." + host + path + "/";
	} else {
		err = "Unknown URL style '" + urlStyle +
			  "'; must be 'path' or 'virtual'";
		return false;
	}
	return true;
}

bool S3Endpoint::FromPresignedURL(const std::string &presignedURL,
								  const std::string &dummyKey,
								  std::string &bucketEndpointURL,
								  std::string &err) {
	if (dummyKey.empty()) {
		err = "Dummy object key must not be empty";
		return false;
	}
	auto idx = presignedURL.find(dummyKey);
	if (idx == std::string::npos) {
		err = "Dummy object key '" + dummyKey +
			  "' not found in presigned URL";
		return false;
	}
	bucketEndpointURL = presignedURL.substr(0, idx);
	return true;
}

bool S3Endpoint::GenerateDummyKey(std::string &key) {
	unsigned char buf[8];
	if (RAND_bytes(buf, sizeof(buf)) != 1) {
		return false;
	}
	AWSv4Impl::convertMessageDigestToLowercaseHex(buf, sizeof(buf), key);
	return true;
}
