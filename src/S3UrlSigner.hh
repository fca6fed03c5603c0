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

#include "S3Credentials.hh"
#include "S3Endpoint.hh"

#include <ctime>
#include <functional>
#include <string>
#include <thread>
#include <vector>

class XrdSysError;

namespace S3Presign {

struct PresignError {
	std::string errorCode;
	std::string errorMessage;
};

// Generates SigV4 presigned GET-object URLs in bulk.
//
// Everything that depends only on the time of the call (the date strings,
// the derived signing key, and the query string) is computed once per batch
// and shared by all the keys in it; the per-key cost is one encode, one
// SHA-256 and one HMAC.
//
// The signer is immutable once configured and may be shared between
// threads.  It never refreshes its credentials: if temporary credentials
// expire, the URLs it produces afterward will be rejected by the server and
// the caller must build a new signer.
class S3UrlSigner {
  public:
	static constexpr int DefaultExpiresIn = 3600;
	// AWS rejects presigned URLs valid for more than seven days.
	static constexpr int MaxExpiresIn = 604800;

	// Throws MalformedEndpoint if `bucketEndpointURL` can't be parsed.  An
	// empty region means us-east-1.
	S3UrlSigner(const std::string &bucketEndpointURL, S3Credentials creds,
				const std::string &region = "", XrdSysError *log = nullptr);
	S3UrlSigner(S3Endpoint endpoint, S3Credentials creds,
				const std::string &region = "", XrdSysError *log = nullptr);
	virtual ~S3UrlSigner();

	// Split the per-key loop across up to `count` threads.  Must be called
	// before the signer is shared.
	void SetWorkerThreads(unsigned count) { m_worker_threads = count ? count : 1; }
	unsigned GetWorkerThreads() const { return m_worker_threads; }

	// Produce one URL per key, in order.  On failure, `urls` is left empty
	// and `err` describes the problem:
	//   E_INVALID_ARGUMENT: an empty (or null) key, or an expiry outside
	//                       1..MaxExpiresIn seconds.
	//   E_INTERNAL: a cryptographic primitive failed.
	bool GeneratePresignedGetObjectURLs(const std::vector<std::string> &keys,
										std::vector<std::string> &urls,
										PresignError &err,
										int expiresIn = DefaultExpiresIn) const;

	// As above; a nullptr entry is treated as a missing key.
	bool GeneratePresignedGetObjectURLs(const std::vector<const char *> &keys,
										std::vector<std::string> &urls,
										PresignError &err,
										int expiresIn = DefaultExpiresIn) const;

	// As above, but signing as of `now` rather than the current time.
	bool GeneratePresignedGetObjectURLsAt(time_t now,
										  const std::vector<std::string> &keys,
										  std::vector<std::string> &urls,
										  PresignError &err,
										  int expiresIn = DefaultExpiresIn) const;

	const S3Endpoint &getEndpoint() const { return m_endpoint; }
	const std::string &getRegion() const { return m_region; }

  protected:
	// The call-invariant parts of a batch.  The signing key is wiped when the
	// context goes away.
	struct SigningContext {
		~SigningContext();

		std::string amzDate;
		std::string credentialScope;
		std::string canonicalQueryString;
		std::string canonicalHeaders;
		std::vector<unsigned char> signingKey;
	};

	// Sign a single key; returns false if a cryptographic primitive fails.
	virtual bool signKey(const SigningContext &ctx, const std::string &key,
						 std::string &url) const;

	// Launch a worker for the parallel loop.  Throws (typically
	// std::system_error) if the thread can't be created; the remaining keys
	// are then signed on the calling thread.
	virtual std::thread StartWorker(std::function<void()> work) const;

  private:
	bool validate(const std::vector<std::string> &keys, int expiresIn,
				  PresignError &err) const;

	bool prepare(time_t now, int expiresIn, SigningContext &ctx,
				 PresignError &err) const;

	bool signRange(const SigningContext &ctx,
				   const std::vector<std::string> &keys, size_t begin,
				   size_t end, std::vector<std::string> &urls) const;

	bool signParallel(const SigningContext &ctx,
					  const std::vector<std::string> &keys, size_t threadCount,
					  std::vector<std::string> &urls) const;

	const S3Endpoint m_endpoint;
	const S3Credentials m_creds;
	const std::string m_region;
	unsigned m_worker_threads{1};
	XrdSysError *m_log;
};

} // namespace S3Presign
