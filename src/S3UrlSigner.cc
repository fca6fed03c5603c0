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

#include "S3UrlSigner.hh"
#include "AWSv4-impl.hh"
#include "logging.hh"
#include "stl_string_utils.hh"

#include <XrdSys/XrdSysError.hh>
#include <openssl/crypto.h>
#include <openssl/evp.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <exception>
#include <thread>

using namespace S3Presign;

namespace {

const char *const kAlgorithm = "AWS4-HMAC-SHA256";
const char *const kService = "s3";
const char *const kSignedHeaders = "host";
const char *const kUnsignedPayload = "UNSIGNED-PAYLOAD";

const char *const kInvalidArgument = "E_INVALID_ARGUMENT";
const char *const kInternal = "E_INTERNAL";

} // namespace

S3UrlSigner::S3UrlSigner(const std::string &bucketEndpointURL,
						 S3Credentials creds, const std::string &region,
						 XrdSysError *log)
	: S3UrlSigner(S3Endpoint(bucketEndpointURL), std::move(creds), region,
				  log) {}

S3UrlSigner::S3UrlSigner(S3Endpoint endpoint, S3Credentials creds,
						 const std::string &region, XrdSysError *log)
	: m_endpoint(std::move(endpoint)), m_creds(std::move(creds)),
	  m_region(region.empty() ? "us-east-1" : region), m_log(log) {}

S3UrlSigner::~S3UrlSigner() {}

S3UrlSigner::SigningContext::~SigningContext() {
	if (!signingKey.empty()) {
		OPENSSL_cleanse(signingKey.data(), signingKey.size());
	}
}

bool S3UrlSigner::validate(const std::vector<std::string> &keys,
						   int expiresIn, PresignError &err) const {
	for (size_t idx = 0; idx < keys.size(); ++idx) {
		if (keys[idx].empty()) {
			err.errorCode = kInvalidArgument;
			formatstr(err.errorMessage,
					  "All object keys must be non-empty strings (key %zu is "
					  "empty)",
					  idx);
			return false;
		}
	}
	if (expiresIn < 1 || expiresIn > MaxExpiresIn) {
		err.errorCode = kInvalidArgument;
		formatstr(err.errorMessage,
				  "Expiry of %d seconds is outside the permitted range "
				  "(1-%d)",
				  expiresIn, MaxExpiresIn);
		return false;
	}
	return true;
}

bool S3UrlSigner::prepare(time_t now, int expiresIn, SigningContext &ctx,
						  PresignError &err) const {
	struct tm brokenDownTime;
	gmtime_r(&now, &brokenDownTime);
	char dateAndTime[] = "YYYYMMDDThhmmssZ";
	strftime(dateAndTime, sizeof(dateAndTime), "%Y%m%dT%H%M%SZ",
			 &brokenDownTime);
	char date[] = "YYYYMMDD";
	strftime(date, sizeof(date), "%Y%m%d", &brokenDownTime);
	ctx.amzDate = dateAndTime;

	if (!AWSv4Impl::deriveSigningKey(GetSecretKey(m_creds), date, m_region,
									 kService, ctx.signingKey)) {
		err.errorCode = kInternal;
		err.errorMessage = "Failed to derive signing key";
		return false;
	}

	formatstr(ctx.credentialScope, "%s/%s/%s/aws4_request", date,
			  m_region.c_str(), kService);

	//
	// The canonical query string: every parameter except the signature,
	// sorted by the full "name=value" string.
	//
	std::vector<std::string> params;
	params.reserve(6);
	params.emplace_back(std::string("X-Amz-Algorithm=") + kAlgorithm);
	params.emplace_back(
		"X-Amz-Credential=" +
		AWSv4Impl::amazonURLEncode(GetAccessKey(m_creds) + "/" +
								   ctx.credentialScope));
	params.emplace_back("X-Amz-Date=" + ctx.amzDate);
	params.emplace_back("X-Amz-Expires=" + std::to_string(expiresIn));
	params.emplace_back(std::string("X-Amz-SignedHeaders=") + kSignedHeaders);
	if (auto token = GetSessionToken(m_creds)) {
		params.emplace_back("X-Amz-Security-Token=" +
							AWSv4Impl::amazonURLEncode(*token));
	}
	std::sort(params.begin(), params.end());

	ctx.canonicalQueryString.clear();
	for (const auto &param : params) {
		if (!ctx.canonicalQueryString.empty()) {
			ctx.canonicalQueryString += "&";
		}
		ctx.canonicalQueryString += param;
	}

	// The canonical headers.  This MUST include "Host" and, for us, nothing
	// else.
	ctx.canonicalHeaders = "host:" + m_endpoint.getBucketHost() + "\n";
	return true;
}

bool S3UrlSigner::signKey(const SigningContext &ctx, const std::string &key,
						  std::string &url) const {
	std::string canonicalURI =
		m_endpoint.getCanonicalURIPrefix() + "/" + AWSv4Impl::pathEncode(key);

	std::string canonicalRequest;
	canonicalRequest.reserve(canonicalURI.size() +
							 ctx.canonicalQueryString.size() +
							 ctx.canonicalHeaders.size() + 40);
	canonicalRequest += "GET\n";
	canonicalRequest += canonicalURI;
	canonicalRequest += "\n";
	canonicalRequest += ctx.canonicalQueryString;
	canonicalRequest += "\n";
	canonicalRequest += ctx.canonicalHeaders;
	canonicalRequest += "\n";
	canonicalRequest += kSignedHeaders;
	canonicalRequest += "\n";
	canonicalRequest += kUnsignedPayload;

	unsigned int mdLength = 0;
	unsigned char messageDigest[EVP_MAX_MD_SIZE];
	if (!AWSv4Impl::doSha256(canonicalRequest, messageDigest, &mdLength)) {
		return false;
	}
	std::string canonicalRequestHash;
	AWSv4Impl::convertMessageDigestToLowercaseHex(messageDigest, mdLength,
												  canonicalRequestHash);

	std::string stringToSign = std::string(kAlgorithm) + "\n" + ctx.amzDate +
							   "\n" + ctx.credentialScope + "\n" +
							   canonicalRequestHash;

	std::string signature;
	if (!AWSv4Impl::signWithKey(ctx.signingKey, stringToSign, signature)) {
		return false;
	}

	url.clear();
	url.reserve(m_endpoint.getEndpointURL().size() + canonicalURI.size() +
				ctx.canonicalQueryString.size() + signature.size() + 20);
	url += m_endpoint.getEndpointURL();
	url += canonicalURI;
	url += "?";
	url += ctx.canonicalQueryString;
	url += "&X-Amz-Signature=";
	url += signature;
	return true;
}

bool S3UrlSigner::signRange(const SigningContext &ctx,
							const std::vector<std::string> &keys, size_t begin,
							size_t end, std::vector<std::string> &urls) const {
	for (size_t idx = begin; idx < end; ++idx) {
		if (!signKey(ctx, keys[idx], urls[idx])) {
			return false;
		}
	}
	return true;
}

std::thread S3UrlSigner::StartWorker(std::function<void()> work) const {
	return std::thread(std::move(work));
}

bool S3UrlSigner::signParallel(const SigningContext &ctx,
							   const std::vector<std::string> &keys,
							   size_t threadCount,
							   std::vector<std::string> &urls) const {
	// Each worker owns a contiguous slice of the output, so input order is
	// preserved with no locking.
	std::atomic<bool> failed{false};
	std::vector<std::thread> workers;
	workers.reserve(threadCount);
	size_t chunk = (keys.size() + threadCount - 1) / threadCount;
	size_t begin = 0;
	try {
		for (; begin < keys.size(); begin += chunk) {
			size_t end = std::min(begin + chunk, keys.size());
			workers.push_back(StartWorker([&, begin, end] {
				try {
					if (!signRange(ctx, keys, begin, end, urls)) {
						failed.store(true, std::memory_order_relaxed);
					}
				} catch (const std::exception &) {
					failed.store(true, std::memory_order_relaxed);
				}
			}));
		}
	} catch (const std::exception &exc) {
		if (m_log) {
			std::string msg;
			formatstr(msg,
					  "Started only %zu of %zu signing threads (%s); signing "
					  "the remaining keys on the calling thread",
					  workers.size(), threadCount, exc.what());
			m_log->Log(LogMask::Warning, "GeneratePresignedGetObjectURLs",
					   msg.c_str());
		}
	}
	// Every started worker references this frame; join before leaving it.
	for (auto &worker : workers) {
		worker.join();
	}

	if (begin < keys.size() && !failed.load()) {
		return signRange(ctx, keys, begin, keys.size(), urls);
	}
	return !failed.load();
}

bool S3UrlSigner::GeneratePresignedGetObjectURLs(
	const std::vector<std::string> &keys, std::vector<std::string> &urls,
	PresignError &err, int expiresIn) const {
	return GeneratePresignedGetObjectURLsAt(time(nullptr), keys, urls, err,
											expiresIn);
}

bool S3UrlSigner::GeneratePresignedGetObjectURLs(
	const std::vector<const char *> &keys, std::vector<std::string> &urls,
	PresignError &err, int expiresIn) const {
	urls.clear();
	std::vector<std::string> converted;
	converted.reserve(keys.size());
	for (size_t idx = 0; idx < keys.size(); ++idx) {
		if (keys[idx] == nullptr) {
			err.errorCode = kInvalidArgument;
			formatstr(err.errorMessage,
					  "All object keys must be non-empty strings (key %zu is "
					  "missing)",
					  idx);
			if (m_log) {
				m_log->Log(LogMask::Warning, "GeneratePresignedGetObjectURLs",
						   err.errorMessage.c_str());
			}
			return false;
		}
		converted.emplace_back(keys[idx]);
	}
	return GeneratePresignedGetObjectURLs(converted, urls, err, expiresIn);
}

bool S3UrlSigner::GeneratePresignedGetObjectURLsAt(
	time_t now, const std::vector<std::string> &keys,
	std::vector<std::string> &urls, PresignError &err, int expiresIn) const {
	urls.clear();
	if (keys.empty()) {
		return true;
	}
	if (!validate(keys, expiresIn, err)) {
		if (m_log) {
			m_log->Log(LogMask::Warning, "GeneratePresignedGetObjectURLs",
					   err.errorMessage.c_str());
		}
		return false;
	}

	auto start = std::chrono::steady_clock::now();

	SigningContext ctx;
	if (!prepare(now, expiresIn, ctx, err)) {
		if (m_log) {
			m_log->Log(LogMask::Error, "GeneratePresignedGetObjectURLs",
					   err.errorMessage.c_str());
		}
		return false;
	}

	std::vector<std::string> result(keys.size());
	size_t threadCount =
		std::min(static_cast<size_t>(m_worker_threads), keys.size());
	bool success = threadCount <= 1
					   ? signRange(ctx, keys, 0, keys.size(), result)
					   : signParallel(ctx, keys, threadCount, result);

	if (!success) {
		err.errorCode = kInternal;
		err.errorMessage = "Failed to sign canonical request";
		if (m_log) {
			m_log->Log(LogMask::Error, "GeneratePresignedGetObjectURLs",
					   err.errorMessage.c_str());
		}
		return false;
	}

	if (m_log && (m_log->getMsgMask() & LogMask::Debug)) {
		auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
			std::chrono::steady_clock::now() - start);
		std::string msg;
		formatstr(msg, "Signed %zu URLs valid for %ds in %lldus using %zu thread(s)",
				  keys.size(), expiresIn,
				  static_cast<long long>(elapsed.count()),
				  std::max<size_t>(threadCount, 1));
		m_log->Log(LogMask::Debug, "GeneratePresignedGetObjectURLs",
				   msg.c_str());
	}

	urls = std::move(result);
	return true;
}
