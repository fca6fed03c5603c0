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

#include <future>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

class XrdSysError;

namespace S3Presign {

// A long-lived access key pair.
struct PlainCredentials {
	std::string access_key;
	std::string secret_key;
};

// An STS-style temporary credential.  These usually expire and the signer
// never refreshes them; URLs signed after expiry are silently invalid.
struct TemporaryCredentials {
	std::string access_key;
	std::string secret_key;
	std::string session_token;
};

using S3Credentials = std::variant<PlainCredentials, TemporaryCredentials>;

const std::string &GetAccessKey(const S3Credentials &creds);
const std::string &GetSecretKey(const S3Credentials &creds);

// Returns the session token, or nullptr for plain credentials.
const std::string *GetSessionToken(const S3Credentials &creds);

// Build plain or temporary credentials depending on whether `token` is
// empty.
S3Credentials MakeCredentials(std::string accessKey, std::string secretKey,
							  std::string token = "");

class CredentialError : public std::runtime_error {
  public:
	explicit CredentialError(const std::string &msg)
		: std::runtime_error(msg) {}
};

// Somewhere to get a resolved set of credentials from.  The signer itself
// only takes the resolved value; sources are consulted once, before the
// signer is built.
class CredentialSource {
  public:
	virtual ~CredentialSource();

	// Blocking lookup.  On failure, returns false and sets `err`.
	virtual bool Get(S3Credentials &creds, std::string &err) const = 0;

	// Non-blocking lookup; a failure surfaces as a CredentialError thrown
	// from the future's get().  The default runs Get() on its own thread,
	// so the source must outlive the returned future.
	virtual std::future<S3Credentials> GetAsync() const;
};

// Credentials already known to the caller.
class StaticCredentialSource : public CredentialSource {
  public:
	explicit StaticCredentialSource(S3Credentials creds)
		: m_creds(std::move(creds)) {}

	bool Get(S3Credentials &creds, std::string &err) const override;

  private:
	const S3Credentials m_creds;
};

// Credentials kept in files on disk, one value per file.  The session token
// file is optional; if it is unset, empty, or holds only comment lines, the
// result is plain credentials.
class FileCredentialSource : public CredentialSource {
  public:
	FileCredentialSource(std::string accessKeyFile, std::string secretKeyFile,
						 std::string sessionTokenFile = "",
						 XrdSysError *log = nullptr)
		: m_access_key_file(std::move(accessKeyFile)),
		  m_secret_key_file(std::move(secretKeyFile)),
		  m_session_token_file(std::move(sessionTokenFile)), m_log(log) {}

	bool Get(S3Credentials &creds, std::string &err) const override;

  private:
	bool readValue(const std::string &fname, const char *what,
				   std::string &value, std::string &err) const;

	const std::string m_access_key_file;
	const std::string m_secret_key_file;
	const std::string m_session_token_file;
	XrdSysError *m_log;
};

// Credentials from the conventional AWS_ACCESS_KEY_ID,
// AWS_SECRET_ACCESS_KEY and (optional) AWS_SESSION_TOKEN variables.
class EnvCredentialSource : public CredentialSource {
  public:
	bool Get(S3Credentials &creds, std::string &err) const override;
};

} // namespace S3Presign
