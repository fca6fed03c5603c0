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

#include "S3UrlSigner.hh"

#include <memory>
#include <string>

class XrdSysError;

namespace S3Presign {

// Settings for a signer, read from the `s3presign.*` directives of an
// xrootd-style configuration file:
//
//   s3presign.trace               all|error|warning|info|debug|none
//   s3presign.bucket_endpoint_url https://my-bucket.s3.amazonaws.com/
//   s3presign.service_url         https://s3.amazonaws.com
//   s3presign.bucket_name         my-bucket
//   s3presign.url_style           path|virtual
//   s3presign.region              us-east-1
//   s3presign.access_key_file     /etc/s3/access.key
//   s3presign.secret_key_file     /etc/s3/secret.key
//   s3presign.session_token_file  /etc/s3/session.token
//   s3presign.expires_in          3600
//   s3presign.worker_threads      1
//
// Either bucket_endpoint_url or service_url + bucket_name must be given.
class S3SignerConfig {
  public:
	explicit S3SignerConfig(XrdSysError &log) : m_log(log) {}

	bool Config(const char *configfn);

	// Build a signer from the credentials resolved by Config().  Returns
	// nullptr and sets `err` on failure.
	std::unique_ptr<S3UrlSigner> MakeSigner(std::string &err) const;

	const std::string &getBucketEndpointURL() const {
		return m_bucket_endpoint_url;
	}
	const std::string &getRegion() const { return m_region; }
	const std::string &getAccessKeyFile() const { return m_access_key_file; }
	const std::string &getSecretKeyFile() const { return m_secret_key_file; }
	const std::string &getSessionTokenFile() const {
		return m_session_token_file;
	}
	int getExpiresIn() const { return m_expires_in; }
	unsigned getWorkerThreads() const { return m_worker_threads; }

  private:
	bool handle_required_config(const char *desired_name,
								const char *source);

	bool parse_number(const char *desired_name, const char *value,
					  long long min, long long max, long long &result);

	XrdSysError &m_log;

	std::string m_bucket_endpoint_url;
	std::string m_service_url;
	std::string m_bucket_name;
	std::string m_url_style{"path"};
	std::string m_region;
	std::string m_access_key_file;
	std::string m_secret_key_file;
	std::string m_session_token_file;
	int m_expires_in{S3UrlSigner::DefaultExpiresIn};
	unsigned m_worker_threads{1};
	S3Credentials m_creds;
};

} // namespace S3Presign
