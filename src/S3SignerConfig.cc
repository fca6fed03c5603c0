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

#include "S3SignerConfig.hh"
#include "S3Credentials.hh"
#include "S3Endpoint.hh"
#include "logging.hh"
#include "stl_string_utils.hh"

#include <XrdOuc/XrdOucGatherConf.hh>
#include <XrdSys/XrdSysError.hh>

#include <charconv>
#include <cstring>
#include <string_view>


using namespace S3Presign;

bool S3SignerConfig::handle_required_config(const char *desired_name,
											const char *source) {
	if (!source || !*source) {
		std::string error;
		formatstr(error, "%s must specify a value", desired_name);
		m_log.Emsg("Config", error.c_str());
		return false;
	}
	return true;
}

bool S3SignerConfig::parse_number(const char *desired_name, const char *value,
								  long long min, long long max,
								  long long &result) {
	std::string_view value_sv(value);
	auto parsed = std::from_chars(value_sv.data(),
								  value_sv.data() + value_sv.size(), result);
	if (parsed.ec != std::errc()) {
		m_log.Emsg("Config", desired_name, "must be a number");
		return false;
	} else if (parsed.ptr != value_sv.data() + value_sv.size()) {
		m_log.Emsg("Config", desired_name, "contains trailing characters");
		return false;
	}
	if (result < min || result > max) {
		std::string error;
		formatstr(error, "%s must be between %lld and %lld", desired_name, min,
				  max);
		m_log.Emsg("Config", error.c_str());
		return false;
	}
	return true;
}

bool S3SignerConfig::Config(const char *configfn) {
	XrdOucGatherConf presign_conf("s3presign.", &m_log);
	int result;
	if ((result = presign_conf.Gather(configfn,
									  XrdOucGatherConf::full_lines)) < 0) {
		m_log.Emsg("Config", -result, "parsing config file", configfn);
		return false;
	}

	char *temporary;
	std::string attribute;
	m_log.setMsgMask(LogMask::Warning | LogMask::Error);
	while ((temporary = presign_conf.GetLine())) {
		attribute = presign_conf.GetToken();
		if (attribute == "s3presign.trace") {
			if (!ConfigLog(presign_conf, m_log)) {
				m_log.Emsg("Config", "Failed to configure the log level");
				return false;
			}
			continue;
		}

		temporary = presign_conf.GetToken();
		if (!handle_required_config(attribute.c_str(), temporary)) {
			return false;
		}
		std::string value(temporary);

		if (attribute == "s3presign.bucket_endpoint_url") {
			m_bucket_endpoint_url = value;
		} else if (attribute == "s3presign.service_url") {
			m_service_url = value;
		} else if (attribute == "s3presign.bucket_name") {
			m_bucket_name = value;
		} else if (attribute == "s3presign.url_style") {
			if (value != "path" && value != "virtual") {
				m_log.Emsg("Config",
						   "s3presign.url_style must be 'path' or 'virtual'; "
						   "got",
						   value.c_str());
				return false;
			}
			m_url_style = value;
		} else if (attribute == "s3presign.region") {
			m_region = value;
		} else if (attribute == "s3presign.access_key_file") {
			m_access_key_file = value;
		} else if (attribute == "s3presign.secret_key_file") {
			m_secret_key_file = value;
		} else if (attribute == "s3presign.session_token_file") {
			m_session_token_file = value;
		} else if (attribute == "s3presign.expires_in") {
			long long expires;
			if (!parse_number(attribute.c_str(), temporary, 1,
							  S3UrlSigner::MaxExpiresIn, expires)) {
				return false;
			}
			m_expires_in = static_cast<int>(expires);
		} else if (attribute == "s3presign.worker_threads") {
			long long threads;
			if (!parse_number(attribute.c_str(), temporary, 1, 1024,
							  threads)) {
				return false;
			}
			m_worker_threads = static_cast<unsigned>(threads);
		} else {
			m_log.Log(LogMask::Warning, "Config", "Ignoring unknown directive",
					  attribute.c_str());
		}
	}

	if (!m_bucket_endpoint_url.empty() && !m_service_url.empty()) {
		m_log.Emsg("Config", "s3presign.bucket_endpoint_url and "
							 "s3presign.service_url are mutually exclusive");
		return false;
	}
	if (m_bucket_endpoint_url.empty()) {
		if (m_service_url.empty()) {
			m_log.Emsg("Config", "One of s3presign.bucket_endpoint_url or "
								 "s3presign.service_url must be specified");
			return false;
		}
		std::string err;
		if (!S3Endpoint::FromServiceURL(m_service_url, m_bucket_name,
										m_url_style, m_bucket_endpoint_url,
										err)) {
			m_log.Emsg("Config", err.c_str());
			return false;
		}
	}

	try {
		S3Endpoint endpoint(m_bucket_endpoint_url);
		m_log.Log(LogMask::Info, "Config", "Signing URLs for bucket endpoint",
				  (endpoint.getEndpointURL() + endpoint.getCanonicalURIPrefix())
					  .c_str());
	} catch (const MalformedEndpoint &exc) {
		m_log.Emsg("Config", exc.what());
		return false;
	}

	if (m_access_key_file.empty()) {
		m_log.Emsg("Config", "s3presign.access_key_file not specified");
		return false;
	}
	if (m_secret_key_file.empty()) {
		m_log.Emsg("Config", "s3presign.secret_key_file not specified");
		return false;
	}
	// Resolve the credentials now so an unreadable or empty key file is a
	// configuration error.
	FileCredentialSource source(m_access_key_file, m_secret_key_file,
								m_session_token_file, &m_log);
	std::string err;
	if (!source.Get(m_creds, err)) {
		m_log.Emsg("Config", err.c_str());
		return false;
	}

	return true;
}

std::unique_ptr<S3UrlSigner>
S3SignerConfig::MakeSigner(std::string &err) const {
	std::unique_ptr<S3UrlSigner> signer;
	try {
		signer.reset(new S3UrlSigner(m_bucket_endpoint_url, m_creds,
									 m_region, &m_log));
	} catch (const MalformedEndpoint &exc) {
		err = exc.what();
		return nullptr;
	}
	signer->SetWorkerThreads(m_worker_threads);
	return signer;
}
