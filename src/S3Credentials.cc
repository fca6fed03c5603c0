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

#include "S3Credentials.hh"
#include "logging.hh"
#include "shortfile.hh"
#include "stl_string_utils.hh"

#include <XrdSys/XrdSysError.hh>

#include <cstdlib>
#include <cstring>
#include <sstream>

#include <errno.h>

using namespace S3Presign;

const std::string &S3Presign::GetAccessKey(const S3Credentials &creds) {
	return std::visit(
		[](const auto &c) -> const std::string & { return c.access_key; },
		creds);
}

const std::string &S3Presign::GetSecretKey(const S3Credentials &creds) {
	return std::visit(
		[](const auto &c) -> const std::string & { return c.secret_key; },
		creds);
}

const std::string *S3Presign::GetSessionToken(const S3Credentials &creds) {
	if (auto temp = std::get_if<TemporaryCredentials>(&creds)) {
		return &temp->session_token;
	}
	return nullptr;
}

S3Credentials S3Presign::MakeCredentials(std::string accessKey,
										 std::string secretKey,
										 std::string token) {
	if (token.empty()) {
		return PlainCredentials{std::move(accessKey), std::move(secretKey)};
	}
	return TemporaryCredentials{std::move(accessKey), std::move(secretKey),
								std::move(token)};
}

CredentialSource::~CredentialSource() {}

std::future<S3Credentials> CredentialSource::GetAsync() const {
	return std::async(std::launch::async, [this] {
		S3Credentials creds;
		std::string err;
		if (!Get(creds, err)) {
			throw CredentialError(err);
		}
		return creds;
	});
}

bool StaticCredentialSource::Get(S3Credentials &creds,
								 std::string & /*err*/) const {
	creds = m_creds;
	return true;
}

bool FileCredentialSource::readValue(const std::string &fname, const char *what,
									 std::string &value,
									 std::string &err) const {
	std::string contents;
	if (!readShortFile(fname, contents)) {
		formatstr(err, "Unable to read from %s file '%s': %s", what,
				  fname.c_str(), strerror(errno));
		if (m_log) {
			m_log->Log(LogMask::Warning, "FileCredentialSource", err.c_str());
		}
		return false;
	}

	// Take the first line that is neither blank nor a comment.
	std::istringstream istream(contents);
	for (std::string line; std::getline(istream, line);) {
		trim(line);
		if (line.empty() || line[0] == '#') {
			continue;
		}
		value = line;
		return true;
	}
	value.clear();
	return true;
}

bool FileCredentialSource::Get(S3Credentials &creds, std::string &err) const {
	if (m_access_key_file.empty() || m_secret_key_file.empty()) {
		err = "Both an access key file and a secret key file are required";
		return false;
	}

	std::string keyID, saKey, token;
	if (!readValue(m_access_key_file, "accesskey", keyID, err)) {
		return false;
	}
	if (keyID.empty()) {
		err = "The accesskey file '" + m_access_key_file + "' is empty";
		return false;
	}
	if (!readValue(m_secret_key_file, "secretkey", saKey, err)) {
		return false;
	}
	if (saKey.empty()) {
		err = "The secretkey file '" + m_secret_key_file + "' is empty";
		return false;
	}
	if (!m_session_token_file.empty() &&
		!readValue(m_session_token_file, "session token", token, err)) {
		return false;
	}

	if (m_log) {
		m_log->Log(LogMask::Debug, "FileCredentialSource",
				   token.empty() ? "Loaded credentials for access key"
								 : "Loaded temporary credentials for access key",
				   keyID.c_str());
	}
	creds = MakeCredentials(std::move(keyID), std::move(saKey),
							std::move(token));
	return true;
}

bool EnvCredentialSource::Get(S3Credentials &creds, std::string &err) const {
	const char *keyID = getenv("AWS_ACCESS_KEY_ID");
	if (!keyID || !*keyID) {
		err = "AWS_ACCESS_KEY_ID is not set";
		return false;
	}
	const char *saKey = getenv("AWS_SECRET_ACCESS_KEY");
	if (!saKey || !*saKey) {
		err = "AWS_SECRET_ACCESS_KEY is not set";
		return false;
	}
	const char *token = getenv("AWS_SESSION_TOKEN");
	creds = MakeCredentials(keyID, saKey, token ? token : "");
	return true;
}
