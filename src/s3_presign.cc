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

//
// s3-presign: print presigned GET URLs for a list of object keys.
//
//   s3-presign -c /etc/s3presign.cfg [-e seconds] [key ...]
//
// Keys are taken from the command line or, if none are given, one per line
// from stdin (blank lines are skipped).
//

#include "S3SignerConfig.hh"
#include "S3UrlSigner.hh"

#include <XrdSys/XrdSysError.hh>
#include <XrdSys/XrdSysLogger.hh>

#include <charconv>
#include <cstring>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

#include <unistd.h>

using namespace S3Presign;

namespace {

void usage(const char *argv0) {
	std::cerr << "Usage: " << argv0 << " -c config [-e seconds] [key ...]\n";
}

} // namespace

int main(int argc, char *argv[]) {
	const char *configfn = nullptr;
	int expiresIn = 0;
	bool haveExpiry = false;
	int opt;
	while ((opt = getopt(argc, argv, "c:e:h")) != -1) {
		switch (opt) {
		case 'c':
			configfn = optarg;
			break;
		case 'e': {
			std::string_view value(optarg);
			auto result = std::from_chars(
				value.data(), value.data() + value.size(), expiresIn);
			if (result.ec != std::errc() ||
				result.ptr != value.data() + value.size()) {
				std::cerr << "Invalid expiry: " << optarg << "\n";
				return 1;
			}
			haveExpiry = true;
			break;
		}
		case 'h':
			usage(argv[0]);
			return 0;
		default:
			usage(argv[0]);
			return 1;
		}
	}
	if (!configfn) {
		usage(argv[0]);
		return 1;
	}

	XrdSysLogger logger(2, 0);
	XrdSysError log(&logger, "s3presign_");

	S3SignerConfig config(log);
	if (!config.Config(configfn)) {
		log.Emsg("Main", "Failed to configure the signer from", configfn);
		return 1;
	}
	std::string err;
	auto signer = config.MakeSigner(err);
	if (!signer) {
		log.Emsg("Main", "Failed to create signer:", err.c_str());
		return 1;
	}
	if (!haveExpiry) {
		expiresIn = config.getExpiresIn();
	}

	std::vector<std::string> keys;
	for (int idx = optind; idx < argc; ++idx) {
		keys.emplace_back(argv[idx]);
	}
	if (keys.empty()) {
		for (std::string line; std::getline(std::cin, line);) {
			if (!line.empty() && line.back() == '\r') {
				line.pop_back();
			}
			if (line.empty()) {
				continue;
			}
			keys.push_back(line);
		}
	}

	std::vector<std::string> urls;
	PresignError presignErr;
	if (!signer->GeneratePresignedGetObjectURLs(keys, urls, presignErr,
												expiresIn)) {
		log.Emsg("Main", presignErr.errorCode.c_str(),
				 presignErr.errorMessage.c_str());
		return 1;
	}
	for (const auto &url : urls) {
		std::cout << url << "\n";
	}
	return std::cout.good() ? 0 : 1;
}
