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

#include "logging.hh"

#include <XrdOuc/XrdOucGatherConf.hh>
#include <XrdSys/XrdSysError.hh>

#include <sstream>

using namespace S3Presign;

std::string S3Presign::LogMaskToString(int mask) {
	if (mask == LogMask::All) {
		return "all";
	}
	if (mask == 0) {
		return "none";
	}

	bool has_entry = false;
	std::stringstream ss;
	if (mask & LogMask::Debug) {
		ss << "debug";
		has_entry = true;
	}
	if (mask & LogMask::Info) {
		ss << (has_entry ? ", " : "") << "info";
		has_entry = true;
	}
	if (mask & LogMask::Warning) {
		ss << (has_entry ? ", " : "") << "warning";
		has_entry = true;
	}
	if (mask & LogMask::Error) {
		ss << (has_entry ? ", " : "") << "error";
	}
	return ss.str();
}

bool S3Presign::ParseLogLevel(const std::string &name, int &mask) {
	if (name == "all") {
		mask = LogMask::All;
	} else if (name == "error") {
		mask = LogMask::Error;
	} else if (name == "warning") {
		mask = LogMask::Warning;
	} else if (name == "info") {
		mask = LogMask::Info;
	} else if (name == "debug") {
		mask = LogMask::Debug;
	} else if (name == "none") {
		mask = 0;
	} else {
		return false;
	}
	return true;
}

bool S3Presign::ConfigLog(XrdOucGatherConf &conf, XrdSysError &log) {
	log.setMsgMask(0);
	char *val = nullptr;
	if (!(val = conf.GetToken())) {
		log.Emsg("Config",
				 "s3presign.trace requires an argument.  Usage: "
				 "s3presign.trace [all|error|warning|info|debug|none]");
		return false;
	}
	do {
		int mask = 0;
		if (!ParseLogLevel(val, mask)) {
			log.Emsg("Config", "s3presign.trace encountered an unknown directive:",
					 val);
			return false;
		}
		// "none" resets whatever came before it on the line.
		log.setMsgMask(mask ? (log.getMsgMask() | mask) : 0);
	} while ((val = conf.GetToken()));
	log.Emsg("Config", "Logging levels enabled -",
			 LogMaskToString(log.getMsgMask()).c_str());
	return true;
}
