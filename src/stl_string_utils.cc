/***************************************************************
 *
 * Copyright (C) 2024, HTCondor Team, UW-Madison
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

#include "stl_string_utils.hh"

#include <cctype>
#include <memory>
#include <string>

#include <stdarg.h>
#include <stdio.h>

void trim(std::string &str) {
	size_t begin = 0;
	while (begin < str.length() &&
		   isspace(static_cast<unsigned char>(str[begin]))) {
		++begin;
	}

	size_t end = str.length();
	while (end > begin && isspace(static_cast<unsigned char>(str[end - 1]))) {
		--end;
	}

	if (begin != 0 || end != str.length()) {
		str = str.substr(begin, end - begin);
	}
}

static int vformatstr(std::string &s, const char *format, va_list pargs) {
	char fixbuf[512];
	const int fixlen = sizeof(fixbuf) / sizeof(fixbuf[0]);

	va_list args;
	va_copy(args, pargs);
	int n = vsnprintf(fixbuf, fixlen, format, args);
	va_end(args);
	if (n < 0) {
		return n;
	}

	// In this case, fixed buffer was sufficient so we're done.
	if (n < fixlen) {
		s.assign(fixbuf, n);
		return n;
	}

	// Otherwise vsnprintf() told us how much memory we need.
	std::unique_ptr<char[]> varbuf(new char[n + 1]);
	va_copy(args, pargs);
	int nn = vsnprintf(varbuf.get(), n + 1, format, args);
	va_end(args);
	if (nn < 0) {
		return nn;
	}

	s.assign(varbuf.get(), nn);
	return nn;
}

int formatstr(std::string &s, const char *format, ...) {
	va_list args;
	va_start(args, format);
	int r = vformatstr(s, format, args);
	va_end(args);
	return r;
}

void rtrimslashes(std::string &path) {
	auto end = path.find_last_not_of('/');
	if (end == std::string::npos) {
		path.clear();
	} else {
		path.erase(end + 1);
	}
}
