/***************************************************************
 *
 * Copyright (C) 2023, HTCondor Team, UW-Madison
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

#include "shortfile.hh"

#include <string>
#include <utility>

#include <errno.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

namespace {

// Closes the descriptor on scope exit without clobbering errno.
class FdCloser {
  public:
	explicit FdCloser(int fd) : m_fd(fd) {}
	~FdCloser() {
		if (m_fd >= 0) {
			int saved = errno;
			close(m_fd);
			errno = saved;
		}
	}

  private:
	int m_fd;
};

ssize_t full_read(int fd, char *ptr, size_t nbytes) {
	size_t nleft = nbytes;
	while (nleft > 0) {
		ssize_t nread = read(fd, ptr, nleft);
		if (nread < 0) {
			if (errno == EINTR) {
				continue;
			}
			return -1;
		} else if (nread == 0) {
			break;
		}
		nleft -= nread;
		ptr += nread;
	}
	return nbytes - nleft;
}

ssize_t full_write(int fd, const char *ptr, size_t nbytes) {
	size_t nleft = nbytes;
	while (nleft > 0) {
		ssize_t nwritten = write(fd, ptr, nleft);
		if (nwritten < 0) {
			if (errno == EINTR) {
				continue;
			}
			return -1;
		}
		nleft -= nwritten;
		ptr += nwritten;
	}
	return nbytes;
}

} // namespace

bool readShortFile(const std::string &fileName, std::string &contents) {
	int fd = open(fileName.c_str(), O_RDONLY | O_CLOEXEC);
	if (fd < 0) {
		return false;
	}
	FdCloser closer(fd);

	struct stat statbuf;
	if (fstat(fd, &statbuf) < 0) {
		return false;
	}

	std::string buffer;
	buffer.resize(statbuf.st_size);
	auto totalRead = full_read(fd, &buffer[0], buffer.size());
	if (totalRead < 0) {
		return false;
	}
	// The file may have shrunk since the fstat().
	buffer.resize(totalRead);
	contents = std::move(buffer);
	return true;
}

bool writeShortFile(const std::string &fileName, const std::string &contents,
					int flags) {
	int fd = open(fileName.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC |
										 flags,
				  0600);
	if (fd < 0) {
		return false;
	}
	FdCloser closer(fd);

	return full_write(fd, contents.data(), contents.size()) ==
		   static_cast<ssize_t>(contents.size());
}
