// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "StringFile.hxx"
#include "lib/fmt/RuntimeError.hxx"
#include "lib/fmt/SystemError.hxx"
#include "util/ScopeExit.hxx"

#include <fcntl.h>
#include <unistd.h>

std::string
LoadTextFile(const char *path, std::size_t max_size)
{
	const int fd = open(path, O_RDONLY|O_NOCTTY|O_CLOEXEC);
	if (fd < 0)
		throw FmtErrno("Failed to open {}", path);

	AtScopeExit(fd) { close(fd); };

	std::string result;

	char buffer[4096];
	while (true) {
		ssize_t nbytes = read(fd, buffer, sizeof(buffer));
		if (nbytes < 0)
			throw FmtErrno("Failed to read {}", path);

		if (nbytes == 0)
			break;

		if (result.size() + std::size_t(nbytes) > max_size)
			throw FmtRuntimeError("File is too large: {}", path);

		result.append(buffer, nbytes);
	}

	return result;
}
