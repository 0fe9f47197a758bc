// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "ConfigParser.hxx"
#include "LineParser.hxx"
#include "lib/fmt/RuntimeError.hxx"
#include "lib/fmt/SystemError.hxx"
#include "util/ScopeExit.hxx"

#include <exception>
#include <memory>

#include <stdio.h>
#include <stdlib.h>

bool
ConfigParser::PreParseLine(LineParser &)
{
	return false;
}

bool
CommentConfigParser::PreParseLine(LineParser &line)
{
	if (child.PreParseLine(line))
		return true;

	if (line.front() == '#' || line.IsEnd())
		/* ignore empty lines and comments */
		return true;

	return ConfigParser::PreParseLine(line);
}

void
CommentConfigParser::ParseLine(LineParser &line)
{
	child.ParseLine(line);
}

void
CommentConfigParser::Finish()
{
	child.Finish();
	ConfigParser::Finish();
}

void
ParseConfigFile(const std::filesystem::path &path, ConfigParser &parser)
{
	const std::unique_ptr<FILE, decltype(&fclose)>
		file{fopen(path.c_str(), "re"), &fclose};
	if (!file)
		throw FmtErrno("Failed to open {}", path.native());

	char *buffer = nullptr;
	size_t buffer_size = 0;
	AtScopeExit(&buffer) { free(buffer); };

	unsigned i = 1;
	while (getline(&buffer, &buffer_size, file.get()) >= 0) {
		LineParser line_parser(buffer);

		try {
			if (!parser.PreParseLine(line_parser))
				parser.ParseLine(line_parser);
		} catch (...) {
			std::throw_with_nested(FmtRuntimeError("{}:{}",
							       path.native(), i));
		}

		++i;
	}

	if (ferror(file.get()))
		throw FmtErrno("Failed to read {}", path.native());

	parser.Finish();
}
