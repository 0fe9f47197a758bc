// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "ConfigParser.hxx"
#include "Config.hxx"
#include "io/config/LineParser.hxx"
#include "lib/fmt/RuntimeError.hxx"

#include <stdlib.h>
#include <string.h>

namespace MountPolicy {

std::string
MountPolicyConfigParser::MakeHostPath(const char *value) const
{
	if (*value == '/' || *value == '~')
		return value;

	return (base / value).native();
}

static std::string
ParseContainerPath(const char *value)
{
	if (*value != '/')
		throw FmtRuntimeError("Container path must be absolute: {}",
				      value);

	return value;
}

void
MountPolicyConfigParser::ParseLine(LineParser &line)
{
	const char *word = line.ExpectWord();

	if (strcmp(word, "allowlist") == 0) {
		config.allowlist_path = MakeHostPath(line.ExpectValueAndEnd());
	} else if (strcmp(word, "main_group") == 0) {
		const char *value = line.ExpectValueAndEnd();
		if (!IsValidGroupFolder(value))
			throw FmtRuntimeError("Invalid group folder name: {}",
					      value);

		config.main_group = value;
	} else if (strcmp(word, "groups_dir") == 0) {
		config.groups_dir = MakeHostPath(line.ExpectValueAndEnd());
	} else if (strcmp(word, "workspace_mount") == 0) {
		config.resolver.workspace_mount = ParseContainerPath(line.ExpectValueAndEnd());
	} else if (strcmp(word, "extra_mount_prefix") == 0) {
		config.resolver.extra_mount_prefix = ParseContainerPath(line.ExpectValueAndEnd());
	} else if (strcmp(word, "normalize_timeout_ms") == 0) {
		config.normalize_timeout = std::chrono::milliseconds{line.NextPositiveInteger()};
		line.ExpectEnd();
	} else if (strcmp(word, "log_level") == 0) {
		const char *value = line.ExpectValueAndEnd();
		char *endptr;
		const unsigned long level = strtoul(value, &endptr, 10);
		if (endptr == value || *endptr != 0 || level > 10)
			throw FmtRuntimeError("Invalid log level: {}", value);

		config.log_level = level;
	} else
		throw FmtRuntimeError("Unknown option: {}", word);
}

} // namespace MountPolicy
