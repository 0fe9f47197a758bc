// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "Config.hxx"
#include "ConfigParser.hxx"
#include "io/config/ConfigParser.hxx"

#include <fmt/format.h>

#include <stdexcept>

namespace MountPolicy {

std::string
Config::GetWorkspacePath(std::string_view folder) const
{
	if (!IsValidGroupFolder(folder))
		throw std::invalid_argument{fmt::format("Invalid group folder name: '{}'",
							folder)};

	std::string result = groups_dir;
	if (!result.ends_with('/'))
		result.push_back('/');
	result.append(folder);
	return result;
}

void
LoadConfigFile(Config &config, const char *path)
{
	MountPolicyConfigParser parser{config, path};
	CommentConfigParser comment_parser{parser};
	ParseConfigFile(path, comment_parser);
}

} // namespace MountPolicy
