// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "MountResolver.hxx"
#include "PathNormalizer.hxx"

#include <chrono>
#include <string>
#include <string_view>

namespace MountPolicy {

/**
 * The tool configuration.  Paths may begin with "~", which is
 * expanded by the #PathNormalizer.
 */
struct Config {
	/**
	 * The allowlist file.  It lives outside of all project
	 * directories, so no container can ever modify it.
	 */
	std::string allowlist_path = "~/.config/mountpolicy/mount-allowlist.json";

	/**
	 * The folder of the trusted group.  An empty string means
	 * there is no main group.
	 */
	std::string main_group = "main";

	/**
	 * The directory containing one workspace directory per
	 * group.
	 */
	std::string groups_dir = "~/.local/share/mountpolicy/groups";

	ResolverOptions resolver;

	std::chrono::milliseconds normalize_timeout = PathNormalizer::DEFAULT_TIMEOUT;

	unsigned log_level = 1;

	[[gnu::pure]]
	GroupDesignation GetDesignation(std::string_view folder) const noexcept {
		return MountPolicy::GetDesignation(folder, main_group);
	}

	/**
	 * Determine the workspace directory of the given group.
	 *
	 * Throws std::invalid_argument if the folder name is not
	 * valid.
	 */
	std::string GetWorkspacePath(std::string_view folder) const;
};

/**
 * Load a configuration file (see ConfigParser.hxx).  Settings not
 * specified in the file keep their values.
 *
 * Throws on error.
 */
void
LoadConfigFile(Config &config, const char *path);

} // namespace MountPolicy
