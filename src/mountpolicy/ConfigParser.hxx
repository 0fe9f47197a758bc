// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "io/config/ConfigParser.hxx"

#include <filesystem>

namespace MountPolicy {

struct Config;

/**
 * Parser for the tool configuration file.  Syntax:
 *
 *     # comment
 *     allowlist "/etc/mountpolicy/mount-allowlist.json"
 *     main_group main
 *     groups_dir "groups"
 *     workspace_mount "/workspace/group"
 *     extra_mount_prefix "/workspace/extra"
 *     normalize_timeout_ms 2000
 *     log_level 2
 *
 * Paths must be quoted.  Relative host paths are relative to the
 * directory containing the configuration file.
 */
class MountPolicyConfigParser final : public ConfigParser {
	Config &config;

	const std::filesystem::path base;

public:
	MountPolicyConfigParser(Config &_config,
				const std::filesystem::path &path)
		:config(_config), base(path.parent_path()) {}

protected:
	/* virtual methods from class ConfigParser */
	void ParseLine(LineParser &line) override;

private:
	std::string MakeHostPath(const char *value) const;
};

} // namespace MountPolicy
