// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

/*
 * Print the mounts a group's container would get, as JSON.
 */

#include "mountpolicy/AllowlistStore.hxx"
#include "mountpolicy/Config.hxx"
#include "mountpolicy/MountPlanner.hxx"
#include "mountpolicy/PathNormalizer.hxx"
#include "mountpolicy/PlanJson.hxx"
#include "io/Logger.hxx"
#include "util/PrintException.hxx"
#include "util/StringCompare.hxx"

#include <fmt/core.h>
#include <nlohmann/json.hpp>

#include <optional>
#include <span>

#include <stdio.h>
#include <stdlib.h>
#include <string.h>

using namespace MountPolicy;

struct Usage {};

int
main(int argc, char **argv)
try {
	std::span<const char *const> args{argv + 1, static_cast<std::size_t>(argc - 1)};

	Config config;
	std::optional<GroupDesignation> designation;

	while (!args.empty() && args.front()[0] == '-') {
		const char *arg = args.front();
		args = args.subspan(1);

		if (const char *path = StringAfterPrefix(arg, "--config="))
			LoadConfigFile(config, path);
		else if (strcmp(arg, "--main") == 0)
			designation = GroupDesignation::MAIN;
		else if (strcmp(arg, "--other") == 0)
			designation = GroupDesignation::OTHER;
		else
			throw Usage{};
	}

	if (args.empty() || args.size() > 2)
		throw Usage{};

	GroupRecord group{args.front(), std::nullopt};
	if (args.size() > 1)
		group.container_config = args[1];

	if (!designation)
		designation = config.GetDesignation(group.folder);

	SetLogLevel(config.log_level);

	const auto normalizer = PathNormalizer::ForCurrentUser(config.normalize_timeout);

	const auto allowlist_path = normalizer.ExpandHome(config.allowlist_path);
	AllowlistStore store;
	store.Reload(allowlist_path.c_str());

	LogFmt(2, "resolve", "Group '{}' is '{}', workspace {}",
	       group.folder, ToString(*designation),
	       config.GetWorkspacePath(group.folder));

	const MountPlanner planner{store, normalizer, config.resolver};
	const auto plan = planner.Plan(group, *designation,
				       config.GetWorkspacePath(group.folder));

	fmt::print("{}\n", ToJson(plan).dump(2));
	return EXIT_SUCCESS;
} catch (Usage) {
	fprintf(stderr, "Usage: mount-policy-resolve"
		" [--config=FILE] [--main|--other] FOLDER [CONTAINER_CONFIG]"
		"\n");
	return EXIT_FAILURE;
} catch (...) {
	PrintException(std::current_exception());
	return EXIT_FAILURE;
}
