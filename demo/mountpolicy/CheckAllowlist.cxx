// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

/*
 * Validate a mount allowlist file and show how its roots resolve on
 * this host.
 */

#include "mountpolicy/AllowlistStore.hxx"
#include "mountpolicy/Config.hxx"
#include "mountpolicy/PathNormalizer.hxx"
#include "io/Logger.hxx"
#include "util/Exception.hxx"
#include "util/PrintException.hxx"
#include "util/StringCompare.hxx"

#include <fmt/core.h>

#include <span>

#include <stdio.h>
#include <stdlib.h>

using namespace MountPolicy;

struct Usage {};

int
main(int argc, char **argv)
try {
	std::span<const char *const> args{argv + 1, static_cast<std::size_t>(argc - 1)};

	Config config;

	if (!args.empty()) {
		if (const char *path = StringAfterPrefix(args.front(), "--config=")) {
			LoadConfigFile(config, path);
			args = args.subspan(1);
		}
	}

	if (args.size() > 1)
		throw Usage{};

	SetLogLevel(config.log_level);

	const auto normalizer = PathNormalizer::ForCurrentUser(config.normalize_timeout);
	const auto path = normalizer.ExpandHome(args.empty()
						? config.allowlist_path
						: args.front());

	const auto allowlist = LoadAllowlistFile(path.c_str());

	fmt::print("{}: OK\n", path);

	for (const auto &root : allowlist.allowed_roots) {
		const char *mode = root.allow_read_write ? "rw" : "ro";

		try {
			fmt::print("  root {} ({}) -> {}\n", root.path, mode,
				   normalizer.Normalize(root.path));
		} catch (const std::exception &e) {
			fmt::print("  root {} ({}) -> unusable: {}\n", root.path, mode,
				   GetFullMessage(e));
		}
	}

	for (const auto &pattern : allowlist.blocked_patterns)
		fmt::print("  blocked {}\n", pattern);

	fmt::print("  nonMainReadOnly {}\n", allowlist.non_main_read_only);

	return EXIT_SUCCESS;
} catch (Usage) {
	fprintf(stderr, "Usage: mount-policy-check"
		" [--config=FILE] [ALLOWLIST]"
		"\n");
	return EXIT_FAILURE;
} catch (...) {
	PrintException(std::current_exception());
	return EXIT_FAILURE;
}
