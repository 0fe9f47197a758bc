// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "mountpolicy/Allowlist.hxx"
#include "mountpolicy/AllowlistJson.hxx"
#include "util/PrintException.hxx"

#include <fmt/core.h>
#include <nlohmann/json.hpp>

#include <stdlib.h>

int
main(int argc, char **argv)
try {
	if (argc != 1) {
		fmt::print(stderr, "Usage: {}\n", argv[0]);
		return EXIT_FAILURE;
	}

	fmt::print("{}\n", MountPolicy::ToJson(MountPolicy::MakeAllowlistTemplate()).dump(2));
	return EXIT_SUCCESS;
} catch (...) {
	PrintException(std::current_exception());
	return EXIT_FAILURE;
}
