// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace MountPolicy {

enum class GroupDesignation : uint_least8_t {
	/**
	 * The trusted group; exempt from "nonMainReadOnly".
	 */
	MAIN,

	OTHER,
};

/**
 * The columns of a group registration row which are relevant for
 * mounting.
 */
struct GroupRecord {
	/**
	 * The name of the group's workspace directory.
	 */
	std::string folder;

	/**
	 * Opaque JSON blob; std::nullopt means no additional mounts.
	 */
	std::optional<std::string> container_config;
};

/**
 * A per-group request to mount one more host path.
 */
struct AdditionalMount {
	std::string host_path;

	/**
	 * Relative to the extra mount prefix; if not set, the last
	 * segment of #host_path is used.
	 */
	std::optional<std::string> container_path;

	bool readonly = false;
};

[[gnu::pure]]
inline GroupDesignation
GetDesignation(std::string_view folder, std::string_view main_folder) noexcept
{
	return !main_folder.empty() && folder == main_folder
		? GroupDesignation::MAIN
		: GroupDesignation::OTHER;
}

constexpr std::string_view
ToString(GroupDesignation designation) noexcept
{
	switch (designation) {
	case GroupDesignation::MAIN:
		return "main";

	case GroupDesignation::OTHER:
		break;
	}

	return "other";
}

/**
 * Is this a valid workspace folder name (a single path segment which
 * does not refer to the parent directory)?
 */
[[gnu::pure]]
bool
IsValidGroupFolder(std::string_view folder) noexcept;

} // namespace MountPolicy
