// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace MountPolicy {

/**
 * One host directory tree which may be exposed to containers.
 */
struct AllowedRoot {
	/**
	 * The host path as declared in the allowlist file; may start
	 * with "~/".  It is normalized only during resolution.
	 */
	std::string path;

	/**
	 * The maximum permission which may be granted for mounts
	 * below this root.  Even if this is true, the mount may still
	 * end up read-only.
	 */
	bool allow_read_write;

	std::optional<std::string> description;

	bool operator==(const AllowedRoot &) const noexcept = default;
};

/**
 * The global mount allowlist.  Instances are immutable once
 * published by #AllowlistStore.
 */
struct MountAllowlist {
	/**
	 * In declaration order; on equally specific matches, the
	 * first one wins.
	 */
	std::vector<AllowedRoot> allowed_roots;

	/**
	 * The patterns declared in the file.  The built-in
	 * DefaultBlockedPatterns() are always applied in addition.
	 */
	std::vector<std::string> blocked_patterns;

	/**
	 * Force all mounts of non-main groups to be read-only?
	 */
	bool non_main_read_only;

	bool operator==(const MountAllowlist &) const noexcept = default;
};

/**
 * Credential locations which are blocked regardless of the allowlist
 * contents.
 */
[[gnu::const]]
std::span<const std::string_view>
DefaultBlockedPatterns() noexcept;

} // namespace MountPolicy
