// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include <span>
#include <string>
#include <string_view>

namespace MountPolicy {

/**
 * Does the (normalized, absolute) path match the given blocked
 * pattern?
 *
 * Patterns are matched segment by segment: "**" matches any number
 * of segments (including none), every other segment is a shell
 * wildcard (fnmatch(3)) matching exactly one path segment.  The
 * pattern may match any suffix of the path, i.e. "foo/bar" matches
 * "/x/foo/bar".  A pattern starting with a slash is anchored at the
 * root instead.  A pattern without a slash (e.g. "*.pem") matches
 * if any one segment of the path matches it; if it contains no
 * wildcard either (e.g. ".ssh"), a segment containing it anywhere
 * is enough (".ssh" matches ".ssh_old").
 */
[[gnu::pure]]
bool
MatchBlockedPattern(std::string_view path, std::string_view pattern) noexcept;

/**
 * Does the path match any of the given patterns?
 */
[[gnu::pure]]
bool
IsBlocked(std::string_view path, std::span<const std::string> patterns) noexcept;

[[gnu::pure]]
bool
IsBlocked(std::string_view path, std::span<const std::string_view> patterns) noexcept;

} // namespace MountPolicy
