// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "PatternMatcher.hxx"

#include <fmt/format.h>

#include <algorithm>
#include <vector>

#include <fnmatch.h>

using std::string_view_literals::operator""sv;

namespace MountPolicy {

static std::vector<std::string>
SplitSegments(std::string_view s) noexcept
{
	std::vector<std::string> result;

	while (!s.empty()) {
		const auto slash = s.find('/');
		const auto segment = s.substr(0, slash);
		if (!segment.empty())
			result.emplace_back(segment);

		if (slash == s.npos)
			break;

		s.remove_prefix(slash + 1);
	}

	return result;
}

[[gnu::pure]]
static bool
HasWildcard(std::string_view s) noexcept
{
	return s.find_first_of("*?[\\") != s.npos;
}

using SegmentIterator = std::vector<std::string>::const_iterator;

[[gnu::pure]]
static bool
MatchSegments(SegmentIterator pattern, SegmentIterator pattern_end,
	      SegmentIterator path, SegmentIterator path_end) noexcept
{
	while (pattern != pattern_end) {
		if (*pattern == "**"sv) {
			++pattern;

			/* "**" swallows zero or more segments; try
			   every possible split */
			for (auto i = path;; ++i) {
				if (MatchSegments(pattern, pattern_end,
						  i, path_end))
					return true;

				if (i == path_end)
					return false;
			}
		}

		if (path == path_end ||
		    fnmatch(pattern->c_str(), path->c_str(), 0) != 0)
			return false;

		++pattern;
		++path;
	}

	return path == path_end;
}

bool
MatchBlockedPattern(std::string_view path, std::string_view pattern) noexcept
{
	if (pattern.empty())
		return false;

	const bool anchored = pattern.front() == '/';

	auto pattern_segments = SplitSegments(pattern);
	if (pattern_segments.empty())
		/* "/" would block everything; that is not a
		   meaningful pattern */
		return false;

	if (pattern.find('/') == pattern.npos) {
		/* a plain name blocks every segment containing it,
		   e.g. ".gpg" blocks "keyring.gpg" */
		if (!HasWildcard(pattern))
			pattern_segments.front() = fmt::format("*{}*", pattern);

		pattern_segments.insert(pattern_segments.begin(), "**");
		pattern_segments.emplace_back("**");
	}

	/* collapse "**" runs, they are redundant and make the
	   backtracking more expensive */
	pattern_segments.erase(std::unique(pattern_segments.begin(),
					   pattern_segments.end(),
					   [](const auto &a, const auto &b){
						   return a == "**"sv && b == "**"sv;
					   }),
			       pattern_segments.end());

	const auto path_segments = SplitSegments(path);

	if (anchored)
		return MatchSegments(pattern_segments.begin(),
				     pattern_segments.end(),
				     path_segments.begin(),
				     path_segments.end());

	for (auto i = path_segments.begin();; ++i) {
		if (MatchSegments(pattern_segments.begin(),
				  pattern_segments.end(),
				  i, path_segments.end()))
			return true;

		if (i == path_segments.end())
			return false;
	}
}

bool
IsBlocked(std::string_view path, std::span<const std::string> patterns) noexcept
{
	return std::any_of(patterns.begin(), patterns.end(),
			   [path](const auto &pattern){
				   return MatchBlockedPattern(path, pattern);
			   });
}

bool
IsBlocked(std::string_view path, std::span<const std::string_view> patterns) noexcept
{
	return std::any_of(patterns.begin(), patterns.end(),
			   [path](const auto &pattern){
				   return MatchBlockedPattern(path, pattern);
			   });
}

} // namespace MountPolicy
