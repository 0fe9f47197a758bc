// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "MountCheck.hxx"
#include "Allowlist.hxx"
#include "Error.hxx"
#include "PathNormalizer.hxx"
#include "PatternMatcher.hxx"
#include "io/Logger.hxx"
#include "util/Exception.hxx"

#include <fmt/format.h>

namespace MountPolicy {

static const LLogger logger{"mountpolicy"};

bool
IsPathCovered(std::string_view path, std::string_view root) noexcept
{
	if (!path.starts_with(root))
		return false;

	if (path.size() == root.size())
		return true;

	/* prefix must end at a segment boundary: "/foo" covers
	   "/foo/bar", but not "/foobar" */
	return root.ends_with('/') || path[root.size()] == '/';
}

bool
IsPathBlocked(const MountAllowlist &allowlist, std::string_view path) noexcept
{
	return IsBlocked(path, allowlist.blocked_patterns) ||
		IsBlocked(path, DefaultBlockedPatterns());
}

bool
IsWritable(const MountAllowlist &allowlist, GroupDesignation designation,
	   bool allow_read_write, bool requested_writable) noexcept
{
	const bool designation_allows = !allowlist.non_main_read_only ||
		designation == GroupDesignation::MAIN;

	return requested_writable && allow_read_write && designation_allows;
}

void
AllowedRootIndex::Initialize()
{
	initialized = true;
	normalized.reserve(allowlist.allowed_roots.size());

	for (const auto &i : allowlist.allowed_roots) {
		try {
			normalized.emplace_back(normalizer.Normalize(i.path));
		} catch (const std::exception &e) {
			logger.Fmt(2, "Ignoring allowed root '{}': {}",
				   i.path, GetFullMessage(e));
			normalized.emplace_back(std::nullopt);
		}
	}
}

const AllowedRoot *
AllowedRootIndex::FindCovering(std::string_view path)
{
	if (!initialized)
		Initialize();

	const AllowedRoot *best = nullptr;
	std::size_t best_length = 0;

	for (std::size_t i = 0; i < normalized.size(); ++i) {
		const auto &root = normalized[i];
		if (!root || !IsPathCovered(path, *root))
			continue;

		/* strictly longer only: on a tie, the earlier
		   declaration wins */
		if (best == nullptr || root->size() > best_length) {
			best = &allowlist.allowed_roots[i];
			best_length = root->size();
		}
	}

	return best;
}

CheckedHostPath
CheckHostPath(AllowedRootIndex &roots, GroupDesignation designation,
	      std::string_view host_path, bool requested_writable)
{
	std::string path = roots.GetNormalizer().Normalize(host_path);

	if (IsPathBlocked(roots.GetAllowlist(), path))
		throw MountDeniedError{MountDeniedError::Reason::BLOCKED,
			fmt::format("Path '{}' matches a blocked pattern",
				    path)};

	const auto *root = roots.FindCovering(path);
	if (root == nullptr)
		throw MountDeniedError{MountDeniedError::Reason::NOT_COVERED,
			fmt::format("Path '{}' is not below any allowed root",
				    path)};

	const bool writable = IsWritable(roots.GetAllowlist(), designation,
					 root->allow_read_write,
					 requested_writable);

	logger.Fmt(3, "Path '{}' covered by root '{}', writable={}",
		   path, root->path, writable);

	return {std::move(path), writable};
}

} // namespace MountPolicy
