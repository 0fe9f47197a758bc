// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "Group.hxx"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace MountPolicy {

struct AllowedRoot;
struct MountAllowlist;
class PathNormalizer;

/**
 * The allowed roots of one allowlist snapshot, normalized on first
 * use.  An instance lives only for the duration of one resolution
 * or enforcement pass, so it observes the file system as it is at
 * that time.
 */
class AllowedRootIndex {
	const MountAllowlist &allowlist;
	const PathNormalizer &normalizer;

	/**
	 * Parallel to MountAllowlist::allowed_roots; std::nullopt for
	 * roots which could not be normalized (they cover nothing).
	 */
	std::vector<std::optional<std::string>> normalized;

	bool initialized = false;

public:
	AllowedRootIndex(const MountAllowlist &_allowlist,
			 const PathNormalizer &_normalizer) noexcept
		:allowlist(_allowlist), normalizer(_normalizer) {}

	const MountAllowlist &GetAllowlist() const noexcept {
		return allowlist;
	}

	const PathNormalizer &GetNormalizer() const noexcept {
		return normalizer;
	}

	/**
	 * Find the most specific root covering the given normalized
	 * path.  On equal specificity, the first declared root wins.
	 *
	 * @return the root or nullptr if no root covers the path
	 */
	const AllowedRoot *FindCovering(std::string_view path);

private:
	void Initialize();
};

/**
 * Is the given normalized path equal to or below #root?
 */
[[gnu::pure]]
bool
IsPathCovered(std::string_view path, std::string_view root) noexcept;

/**
 * Does the normalized path match one of the allowlist's blocked
 * patterns or one of the built-in ones?
 */
[[gnu::pure]]
bool
IsPathBlocked(const MountAllowlist &allowlist, std::string_view path) noexcept;

/**
 * Write access requires agreement of the request, the allowed root
 * and the group designation.
 */
[[gnu::pure]]
bool
IsWritable(const MountAllowlist &allowlist, GroupDesignation designation,
	   bool allow_read_write, bool requested_writable) noexcept;

struct CheckedHostPath {
	std::string host_path;
	bool writable;
};

/**
 * Normalize the host path, check it against the blocked patterns and
 * the allowed roots, and calculate the effective permission.
 *
 * Throws #NormalizationError or #MountDeniedError if the path must
 * not be mounted.
 */
CheckedHostPath
CheckHostPath(AllowedRootIndex &roots, GroupDesignation designation,
	      std::string_view host_path, bool requested_writable);

} // namespace MountPolicy
