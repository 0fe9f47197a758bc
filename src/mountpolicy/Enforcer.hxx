// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "Group.hxx"
#include "ResolvedMount.hxx"

#include <vector>

namespace MountPolicy {

struct MountAllowlist;
class PathNormalizer;

/**
 * The last check before mounts are handed to the container runtime.
 * It re-validates a resolved mount list against the allowlist
 * snapshot which is current *now*; the allowlist may have been
 * reloaded (or the file system modified) since the list was
 * resolved.
 *
 * The Enforcer can only remove mounts or make them read-only; it
 * never grants anything that the resolver did not.
 */
class Enforcer {
	const PathNormalizer &normalizer;

public:
	explicit Enforcer(const PathNormalizer &_normalizer) noexcept
		:normalizer(_normalizer) {}

	/**
	 * @return the mounts which still pass, and the dropped ones
	 * in MountPlan::rejections
	 *
	 * Throws #LaunchAbortedError if the workspace mount does not
	 * pass anymore.
	 */
	MountPlan Enforce(const MountAllowlist &current,
			  GroupDesignation designation,
			  std::vector<ResolvedMount> &&mounts) const;
};

} // namespace MountPolicy
