// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "Group.hxx"
#include "ResolvedMount.hxx"

#include <string_view>

namespace MountPolicy {

class AllowlistStore;
class PathNormalizer;
struct ResolverOptions;

/**
 * Calculates the mounts of one container launch: resolves the
 * group's requests against the current allowlist snapshot and
 * re-validates the result against whatever snapshot is current
 * right before the launch.
 */
class MountPlanner {
	const AllowlistStore &store;
	const PathNormalizer &normalizer;
	const ResolverOptions &options;

public:
	MountPlanner(const AllowlistStore &_store,
		     const PathNormalizer &_normalizer,
		     const ResolverOptions &_options) noexcept
		:store(_store), normalizer(_normalizer), options(_options) {}

	/**
	 * Every rejected request is logged and listed in
	 * MountPlan::rejections.  A malformed container
	 * configuration is logged, and the group gets no additional
	 * mounts.
	 *
	 * Throws #NoAllowlistError if no allowlist has been loaded,
	 * #LaunchAbortedError if the workspace directory cannot be
	 * mounted.
	 */
	MountPlan Plan(const GroupRecord &group, GroupDesignation designation,
		       std::string_view workspace_host_path) const;
};

} // namespace MountPolicy
