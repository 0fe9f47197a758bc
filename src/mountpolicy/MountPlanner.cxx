// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "MountPlanner.hxx"
#include "MountResolver.hxx"
#include "Enforcer.hxx"
#include "GroupConfig.hxx"
#include "AllowlistStore.hxx"
#include "Error.hxx"
#include "io/Logger.hxx"
#include "util/Exception.hxx"

namespace MountPolicy {

static const ChildLogger logger{LLogger{"mountpolicy"}, "planner"};

static MountRequests
ParseRequests(const GroupRecord &group)
{
	try {
		return ParseAdditionalMounts(group.container_config);
	} catch (const std::exception &e) {
		logger.Fmt(1, "Ignoring container configuration of group '{}': {}",
			   group.folder, GetFullMessage(e));
		return {};
	}
}

static void
Append(std::vector<MountRejection> &dest, std::vector<MountRejection> &&src)
{
	dest.insert(dest.end(),
		    std::make_move_iterator(src.begin()),
		    std::make_move_iterator(src.end()));
}

MountPlan
MountPlanner::Plan(const GroupRecord &group, GroupDesignation designation,
		   std::string_view workspace_host_path) const
{
	const auto snapshot = store.Get();
	if (!snapshot)
		throw NoAllowlistError{"No valid mount allowlist has been loaded"};

	auto requests = ParseRequests(group);

	const MountResolver resolver{normalizer, options};
	auto resolved = resolver.Resolve(*snapshot, designation,
					 workspace_host_path,
					 requests.mounts);

	/* the allowlist may have been reloaded meanwhile */
	auto current = store.Get();
	if (!current)
		throw NoAllowlistError{"No valid mount allowlist has been loaded"};

	const Enforcer enforcer{normalizer};
	auto plan = enforcer.Enforce(*current, designation,
				     std::move(resolved.mounts));

	std::vector<MountRejection> rejections = std::move(requests.rejections);
	Append(rejections, std::move(resolved.rejections));
	Append(rejections, std::move(plan.rejections));
	plan.rejections = std::move(rejections);

	for (const auto &i : plan.rejections)
		logger.Fmt(1, "Group '{}' ({}): rejected mount '{}': {}",
			   group.folder, ToString(designation),
			   i.host_path, GetFullMessage(i.error));

	return plan;
}

} // namespace MountPolicy
