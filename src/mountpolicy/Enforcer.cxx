// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "Enforcer.hxx"
#include "MountCheck.hxx"
#include "Allowlist.hxx"
#include "Error.hxx"
#include "PathNormalizer.hxx"
#include "io/Logger.hxx"

#include <fmt/format.h>

namespace MountPolicy {

static const ChildLogger logger{LLogger{"mountpolicy"}, "enforcer"};

/**
 * The host path was canonical when it was resolved; if it
 * canonicalizes to something else now, a symlink was swapped in
 * meanwhile.
 */
static void
VerifyUnchanged(const ResolvedMount &mount, std::string_view now)
{
	if (now != mount.host_path)
		throw NormalizationError{fmt::format("Path '{}' now resolves to '{}'",
						     mount.host_path, now)};
}

static void
EnforceWorkspace(const MountAllowlist &current, const PathNormalizer &normalizer,
		 GroupDesignation designation, ResolvedMount &mount)
{
	try {
		VerifyUnchanged(mount, normalizer.Normalize(mount.host_path));

		if (IsPathBlocked(current, mount.host_path))
			throw MountDeniedError{MountDeniedError::Reason::BLOCKED,
				fmt::format("Path '{}' matches a blocked pattern",
					    mount.host_path)};
	} catch (...) {
		std::throw_with_nested(LaunchAbortedError{fmt::format("Workspace mount '{}' was rejected",
								      mount.host_path)});
	}

	mount.writable = IsWritable(current, designation, true, mount.writable);
}

MountPlan
Enforcer::Enforce(const MountAllowlist &current, GroupDesignation designation,
		  std::vector<ResolvedMount> &&mounts) const
{
	MountPlan plan;
	plan.mounts.reserve(mounts.size());

	AllowedRootIndex roots{current, normalizer};

	for (auto &mount : mounts) {
		if (mount.workspace) {
			EnforceWorkspace(current, normalizer, designation, mount);
			plan.mounts.emplace_back(std::move(mount));
			continue;
		}

		try {
			auto checked = CheckHostPath(roots, designation,
						     mount.host_path,
						     mount.writable);
			VerifyUnchanged(mount, checked.host_path);

			if (mount.writable && !checked.writable)
				logger.Fmt(2, "Downgrading '{}' to read-only",
					   mount.host_path);

			mount.writable = checked.writable;
			plan.mounts.emplace_back(std::move(mount));
		} catch (...) {
			plan.rejections.push_back({
				mount.host_path,
				std::current_exception(),
			});
		}
	}

	return plan;
}

} // namespace MountPolicy
