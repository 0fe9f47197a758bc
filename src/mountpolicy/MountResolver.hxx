// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "Group.hxx"
#include "ResolvedMount.hxx"

#include <span>
#include <string>
#include <string_view>

namespace MountPolicy {

struct MountAllowlist;
class PathNormalizer;

/**
 * The layout of mounts inside the container.
 */
struct ResolverOptions {
	/**
	 * Where the group's own workspace directory is mounted.
	 */
	std::string workspace_mount = "/workspace/group";

	/**
	 * Additional mounts are placed below this directory.
	 */
	std::string extra_mount_prefix = "/workspace/extra";
};

/**
 * Verify a requested container path and convert it to the
 * canonical relative form (no empty or "." segments).
 *
 * Throws #InvalidContainerPathError if the path is empty, absolute
 * or contains a ".." segment.
 */
std::string
VerifyContainerPath(std::string_view path);

/**
 * Derive a container path from the last segment of a host path.
 *
 * Throws #InvalidContainerPathError if there is no usable segment.
 */
std::string
DeriveContainerPath(std::string_view host_path);

/**
 * Turns a group's mount requests into the list of mounts permitted
 * by an allowlist snapshot.
 */
class MountResolver {
	const PathNormalizer &normalizer;
	const ResolverOptions &options;

public:
	MountResolver(const PathNormalizer &_normalizer,
		      const ResolverOptions &_options) noexcept
		:normalizer(_normalizer), options(_options) {}

	/**
	 * Resolve all requests.  The first mount of the result is
	 * always the workspace mount; requests which fail a check
	 * are skipped and listed in MountPlan::rejections.
	 *
	 * Throws #LaunchAbortedError if the workspace directory
	 * itself cannot be mounted.
	 */
	MountPlan Resolve(const MountAllowlist &allowlist,
			  GroupDesignation designation,
			  std::string_view workspace_host_path,
			  std::span<const AdditionalMount> requests) const;

private:
	ResolvedMount ResolveWorkspace(const MountAllowlist &allowlist,
				       GroupDesignation designation,
				       std::string_view host_path) const;
};

} // namespace MountPolicy
