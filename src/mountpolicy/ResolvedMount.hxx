// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include <exception>
#include <string>
#include <vector>

namespace MountPolicy {

/**
 * A mount which has passed all checks.  This is what gets handed to
 * the container runtime.
 */
struct ResolvedMount {
	/**
	 * The canonical host path.
	 */
	std::string host_path;

	/**
	 * The absolute path inside the container.
	 */
	std::string container_path;

	bool writable;

	/**
	 * Is this the implicit workspace mount of the group?  Losing
	 * it aborts the launch.
	 */
	bool workspace = false;

	bool operator==(const ResolvedMount &) const noexcept = default;
};

/**
 * A mount request which was dropped.
 */
struct MountRejection {
	/**
	 * The host path as requested.
	 */
	std::string host_path;

	/**
	 * The reason; one of the exception classes declared in
	 * Error.hxx (possibly with a nested cause).
	 */
	std::exception_ptr error;
};

/**
 * The outcome of mount resolution for one launch.
 */
struct MountPlan {
	std::vector<ResolvedMount> mounts;
	std::vector<MountRejection> rejections;
};

} // namespace MountPolicy
