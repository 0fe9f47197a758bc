// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include <atomic>
#include <chrono>
#include <string>
#include <string_view>

namespace MountPolicy {

/**
 * Resolve all symlinks and "."/".." segments of an absolute path,
 * like realpath(3), but check the #cancel flag between two file
 * system accesses.  Every path component must exist.
 *
 * Throws #NormalizationError on error.
 */
std::string
CanonicalizePath(const std::string &path, const std::atomic_bool &cancel);

/**
 * Converts host paths from the allowlist and from mount requests to
 * canonical absolute paths, so the allowlist checks operate on what
 * will actually be mounted.
 *
 * The file system walk runs in a worker thread; if it does not
 * finish within the configured timeout (e.g. because a network file
 * system hangs), Normalize() fails with a #NormalizationError and
 * the worker is told to give up.  A worker blocked inside a system
 * call cannot be interrupted, so it keeps running until the kernel
 * returns; while #MAX_PENDING_WORKERS of them (process-wide) are
 * still running, Normalize() fails immediately.
 */
class PathNormalizer {
public:
	using CanonicalizeFunction = std::string(*)(const std::string &path,
						    const std::atomic_bool &cancel);

	static constexpr std::chrono::milliseconds DEFAULT_TIMEOUT{2000};

	static constexpr unsigned MAX_PENDING_WORKERS = 16;

private:
	std::string home;

	std::chrono::milliseconds timeout;

	CanonicalizeFunction canonicalize;

public:
	/**
	 * @param _home the directory which replaces a leading "~"
	 * @param _canonicalize the function performing the file
	 * system walk; replaceable for unit tests
	 */
	explicit PathNormalizer(std::string _home,
				std::chrono::milliseconds _timeout=DEFAULT_TIMEOUT,
				CanonicalizeFunction _canonicalize=CanonicalizePath) noexcept
		:home(std::move(_home)), timeout(_timeout),
		 canonicalize(_canonicalize) {}

	/**
	 * Construct an instance for the home directory of the
	 * current user ($HOME or the passwd database).
	 *
	 * Throws if the home directory cannot be determined.
	 */
	static PathNormalizer ForCurrentUser(std::chrono::milliseconds timeout=DEFAULT_TIMEOUT);

	/**
	 * The number of worker threads still running (in all
	 * instances).
	 */
	static unsigned GetPendingWorkers() noexcept;

	const std::string &GetHome() const noexcept {
		return home;
	}

	/**
	 * Replace a leading "~" or "~/" with the home directory.
	 * Other paths are returned unmodified.
	 */
	[[gnu::pure]]
	std::string ExpandHome(std::string_view path) const noexcept;

	/**
	 * Expand the home directory and canonicalize the path.
	 *
	 * Throws #NormalizationError on error or timeout.
	 */
	std::string Normalize(std::string_view path) const;
};

} // namespace MountPolicy
