// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "PathNormalizer.hxx"
#include "Error.hxx"
#include "lib/fmt/RuntimeError.hxx"
#include "util/ScopeExit.hxx"

#include <fmt/format.h>

#include <deque>
#include <future>
#include <memory>
#include <thread>
#include <vector>

#include <errno.h>
#include <limits.h>
#include <pwd.h>
#include <stdlib.h>
#include <string.h>
#include <sys/stat.h>
#include <unistd.h>

namespace MountPolicy {

/**
 * Give up after following this many symlinks (same limit as the
 * Linux kernel's path walk).
 */
static constexpr unsigned MAX_SYMLINK_HOPS = 40;

/**
 * The number of worker threads which are still running, including
 * those which have timed out and are stuck in the kernel.
 */
static std::atomic_uint pending_workers{0};

static void
PushSegments(std::deque<std::string> &pending, std::string_view path)
{
	/* insert in reverse order at the front, so the first segment
	   of #path is processed next */
	std::vector<std::string> segments;

	while (!path.empty()) {
		const auto slash = path.find('/');
		const auto segment = path.substr(0, slash);
		if (!segment.empty() && segment != ".")
			segments.emplace_back(segment);

		if (slash == path.npos)
			break;

		path.remove_prefix(slash + 1);
	}

	pending.insert(pending.begin(), segments.begin(), segments.end());
}

static std::string
Join(const std::vector<std::string> &segments)
{
	if (segments.empty())
		return "/";

	std::string result;
	for (const auto &i : segments) {
		result.push_back('/');
		result += i;
	}

	return result;
}

static std::string
ReadLink(const std::string &path)
{
	char buffer[PATH_MAX];
	const ssize_t length = readlink(path.c_str(), buffer, sizeof(buffer));
	if (length < 0)
		throw NormalizationError{fmt::format("Failed to read symlink {}: {}",
						     path, strerror(errno))};

	if (std::size_t(length) >= sizeof(buffer))
		throw NormalizationError{fmt::format("Symlink target too long: {}",
						     path)};

	return {buffer, std::size_t(length)};
}

std::string
CanonicalizePath(const std::string &path, const std::atomic_bool &cancel)
{
	if (path.empty() || path.front() != '/')
		throw NormalizationError{fmt::format("Not an absolute path: {}",
						     path)};

	std::deque<std::string> pending;
	PushSegments(pending, path);

	std::vector<std::string> resolved;
	unsigned hops = 0;

	while (!pending.empty()) {
		if (cancel.load(std::memory_order_relaxed))
			throw NormalizationError{fmt::format("Resolution of {} cancelled",
							     path), true};

		std::string segment = std::move(pending.front());
		pending.pop_front();

		if (segment == "..") {
			if (!resolved.empty())
				resolved.pop_back();
			continue;
		}

		resolved.emplace_back(std::move(segment));
		const std::string current = Join(resolved);

		struct stat st;
		if (lstat(current.c_str(), &st) < 0)
			throw NormalizationError{fmt::format("Failed to resolve {}: {}: {}",
							     path, current,
							     strerror(errno))};

		if (S_ISLNK(st.st_mode)) {
			if (++hops > MAX_SYMLINK_HOPS)
				throw NormalizationError{fmt::format("Too many levels of symbolic links: {}",
								     path)};

			const auto target = ReadLink(current);
			resolved.pop_back();

			if (!target.empty() && target.front() == '/')
				resolved.clear();

			PushSegments(pending, target);
		} else if (!S_ISDIR(st.st_mode) && !pending.empty())
			throw NormalizationError{fmt::format("Failed to resolve {}: {}: {}",
							     path, current,
							     strerror(ENOTDIR))};
	}

	return Join(resolved);
}

unsigned
PathNormalizer::GetPendingWorkers() noexcept
{
	return pending_workers.load();
}

PathNormalizer
PathNormalizer::ForCurrentUser(std::chrono::milliseconds timeout)
{
	if (const char *home = getenv("HOME"); home != nullptr && *home == '/')
		return PathNormalizer{home, timeout};

	const auto *pw = getpwuid(getuid());
	if (pw == nullptr || pw->pw_dir == nullptr || *pw->pw_dir != '/')
		throw FmtRuntimeError("Failed to determine the home directory of uid {}",
				      getuid());

	return PathNormalizer{pw->pw_dir, timeout};
}

std::string
PathNormalizer::ExpandHome(std::string_view path) const noexcept
{
	if (path == "~")
		return home;

	if (path.starts_with("~/")) {
		std::string result = home;
		result.append(path.substr(1));
		return result;
	}

	return std::string{path};
}

std::string
PathNormalizer::Normalize(std::string_view path) const
{
	if (path.find('\0') != path.npos)
		throw NormalizationError{"Path contains a null byte"};

	std::string expanded = ExpandHome(path);
	if (expanded.empty() || expanded.front() != '/')
		throw NormalizationError{fmt::format("Not an absolute path: {}",
						     path)};

	/* the worker thread may outlive this call (after a timeout),
	   so everything it touches is owned by the task */
	auto cancel = std::make_shared<std::atomic_bool>(false);
	auto task = std::make_shared<std::packaged_task<std::string()>>
		([f = canonicalize, p = std::move(expanded), cancel](){
			return f(p, *cancel);
		});

	auto result = task->get_future();

	if (pending_workers.fetch_add(1) >= MAX_PENDING_WORKERS) {
		--pending_workers;
		throw NormalizationError{fmt::format("Too many pending lookups, not resolving {}",
						     path), true};
	}

	try {
		std::thread([task](){
			AtScopeExit() { --pending_workers; };
			(*task)();
		}).detach();
	} catch (...) {
		--pending_workers;
		throw;
	}

	if (result.wait_for(timeout) != std::future_status::ready) {
		cancel->store(true, std::memory_order_relaxed);
		throw NormalizationError{fmt::format("Timeout while resolving {}",
						     path), true};
	}

	return result.get();
}

} // namespace MountPolicy
