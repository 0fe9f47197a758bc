// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "MountResolver.hxx"
#include "MountCheck.hxx"
#include "Allowlist.hxx"
#include "Error.hxx"
#include "PathNormalizer.hxx"

#include <fmt/format.h>

#include <set>

using std::string_view_literals::operator""sv;

namespace MountPolicy {

std::string
VerifyContainerPath(std::string_view path)
{
	if (path.empty())
		throw InvalidContainerPathError{"Empty container path"};

	if (path.front() == '/')
		throw InvalidContainerPathError{fmt::format("Container path '{}' is absolute",
							    path)};

	if (path.find('\0') != path.npos)
		throw InvalidContainerPathError{"Container path contains a null byte"};

	std::string result;

	for (std::string_view rest = path; !rest.empty();) {
		const auto slash = rest.find('/');
		const auto segment = rest.substr(0, slash);

		if (segment == ".."sv)
			throw InvalidContainerPathError{fmt::format("Container path '{}' contains '..'",
								    path)};

		if (!segment.empty() && segment != "."sv) {
			if (!result.empty())
				result.push_back('/');
			result.append(segment);
		}

		if (slash == rest.npos)
			break;

		rest.remove_prefix(slash + 1);
	}

	if (result.empty())
		throw InvalidContainerPathError{fmt::format("Container path '{}' is empty",
							    path)};

	return result;
}

std::string
DeriveContainerPath(std::string_view host_path)
{
	while (host_path.ends_with('/'))
		host_path.remove_suffix(1);

	const auto slash = host_path.rfind('/');
	const auto name = slash == host_path.npos
		? host_path
		: host_path.substr(slash + 1);

	if (name.empty() || name == "~"sv || name == "."sv || name == ".."sv)
		throw InvalidContainerPathError{fmt::format("Cannot derive a container path from '{}'",
							    host_path)};

	return std::string{name};
}

static std::string
JoinContainerPath(std::string_view prefix, std::string_view relative) noexcept
{
	std::string result{prefix};
	while (result.ends_with('/'))
		result.pop_back();

	result.push_back('/');
	result.append(relative);
	return result;
}

ResolvedMount
MountResolver::ResolveWorkspace(const MountAllowlist &allowlist,
				GroupDesignation designation,
				std::string_view host_path) const
{
	std::string path;

	try {
		path = normalizer.Normalize(host_path);
	} catch (...) {
		std::throw_with_nested(LaunchAbortedError{fmt::format("Workspace directory '{}' is not usable",
								      host_path)});
	}

	if (IsPathBlocked(allowlist, path))
		throw LaunchAbortedError{fmt::format("Workspace directory '{}' matches a blocked pattern",
						     path)};

	/* the workspace is not subject to the allowed roots, but the
	   non-main read-only rule applies */
	const bool writable = IsWritable(allowlist, designation, true, true);

	return {std::move(path), options.workspace_mount, writable, true};
}

MountPlan
MountResolver::Resolve(const MountAllowlist &allowlist,
		       GroupDesignation designation,
		       std::string_view workspace_host_path,
		       std::span<const AdditionalMount> requests) const
{
	MountPlan plan;
	plan.mounts.emplace_back(ResolveWorkspace(allowlist, designation,
						  workspace_host_path));

	std::set<std::string, std::less<>> container_paths;
	container_paths.emplace(plan.mounts.front().container_path);

	AllowedRootIndex roots{allowlist, normalizer};

	for (const auto &request : requests) {
		try {
			auto checked = CheckHostPath(roots, designation,
						     request.host_path,
						     !request.readonly);

			const auto relative = request.container_path
				? VerifyContainerPath(*request.container_path)
				: DeriveContainerPath(request.host_path);

			auto container_path = JoinContainerPath(options.extra_mount_prefix,
								relative);
			if (!container_paths.emplace(container_path).second)
				throw DuplicateMountError{fmt::format("Container path '{}' is already in use",
								      container_path)};

			plan.mounts.push_back({
				std::move(checked.host_path),
				std::move(container_path),
				checked.writable,
			});
		} catch (...) {
			plan.rejections.push_back({
				request.host_path,
				std::current_exception(),
			});
		}
	}

	return plan;
}

} // namespace MountPolicy
