// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "AllowlistStore.hxx"
#include "AllowlistJson.hxx"
#include "io/Logger.hxx"
#include "io/StringFile.hxx"

namespace MountPolicy {

static const LLogger logger{"allowlist"};

/**
 * Refuse to load allowlist files larger than this.
 */
static constexpr std::size_t MAX_ALLOWLIST_SIZE = 1024 * 1024;

MountAllowlist
LoadAllowlistFile(const char *path)
{
	return ParseAllowlist(LoadTextFile(path, MAX_ALLOWLIST_SIZE));
}

AllowlistStore::AllowlistStore(MountAllowlist &&initial) noexcept
	:current(std::make_shared<const MountAllowlist>(std::move(initial)))
{
}

std::shared_ptr<const MountAllowlist>
AllowlistStore::Publish(MountAllowlist &&allowlist) noexcept
{
	auto snapshot = std::make_shared<const MountAllowlist>(std::move(allowlist));
	current.store(snapshot);

	logger.Fmt(2, "Published allowlist with {} roots, {} blocked patterns, nonMainReadOnly={}",
		   snapshot->allowed_roots.size(),
		   snapshot->blocked_patterns.size(),
		   snapshot->non_main_read_only);

	return snapshot;
}

std::shared_ptr<const MountAllowlist>
AllowlistStore::Reload(const char *path)
{
	/* parse and validate completely before touching the current
	   snapshot */
	auto allowlist = LoadAllowlistFile(path);
	return Publish(std::move(allowlist));
}

std::shared_ptr<const MountAllowlist>
AllowlistStore::ReloadJson(std::string_view text)
{
	auto allowlist = ParseAllowlist(text);
	return Publish(std::move(allowlist));
}

} // namespace MountPolicy
