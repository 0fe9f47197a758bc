// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include <nlohmann/json_fwd.hpp>

#include <string_view>

namespace MountPolicy {

struct MountAllowlist;

/**
 * Validate a parsed JSON document and convert it to a
 * #MountAllowlist.  Nothing is filled in with defaults: every
 * mandatory field must be present with the right type.
 *
 * Throws #SchemaError on error.
 */
MountAllowlist
AllowlistFromJson(const nlohmann::json &j);

/**
 * Parse and validate allowlist JSON text.
 *
 * Throws #SchemaError on error.
 */
MountAllowlist
ParseAllowlist(std::string_view text);

nlohmann::json
ToJson(const MountAllowlist &allowlist) noexcept;

/**
 * Generate a starting point for a new allowlist file.  All roots
 * below the home directory, non-main groups read-only.
 */
MountAllowlist
MakeAllowlistTemplate() noexcept;

} // namespace MountPolicy
