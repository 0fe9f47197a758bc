// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include <nlohmann/json_fwd.hpp>

namespace MountPolicy {

struct ResolvedMount;
struct MountPlan;

/**
 * Serialize in the form consumed by the container runtime:
 * {"hostPath", "containerPath", "writable"}.
 */
nlohmann::json
ToJson(const ResolvedMount &mount) noexcept;

/**
 * Serialize a plan: {"mounts": [...], "rejected": [{"hostPath",
 * "error"}]}.
 */
nlohmann::json
ToJson(const MountPlan &plan) noexcept;

} // namespace MountPolicy
