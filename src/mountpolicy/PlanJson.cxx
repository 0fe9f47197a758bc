// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "PlanJson.hxx"
#include "ResolvedMount.hxx"
#include "util/Exception.hxx"

#include <nlohmann/json.hpp>

namespace MountPolicy {

nlohmann::json
ToJson(const ResolvedMount &mount) noexcept
{
	return {
		{"hostPath", mount.host_path},
		{"containerPath", mount.container_path},
		{"writable", mount.writable},
	};
}

nlohmann::json
ToJson(const MountPlan &plan) noexcept
{
	auto mounts = nlohmann::json::array();
	for (const auto &i : plan.mounts)
		mounts.push_back(ToJson(i));

	auto rejected = nlohmann::json::array();
	for (const auto &i : plan.rejections)
		rejected.push_back({
			{"hostPath", i.host_path},
			{"error", GetFullMessage(i.error)},
		});

	return {
		{"mounts", std::move(mounts)},
		{"rejected", std::move(rejected)},
	};
}

} // namespace MountPolicy
