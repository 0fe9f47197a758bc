// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "GroupConfig.hxx"
#include "Error.hxx"
#include "lib/fmt/RuntimeError.hxx"
#include "lib/nlohmann_json/Lookup.hxx"
#include "util/CharUtil.hxx"
#include "util/StringVerify.hxx"

#include <nlohmann/json.hpp>

namespace MountPolicy {

static constexpr std::size_t MAX_FOLDER_LENGTH = 64;

static constexpr bool
IsFolderChar(char ch) noexcept
{
	return IsAlphaNumericASCII(ch) || ch == '_' || ch == '-';
}

bool
IsValidGroupFolder(std::string_view folder) noexcept
{
	return !folder.empty() && folder.size() <= MAX_FOLDER_LENGTH &&
		IsAlphaNumericASCII(folder.front()) &&
		CheckChars(folder, IsFolderChar);
}

static AdditionalMount
ParseAdditionalMount(const nlohmann::json &j)
{
	if (!j.is_object())
		throw std::runtime_error{"Mount request is not an object"};

	const auto *host_path = Json::LookupString(j, "hostPath");
	if (host_path == nullptr || host_path->empty())
		throw std::runtime_error{"Mount request lacks \"hostPath\""};

	AdditionalMount mount{*host_path, std::nullopt};

	if (const auto *container_path = Json::Lookup(j, "containerPath")) {
		if (!container_path->is_string())
			throw InvalidContainerPathError{"\"containerPath\" must be a string"};

		mount.container_path = container_path->get<std::string>();
	}

	if (const auto *readonly = Json::Lookup(j, "readonly"))
		/* anything but an explicit "false" means read-only */
		mount.readonly = !readonly->is_boolean() || readonly->get<bool>();

	return mount;
}

MountRequests
ParseAdditionalMounts(std::optional<std::string_view> container_config)
{
	MountRequests result;

	if (!container_config)
		return result;

	nlohmann::json j;

	try {
		j = nlohmann::json::parse(*container_config);
	} catch (const nlohmann::json::parse_error &e) {
		throw FmtRuntimeError("Malformed container config: {}", e.what());
	}

	if (!j.is_object())
		throw std::runtime_error{"Malformed container config: not an object"};

	const auto *additional_mounts = Json::Lookup(j, "additionalMounts");
	if (additional_mounts == nullptr || additional_mounts->is_null())
		return result;

	if (!additional_mounts->is_array())
		throw std::runtime_error{"Malformed container config: \"additionalMounts\" is not an array"};

	for (const auto &i : *additional_mounts) {
		try {
			result.mounts.emplace_back(ParseAdditionalMount(i));
		} catch (...) {
			result.rejections.push_back({
				std::string{Json::GetStringRobust(i, "hostPath")},
				std::current_exception(),
			});
		}
	}

	return result;
}

} // namespace MountPolicy
