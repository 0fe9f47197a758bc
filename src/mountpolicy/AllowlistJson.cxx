// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "AllowlistJson.hxx"
#include "Allowlist.hxx"
#include "Error.hxx"
#include "lib/nlohmann_json/Lookup.hxx"

#include <nlohmann/json.hpp>

namespace MountPolicy {

static const nlohmann::json &
ExpectField(const nlohmann::json &j, const char *name)
{
	const auto *value = Json::Lookup(j, name);
	if (value == nullptr)
		throw SchemaError::MissingField(name);

	return *value;
}

static AllowedRoot
ParseAllowedRoot(const nlohmann::json &j, std::size_t index)
{
	if (!j.is_object())
		throw SchemaError::InvalidRoot(index, "not an object");

	if (Json::Lookup(j, "mode") != nullptr)
		/* this legacy field used to be silently ignored,
		   which made the root read-only */
		throw SchemaError::InvalidRoot(index,
					       "field \"mode\" is not supported, use \"allowReadWrite\"");

	const auto *path = Json::LookupString(j, "path");
	if (path == nullptr || path->empty())
		throw SchemaError::InvalidRoot(index,
					       "\"path\" must be a non-empty string");

	const auto *allow_read_write = Json::Lookup(j, "allowReadWrite");
	if (allow_read_write == nullptr)
		throw SchemaError::InvalidRoot(index,
					       "missing \"allowReadWrite\"");

	if (!allow_read_write->is_boolean())
		throw SchemaError::InvalidRoot(index,
					       "\"allowReadWrite\" must be a boolean");

	AllowedRoot root{*path, allow_read_write->get<bool>(), std::nullopt};

	if (const auto *description = Json::Lookup(j, "description")) {
		if (!description->is_string())
			throw SchemaError::InvalidRoot(index,
						       "\"description\" must be a string");

		root.description = description->get<std::string>();
	}

	return root;
}

MountAllowlist
AllowlistFromJson(const nlohmann::json &j)
{
	if (!j.is_object())
		throw SchemaError::Syntax("not a JSON object");

	const auto &allowed_roots = ExpectField(j, "allowedRoots");
	const auto &blocked_patterns = ExpectField(j, "blockedPatterns");
	const auto &non_main_read_only = ExpectField(j, "nonMainReadOnly");

	if (!allowed_roots.is_array())
		throw SchemaError::InvalidType("allowedRoots", "an array");

	if (!blocked_patterns.is_array())
		throw SchemaError::InvalidType("blockedPatterns", "an array");

	if (!non_main_read_only.is_boolean())
		throw SchemaError::InvalidType("nonMainReadOnly", "a boolean");

	MountAllowlist allowlist;
	allowlist.non_main_read_only = non_main_read_only.get<bool>();

	std::size_t index = 0;
	for (const auto &i : allowed_roots)
		allowlist.allowed_roots.emplace_back(ParseAllowedRoot(i, index++));

	for (const auto &i : blocked_patterns) {
		if (!i.is_string() || i.get_ref<const std::string &>().empty())
			throw SchemaError::InvalidType("blockedPatterns",
						       "an array of non-empty strings");

		allowlist.blocked_patterns.emplace_back(i.get<std::string>());
	}

	return allowlist;
}

MountAllowlist
ParseAllowlist(std::string_view text)
{
	nlohmann::json j;

	try {
		j = nlohmann::json::parse(text);
	} catch (const nlohmann::json::parse_error &e) {
		throw SchemaError::Syntax(e.what());
	}

	return AllowlistFromJson(j);
}

nlohmann::json
ToJson(const MountAllowlist &allowlist) noexcept
{
	auto roots = nlohmann::json::array();
	for (const auto &i : allowlist.allowed_roots) {
		nlohmann::json root{
			{"path", i.path},
			{"allowReadWrite", i.allow_read_write},
		};

		if (i.description)
			root["description"] = *i.description;

		roots.emplace_back(std::move(root));
	}

	return {
		{"allowedRoots", std::move(roots)},
		{"blockedPatterns", allowlist.blocked_patterns},
		{"nonMainReadOnly", allowlist.non_main_read_only},
	};
}

MountAllowlist
MakeAllowlistTemplate() noexcept
{
	return {
		.allowed_roots = {
			{"~/projects", true, "Development projects"},
			{"~/repos", true, "Git repositories"},
			{"~/Documents/work", false, "Work documents (read-only)"},
		},
		.blocked_patterns = {"password", "secret", "token"},
		.non_main_read_only = true,
	};
}

} // namespace MountPolicy
