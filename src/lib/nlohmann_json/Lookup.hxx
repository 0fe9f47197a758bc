// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include <nlohmann/json.hpp>

#include <string_view>

namespace Json {

/**
 * Look up a member of a JSON object.  Returns nullptr if #j is not
 * an object or if there is no such member.
 */
[[gnu::pure]]
inline const nlohmann::json *
Lookup(const nlohmann::json &j, const char *key) noexcept
{
	if (!j.is_object())
		return nullptr;

	const auto i = j.find(key);
	return i != j.end()
		? &*i
		: nullptr;
}

/**
 * Like Lookup(), but return the value only if it is a string.
 */
[[gnu::pure]]
inline const std::string *
LookupString(const nlohmann::json &j, const char *key) noexcept
{
	const auto *v = Lookup(j, key);
	return v != nullptr && v->is_string()
		? v->get_ptr<const std::string *>()
		: nullptr;
}

/**
 * Return the string value of a member, or an empty string_view if
 * it does not exist or is not a string.
 */
[[gnu::pure]]
inline std::string_view
GetStringRobust(const nlohmann::json &j, const char *key) noexcept
{
	if (const auto *s = LookupString(j, key))
		return *s;
	else
		return {};
}

} // namespace Json
