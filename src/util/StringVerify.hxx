// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include <algorithm>
#include <string_view>

/**
 * Is every character of the string accepted by the predicate?  An
 * empty string passes.
 */
template<typename F>
constexpr bool
CheckChars(std::string_view s, F &&f) noexcept
{
	return std::all_of(s.begin(), s.end(), std::forward<F>(f));
}
