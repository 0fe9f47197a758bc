// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include <fmt/core.h>

#include <system_error>

#include <errno.h>

/**
 * Build a std::system_error from an errno value and a formatted
 * message.
 */
[[gnu::pure]]
std::system_error
VFmtErrno(int code, fmt::string_view format_str, fmt::format_args args) noexcept;

template<typename S, typename... Args>
[[gnu::pure]]
auto
FmtErrno(int code, const S &format_str, Args&&... args) noexcept
{
	return VFmtErrno(code, format_str, fmt::make_format_args(args...));
}

/**
 * Like FmtErrno(int, ...), but use the current value of errno.
 */
template<typename S, typename... Args>
auto
FmtErrno(const S &format_str, Args&&... args) noexcept
{
	const int code = errno;
	return VFmtErrno(code, format_str, fmt::make_format_args(args...));
}
