// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include <fmt/core.h>

#include <span>
#include <string>
#include <string_view>
#include <utility>

/*
 * Log lines are written to stderr, prefixed with the domain in
 * square brackets.  Level 1 is for errors and warnings; higher
 * levels are increasingly verbose.
 */

namespace LoggerDetail {

extern unsigned max_level;

inline bool
CheckLevel(unsigned level) noexcept
{
	return level <= max_level;
}

void
WriteV(std::string_view domain, std::span<const std::string_view> buffers) noexcept;

void
Fmt(unsigned level, std::string_view domain,
    fmt::string_view format_str, fmt::format_args args) noexcept;

} /* namespace LoggerDetail */

inline void
SetLogLevel(unsigned level) noexcept
{
	LoggerDetail::max_level = level;
}

template<typename S, typename... Args>
void
LogFmt(unsigned level, std::string_view domain,
       const S &format_str, Args&&... args) noexcept
{
	LoggerDetail::Fmt(level, domain, format_str,
			  fmt::make_format_args(args...));
}

template<typename Domain>
class BasicLogger : public Domain {
public:
	BasicLogger() = default;

	template<typename D>
	explicit BasicLogger(D &&_domain)
		:Domain(std::forward<D>(_domain)) {}

	template<typename S, typename... Args>
	void Fmt(unsigned level, const S &format_str,
		 Args&&... args) const noexcept {
		LoggerDetail::Fmt(level, Domain::GetDomain(), format_str,
				  fmt::make_format_args(args...));
	}
};

class LiteralLoggerDomain {
	std::string_view domain;

public:
	constexpr explicit LiteralLoggerDomain(std::string_view _domain={}) noexcept
		:domain(_domain) {}

	constexpr std::string_view GetDomain() const noexcept {
		return domain;
	}
};

/**
 * A logger whose domain is a string literal.
 */
class LLogger : public BasicLogger<LiteralLoggerDomain> {
public:
	LLogger() = default;

	template<typename D>
	explicit LLogger(D &&_domain) noexcept
		:BasicLogger(std::forward<D>(_domain)) {}
};

/**
 * Domain "PARENT/NAME", built once at construction.
 */
class ChildLoggerDomain {
	std::string domain;

public:
	template<typename P>
	ChildLoggerDomain(const P &parent, const char *name) noexcept
		:domain(Make(parent.GetDomain(), name)) {}

	std::string_view GetDomain() const noexcept {
		return domain;
	}

private:
	static std::string Make(std::string_view parent, const char *name) noexcept;
};

/**
 * A logger for a sub-component, e.g. "mountpolicy/enforcer".
 */
class ChildLogger : public BasicLogger<ChildLoggerDomain> {
public:
	template<typename P>
	ChildLogger(const P &parent, const char *name) noexcept
		:BasicLogger(ChildLoggerDomain(parent, name)) {}
};
