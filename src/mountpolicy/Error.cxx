// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "Error.hxx"

#include <fmt/format.h>

namespace MountPolicy {

SchemaError
SchemaError::Syntax(std::string_view detail) noexcept
{
	return {Kind::SYNTAX,
		fmt::format("Malformed mount allowlist: {}", detail)};
}

SchemaError
SchemaError::MissingField(std::string_view field) noexcept
{
	SchemaError e{Kind::MISSING_FIELD,
		fmt::format("Mount allowlist lacks field \"{}\"", field)};
	e.field = field;
	return e;
}

SchemaError
SchemaError::InvalidType(std::string_view field,
			 std::string_view expected) noexcept
{
	SchemaError e{Kind::INVALID_TYPE,
		fmt::format("Mount allowlist field \"{}\" must be {}",
			    field, expected)};
	e.field = field;
	return e;
}

SchemaError
SchemaError::InvalidRoot(std::size_t index, std::string_view detail) noexcept
{
	SchemaError e{Kind::INVALID_ROOT,
		fmt::format("Invalid entry {} in \"allowedRoots\": {}",
			    index, detail)};
	e.index = index;
	return e;
}

} // namespace MountPolicy
