// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "StringStrip.hxx"
#include "CharUtil.hxx"

#include <cstddef>

#include <string.h>

const char *
StripLeft(const char *p) noexcept
{
	while (IsWhitespaceNotNull(*p))
		++p;

	return p;
}

void
StripRight(char *p) noexcept
{
	std::size_t length = strlen(p);
	while (length > 0 && IsWhitespaceOrNull(p[length - 1]))
		--length;

	p[length] = 0;
}
