// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "LineParser.hxx"
#include "lib/fmt/RuntimeError.hxx"

#include <stdlib.h>
#include <string.h>

void
LineParser::ExpectEnd()
{
	if (!IsEnd())
		throw FmtRuntimeError("Unexpected tokens at end of line: {}", p);
}

bool
LineParser::SkipWord(const char *word) noexcept
{
	const std::size_t length = strlen(word);
	if (strncmp(p, word, length) != 0 ||
	    !IsWhitespaceOrNull(p[length]))
		return false;

	p += length;
	Strip();
	return true;
}

const char *
LineParser::NextWord() noexcept
{
	if (!IsWordChar(front()))
		return nullptr;

	const char *result = p;
	do {
		++p;
	} while (IsWordChar(front()));

	if (IsWhitespaceNotNull(front())) {
		*p++ = 0;
		Strip();
	} else if (!IsEnd())
		return nullptr;

	return result;
}

inline char *
LineParser::NextUnquotedValue() noexcept
{
	char *result = p;
	while (IsUnquotedChar(front()))
		++p;

	if (IsWhitespaceNotNull(front())) {
		*p++ = 0;
		Strip();
	} else if (!IsEnd())
		return nullptr;

	return result;
}

inline char *
LineParser::NextQuotedValue(const char stop) noexcept
{
	char *const value = p;
	char *const end = strchr(p, stop);
	if (end == nullptr)
		return nullptr;

	*end = 0;
	p = end + 1;
	Strip();

	return value;
}

char *
LineParser::NextValue() noexcept
{
	const char ch = front();
	if (IsQuote(ch)) {
		++p;
		return NextQuotedValue(ch);
	} else
		return NextUnquotedValue();
}

char *
LineParser::NextUnescape() noexcept
{
	const char stop = front();
	if (stop == '\'') {
		++p;
		return NextQuotedValue(stop);
	} else if (stop != '"')
		return NextUnquotedValue();

	char *const value = ++p;
	char *dest = value;

	while (true) {
		char ch = *p++;

		if (ch == 0)
			return nullptr;

		if (ch == stop) {
			*dest = 0;
			Strip();
			return value;
		}

		if (ch == '\\') {
			ch = *p++;

			switch (ch) {
			case 'n':
				*dest++ = '\n';
				break;

			case 'r':
				*dest++ = '\r';
				break;

			case 't':
				*dest++ = '\t';
				break;

			case '\\':
			case '\'':
			case '"':
				*dest++ = ch;
				break;

			default:
				/* unsupported escape sequence (or
				   premature end of line) */
				return nullptr;
			}
		} else
			*dest++ = ch;
	}
}

bool
LineParser::NextBool()
{
	const char *value = NextValue();
	if (value == nullptr)
		throw Error("yes/no expected");

	if (strcmp(value, "yes") == 0 || strcmp(value, "true") == 0)
		return true;
	else if (strcmp(value, "no") == 0 || strcmp(value, "false") == 0)
		return false;
	else
		throw Error("yes/no expected");
}

unsigned
LineParser::NextPositiveInteger()
{
	const char *string = NextValue();
	if (string == nullptr)
		throw Error("Integer expected");

	char *endptr;
	unsigned long value = strtoul(string, &endptr, 10);
	if (endptr == string || *endptr != 0)
		throw Error("Failed to parse integer");

	if (value <= 0)
		throw Error("Positive integer expected");

	return value;
}

const char *
LineParser::ExpectWord()
{
	const char *value = NextWord();
	if (value == nullptr)
		throw Error("Word expected");

	return value;
}

char *
LineParser::ExpectValue()
{
	char *value = NextUnescape();
	if (value == nullptr)
		throw Error("Value expected");

	if (*value == 0)
		throw Error("Empty value not allowed");

	return value;
}

char *
LineParser::ExpectValueAndEnd()
{
	char *value = ExpectValue();
	ExpectEnd();
	return value;
}
