// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include <filesystem>

class LineParser;

class ConfigParser {
public:
	virtual ~ConfigParser() noexcept = default;

	virtual bool PreParseLine(LineParser &line);
	virtual void ParseLine(LineParser &line) = 0;
	virtual void Finish() {}
};

/**
 * A #ConfigParser which ignores empty lines and lines starting with
 * '#'.
 */
class CommentConfigParser final : public ConfigParser {
	ConfigParser &child;

public:
	explicit CommentConfigParser(ConfigParser &_child)
		:child(_child) {}

	/* virtual methods from class ConfigParser */
	bool PreParseLine(LineParser &line) override;
	void ParseLine(LineParser &line) override;
	void Finish() override;
};

/**
 * Feed all lines of the specified file into the #ConfigParser and
 * call ConfigParser::Finish() at the end.
 *
 * Throws on error; exceptions thrown by the parser are nested
 * inside an exception describing the file name and line number.
 */
void
ParseConfigFile(const std::filesystem::path &path, ConfigParser &parser);
