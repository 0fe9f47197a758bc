// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace MountPolicy {

/**
 * The allowlist configuration is malformed.  The whole snapshot is
 * rejected.
 */
class SchemaError : public std::runtime_error {
public:
	enum class Kind : uint_least8_t {
		/**
		 * Not valid JSON, or the top-level value is not an
		 * object.
		 */
		SYNTAX,

		/**
		 * A mandatory top-level field is absent.
		 */
		MISSING_FIELD,

		/**
		 * A top-level field has the wrong type.
		 */
		INVALID_TYPE,

		/**
		 * An entry of "allowedRoots" is malformed.
		 */
		INVALID_ROOT,
	};

private:
	Kind kind;

	/**
	 * The offending top-level field (MISSING_FIELD,
	 * INVALID_TYPE).
	 */
	std::string field;

	/**
	 * The offending "allowedRoots" index (INVALID_ROOT).
	 */
	std::size_t index = 0;

	SchemaError(Kind _kind, const std::string &msg) noexcept
		:std::runtime_error(msg), kind(_kind) {}

public:
	static SchemaError Syntax(std::string_view detail) noexcept;
	static SchemaError MissingField(std::string_view field) noexcept;
	static SchemaError InvalidType(std::string_view field,
				       std::string_view expected) noexcept;
	static SchemaError InvalidRoot(std::size_t index,
				       std::string_view detail) noexcept;

	Kind GetKind() const noexcept {
		return kind;
	}

	const std::string &GetField() const noexcept {
		return field;
	}

	std::size_t GetIndex() const noexcept {
		return index;
	}
};

/**
 * A host path could not be canonicalized (does not exist, symlink
 * loop, resolution took too long, ...).  This is always a denial.
 */
class NormalizationError : public std::runtime_error {
	bool timeout;

public:
	NormalizationError(const std::string &msg, bool _timeout=false) noexcept
		:std::runtime_error(msg), timeout(_timeout) {}

	bool IsTimeout() const noexcept {
		return timeout;
	}
};

class MountDeniedError : public std::runtime_error {
public:
	enum class Reason : uint_least8_t {
		/**
		 * The path matches a blocked pattern.
		 */
		BLOCKED,

		/**
		 * No allowed root covers the path.
		 */
		NOT_COVERED,
	};

private:
	Reason reason;

public:
	MountDeniedError(Reason _reason, const std::string &msg) noexcept
		:std::runtime_error(msg), reason(_reason) {}

	Reason GetReason() const noexcept {
		return reason;
	}
};

/**
 * The requested container path is absolute, empty or escapes the
 * mount prefix.
 */
class InvalidContainerPathError : public std::runtime_error {
public:
	using std::runtime_error::runtime_error;
};

/**
 * Another mount of the same group already uses this container path.
 */
class DuplicateMountError : public std::runtime_error {
public:
	using std::runtime_error::runtime_error;
};

/**
 * The group's own workspace mount cannot be set up; the container
 * must not be launched.
 */
class LaunchAbortedError : public std::runtime_error {
public:
	using std::runtime_error::runtime_error;
};

/**
 * No valid allowlist has been loaded yet; no container may be
 * launched until this is corrected.
 */
class NoAllowlistError : public std::runtime_error {
public:
	using std::runtime_error::runtime_error;
};

} // namespace MountPolicy
