// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "Allowlist.hxx"

#include <atomic>
#include <memory>
#include <string_view>

namespace MountPolicy {

/**
 * Load and validate an allowlist file.
 *
 * Throws #SchemaError if the contents are malformed,
 * std::system_error if the file cannot be read.
 */
MountAllowlist
LoadAllowlistFile(const char *path);

/**
 * Owns the current #MountAllowlist snapshot.
 *
 * Snapshots are immutable.  Readers obtain a std::shared_ptr which
 * keeps "their" snapshot alive even if a reload replaces it
 * meanwhile; this allows concurrent launches without locking.  A
 * new snapshot is validated completely before it is published with
 * an atomic pointer swap.
 */
class AllowlistStore {
	std::atomic<std::shared_ptr<const MountAllowlist>> current;

public:
	/**
	 * Construct an empty store.  Get() returns nullptr until
	 * something gets loaded.
	 */
	AllowlistStore() noexcept = default;

	explicit AllowlistStore(MountAllowlist &&initial) noexcept;

	AllowlistStore(const AllowlistStore &) = delete;
	AllowlistStore &operator=(const AllowlistStore &) = delete;

	/**
	 * Obtain the current snapshot.  Returns nullptr if no valid
	 * allowlist was ever loaded.
	 */
	std::shared_ptr<const MountAllowlist> Get() const noexcept {
		return current.load();
	}

	bool IsLoaded() const noexcept {
		return Get() != nullptr;
	}

	/**
	 * Replace the current snapshot.
	 *
	 * @return the new snapshot
	 */
	std::shared_ptr<const MountAllowlist> Publish(MountAllowlist &&allowlist) noexcept;

	/**
	 * Load the specified file and publish it.  On error, the
	 * previous snapshot remains active and the exception is
	 * thrown to the caller.
	 *
	 * Throws #SchemaError or std::system_error on error.
	 */
	std::shared_ptr<const MountAllowlist> Reload(const char *path);

	/**
	 * Like Reload(), but parse the given JSON text.
	 */
	std::shared_ptr<const MountAllowlist> ReloadJson(std::string_view text);
};

} // namespace MountPolicy
