// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "Group.hxx"
#include "ResolvedMount.hxx"

#include <optional>
#include <string_view>
#include <vector>

namespace MountPolicy {

struct MountRequests {
	std::vector<AdditionalMount> mounts;

	/**
	 * Entries which were malformed and have been skipped.
	 */
	std::vector<MountRejection> rejections;
};

/**
 * Parse the "containerConfig" column of a group registration row.
 * std::nullopt or a document without "additionalMounts" yields an
 * empty request list.
 *
 * A malformed entry is skipped and reported in
 * MountRequests::rejections.  A "readonly" value which is not a
 * boolean is treated as true.
 *
 * Throws std::runtime_error if the document as a whole is malformed.
 */
MountRequests
ParseAdditionalMounts(std::optional<std::string_view> container_config);

} // namespace MountPolicy
