// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include <cstddef>
#include <string>

/**
 * Load the whole contents of a (small) text file into a string.
 *
 * Throws on I/O error or if the file is larger than #max_size.
 */
std::string
LoadTextFile(const char *path, std::size_t max_size);
