// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "Allowlist.hxx"

using std::string_view_literals::operator""sv;

namespace MountPolicy {

static constexpr std::string_view default_blocked_patterns[] = {
	".ssh"sv,
	".gnupg"sv,
	".gpg"sv,
	".aws"sv,
	".azure"sv,
	".gcloud"sv,
	".kube"sv,
	".docker"sv,
	"credentials"sv,
	".env"sv,
	".netrc"sv,
	".npmrc"sv,
	".pypirc"sv,
	"id_rsa"sv,
	"id_ed25519"sv,
	"private_key"sv,
	".secret"sv,
};

std::span<const std::string_view>
DefaultBlockedPatterns() noexcept
{
	return default_blocked_patterns;
}

} // namespace MountPolicy
