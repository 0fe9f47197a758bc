// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "TempTree.hxx"
#include "mountpolicy/Config.hxx"
#include "util/Exception.hxx"

#include <gtest/gtest.h>

using namespace MountPolicy;

TEST(Config, Defaults)
{
	const Config config;
	EXPECT_EQ(config.allowlist_path, "~/.config/mountpolicy/mount-allowlist.json");
	EXPECT_EQ(config.main_group, "main");
	EXPECT_EQ(config.resolver.workspace_mount, "/workspace/group");
	EXPECT_EQ(config.resolver.extra_mount_prefix, "/workspace/extra");
	EXPECT_EQ(config.normalize_timeout, std::chrono::milliseconds{2000});
	EXPECT_EQ(config.log_level, 1u);

	EXPECT_EQ(config.GetDesignation("main"), GroupDesignation::MAIN);
	EXPECT_EQ(config.GetDesignation("family"), GroupDesignation::OTHER);
}

TEST(Config, Load)
{
	TempTree tree;
	const auto path = tree.WriteFile("mountpolicy.conf", R"(# test configuration

allowlist "allowlist.json"
main_group admins
groups_dir "/srv/groups"
  workspace_mount "/ws"
extra_mount_prefix '/mnt/extra'
normalize_timeout_ms 500
log_level 3
)");

	Config config;
	LoadConfigFile(config, path.c_str());

	EXPECT_EQ(config.allowlist_path, tree("allowlist.json"));
	EXPECT_EQ(config.main_group, "admins");
	EXPECT_EQ(config.groups_dir, "/srv/groups");
	EXPECT_EQ(config.resolver.workspace_mount, "/ws");
	EXPECT_EQ(config.resolver.extra_mount_prefix, "/mnt/extra");
	EXPECT_EQ(config.normalize_timeout, std::chrono::milliseconds{500});
	EXPECT_EQ(config.log_level, 3u);

	EXPECT_EQ(config.GetDesignation("admins"), GroupDesignation::MAIN);
	EXPECT_EQ(config.GetDesignation("main"), GroupDesignation::OTHER);
}

TEST(Config, HomePath)
{
	TempTree tree;
	const auto path = tree.WriteFile("mountpolicy.conf",
					 "allowlist \"~/.config/allowlist.json\"\n");

	Config config;
	LoadConfigFile(config, path.c_str());
	EXPECT_EQ(config.allowlist_path, "~/.config/allowlist.json");
}

static std::string
CatchLoad(const char *contents)
{
	TempTree tree;
	const auto path = tree.WriteFile("mountpolicy.conf", contents);

	try {
		Config config;
		LoadConfigFile(config, path.c_str());
	} catch (const std::exception &e) {
		return GetFullMessage(e);
	}

	return {};
}

TEST(Config, Errors)
{
	/* the location is prepended to the message */
	const auto msg = CatchLoad("log_level 2\nfoo bar\n");
	EXPECT_NE(msg.find("mountpolicy.conf:2"), msg.npos) << msg;
	EXPECT_NE(msg.find("foo"), msg.npos) << msg;

	EXPECT_FALSE(CatchLoad("allowlist\n").empty());
	EXPECT_FALSE(CatchLoad("allowlist \"a\" \"b\"\n").empty());
	EXPECT_FALSE(CatchLoad("main_group \"../x\"\n").empty());
	EXPECT_FALSE(CatchLoad("workspace_mount \"relative\"\n").empty());
	EXPECT_FALSE(CatchLoad("normalize_timeout_ms 0\n").empty());
	EXPECT_FALSE(CatchLoad("normalize_timeout_ms soon\n").empty());
	EXPECT_FALSE(CatchLoad("log_level x\n").empty());

	EXPECT_TRUE(CatchLoad("# nothing\n\n").empty());
}

TEST(Config, MissingFile)
{
	Config config;
	EXPECT_THROW(LoadConfigFile(config, "/nonexistent/mountpolicy.conf"),
		     std::system_error);
}

TEST(Config, WorkspacePath)
{
	Config config;
	config.groups_dir = "/srv/groups/";
	EXPECT_EQ(config.GetWorkspacePath("family"), "/srv/groups/family");

	config.groups_dir = "~/groups";
	EXPECT_EQ(config.GetWorkspacePath("main"), "~/groups/main");

	EXPECT_THROW(config.GetWorkspacePath(".."), std::invalid_argument);
	EXPECT_THROW(config.GetWorkspacePath("a/b"), std::invalid_argument);
	EXPECT_THROW(config.GetWorkspacePath(""), std::invalid_argument);
}
