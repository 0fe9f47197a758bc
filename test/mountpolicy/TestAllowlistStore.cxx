// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "TempTree.hxx"
#include "mountpolicy/AllowlistStore.hxx"
#include "mountpolicy/Error.hxx"

#include <gtest/gtest.h>

#include <atomic>
#include <system_error>
#include <thread>
#include <vector>

using namespace MountPolicy;

static constexpr const char *valid_v1 = R"({
  "allowedRoots": [{"path": "~/projects", "allowReadWrite": true}],
  "blockedPatterns": [],
  "nonMainReadOnly": true
})";

static constexpr const char *valid_v2 = R"({
  "allowedRoots": [],
  "blockedPatterns": ["secret"],
  "nonMainReadOnly": false
})";

TEST(AllowlistStore, Empty)
{
	const AllowlistStore store;
	EXPECT_FALSE(store.IsLoaded());
	EXPECT_EQ(store.Get(), nullptr);
}

TEST(AllowlistStore, Initial)
{
	const AllowlistStore store{MountAllowlist{{}, {"x"}, false}};
	ASSERT_TRUE(store.IsLoaded());
	EXPECT_EQ(store.Get()->blocked_patterns.size(), 1u);
}

TEST(AllowlistStore, LoadFile)
{
	TempTree tree;
	const auto path = tree.WriteFile("allowlist.json", valid_v1);

	const auto a = LoadAllowlistFile(path.c_str());
	ASSERT_EQ(a.allowed_roots.size(), 1u);
	EXPECT_EQ(a.allowed_roots.front().path, "~/projects");

	EXPECT_THROW(LoadAllowlistFile(tree("missing.json").c_str()),
		     std::system_error);
}

TEST(AllowlistStore, Reload)
{
	TempTree tree;
	const auto path = tree.WriteFile("allowlist.json", valid_v1);

	AllowlistStore store;
	const auto v1 = store.Reload(path.c_str());
	ASSERT_NE(v1, nullptr);
	EXPECT_EQ(store.Get(), v1);
	EXPECT_TRUE(v1->non_main_read_only);

	tree.WriteFile("allowlist.json", valid_v2);
	const auto v2 = store.Reload(path.c_str());
	EXPECT_EQ(store.Get(), v2);
	EXPECT_FALSE(v2->non_main_read_only);

	/* the old snapshot is still intact for whoever holds it */
	EXPECT_TRUE(v1->non_main_read_only);
	EXPECT_EQ(v1->allowed_roots.size(), 1u);
}

TEST(AllowlistStore, ReloadInvalidKeepsPrevious)
{
	TempTree tree;
	const auto path = tree.WriteFile("allowlist.json", valid_v1);

	AllowlistStore store;
	const auto v1 = store.Reload(path.c_str());

	tree.WriteFile("allowlist.json", R"({"allowedRoots": [], "nonMainReadOnly": true})");
	try {
		store.Reload(path.c_str());
		FAIL();
	} catch (const SchemaError &e) {
		EXPECT_EQ(e.GetKind(), SchemaError::Kind::MISSING_FIELD);
		EXPECT_EQ(e.GetField(), "blockedPatterns");
	}

	EXPECT_EQ(store.Get(), v1);

	tree.Remove("allowlist.json");
	EXPECT_THROW(store.Reload(path.c_str()), std::system_error);
	EXPECT_EQ(store.Get(), v1);

	EXPECT_THROW(store.ReloadJson("{"), SchemaError);
	EXPECT_EQ(store.Get(), v1);
}

TEST(AllowlistStore, InvalidAtStartup)
{
	AllowlistStore store;
	EXPECT_THROW(store.ReloadJson(R"({"allowedRoots": [{"path": "/a"}], "blockedPatterns": [], "nonMainReadOnly": true})"),
		     SchemaError);
	EXPECT_FALSE(store.IsLoaded());
}

TEST(AllowlistStore, ConcurrentReaders)
{
	AllowlistStore store;
	store.ReloadJson(valid_v1);

	std::atomic_bool stop{false};
	std::vector<std::thread> readers;

	for (unsigned i = 0; i < 4; ++i)
		readers.emplace_back([&store, &stop]{
			while (!stop.load()) {
				const auto snapshot = store.Get();
				ASSERT_NE(snapshot, nullptr);

				/* either version, never a mix */
				if (snapshot->non_main_read_only)
					ASSERT_EQ(snapshot->allowed_roots.size(), 1u);
				else
					ASSERT_EQ(snapshot->blocked_patterns.size(), 1u);
			}
		});

	for (unsigned i = 0; i < 1000; ++i)
		store.ReloadJson(i % 2 == 0 ? valid_v2 : valid_v1);

	stop = true;
	for (auto &i : readers)
		i.join();
}
