// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "TempTree.hxx"
#include "mountpolicy/MountPlanner.hxx"
#include "mountpolicy/MountResolver.hxx"
#include "mountpolicy/AllowlistStore.hxx"
#include "mountpolicy/Error.hxx"
#include "mountpolicy/PathNormalizer.hxx"
#include "mountpolicy/PlanJson.hxx"
#include "util/Exception.hxx"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

using namespace MountPolicy;

class MountPlannerTest : public ::testing::Test {
protected:
	TempTree tree;
	const PathNormalizer normalizer{tree.GetRoot()};
	const ResolverOptions options;
	AllowlistStore store;

	MountPlannerTest() {
		tree.MakeDirectory("groups/main");
		tree.MakeDirectory("groups/family");
		tree.MakeDirectory("projects/app");
	}

	void LoadDefault() {
		store.ReloadJson(R"({
  "allowedRoots": [{"path": "~/projects", "allowReadWrite": true}],
  "blockedPatterns": [],
  "nonMainReadOnly": true
})");
	}

	MountPlan Plan(GroupRecord group) const {
		const MountPlanner planner{store, normalizer, options};
		const auto designation = GetDesignation(group.folder, "main");
		return planner.Plan(group, designation,
				    tree("groups/" + group.folder));
	}
};

TEST_F(MountPlannerTest, NoAllowlist)
{
	EXPECT_THROW(Plan({"main", std::nullopt}), NoAllowlistError);
}

TEST_F(MountPlannerTest, Designation)
{
	LoadDefault();

	static constexpr const char *config = R"({"additionalMounts": [{"hostPath": "~/projects/app"}]})";

	auto plan = Plan({"main", config});
	EXPECT_TRUE(plan.rejections.empty());
	ASSERT_EQ(plan.mounts.size(), 2u);
	EXPECT_EQ(plan.mounts[0].host_path, tree("groups/main"));
	EXPECT_TRUE(plan.mounts[0].writable);
	EXPECT_EQ(plan.mounts[1].host_path, tree("projects/app"));
	EXPECT_TRUE(plan.mounts[1].writable);

	plan = Plan({"family", config});
	EXPECT_TRUE(plan.rejections.empty());
	ASSERT_EQ(plan.mounts.size(), 2u);
	EXPECT_EQ(plan.mounts[0].host_path, tree("groups/family"));
	EXPECT_FALSE(plan.mounts[0].writable);
	EXPECT_FALSE(plan.mounts[1].writable);
}

TEST_F(MountPlannerTest, Rejections)
{
	LoadDefault();

	const auto plan = Plan({"main", R"({"additionalMounts": [
  {"hostPath": "~/projects/app"},
  {"hostPath": "/etc"},
  {"containerPath": "nothing"}
]})"});

	ASSERT_EQ(plan.mounts.size(), 2u);
	ASSERT_EQ(plan.rejections.size(), 2u);

	/* malformed entries come first */
	EXPECT_EQ(plan.rejections[0].host_path, "");
	EXPECT_EQ(plan.rejections[1].host_path, "/etc");
	EXPECT_NE(FindNested<MountDeniedError>(plan.rejections[1].error), nullptr);

	const auto j = ToJson(plan);
	EXPECT_EQ(j["mounts"].size(), 2u);
	EXPECT_EQ(j["mounts"][1]["hostPath"], tree("projects/app"));
	EXPECT_EQ(j["mounts"][1]["containerPath"], "/workspace/extra/app");
	EXPECT_EQ(j["mounts"][1]["writable"], true);
	EXPECT_EQ(j["rejected"].size(), 2u);
	EXPECT_EQ(j["rejected"][1]["hostPath"], "/etc");
	EXPECT_TRUE(j["rejected"][1]["error"].is_string());
}

TEST_F(MountPlannerTest, MalformedConfig)
{
	LoadDefault();

	const auto plan = Plan({"main", "{not json"});
	ASSERT_EQ(plan.mounts.size(), 1u);
	EXPECT_TRUE(plan.mounts.front().workspace);
	EXPECT_TRUE(plan.rejections.empty());
}

TEST_F(MountPlannerTest, WorkspaceMissing)
{
	LoadDefault();

	EXPECT_THROW(Plan({"other", std::nullopt}), LaunchAbortedError);
}

TEST_F(MountPlannerTest, Reloaded)
{
	LoadDefault();

	static constexpr const char *config = R"({"additionalMounts": [{"hostPath": "~/projects/app"}]})";
	ASSERT_EQ(Plan({"main", config}).mounts.size(), 2u);

	store.ReloadJson(R"({"allowedRoots": [], "blockedPatterns": [], "nonMainReadOnly": true})");

	const auto plan = Plan({"main", config});
	ASSERT_EQ(plan.mounts.size(), 1u);
	ASSERT_EQ(plan.rejections.size(), 1u);
}
