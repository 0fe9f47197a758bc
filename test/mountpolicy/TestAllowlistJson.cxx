// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "mountpolicy/AllowlistJson.hxx"
#include "mountpolicy/Allowlist.hxx"
#include "mountpolicy/Error.hxx"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

using namespace MountPolicy;

template<typename F>
static SchemaError
CatchSchemaError(F &&f)
{
	try {
		f();
	} catch (const SchemaError &e) {
		return e;
	}

	throw std::runtime_error{"SchemaError expected"};
}

static SchemaError
CatchParse(const char *text)
{
	return CatchSchemaError([text]{ ParseAllowlist(text); });
}

TEST(AllowlistJson, Parse)
{
	const auto a = ParseAllowlist(R"({
  "allowedRoots": [
    {"path": "~/projects", "allowReadWrite": true, "description": "Projects"},
    {"path": "/srv/data", "allowReadWrite": false}
  ],
  "blockedPatterns": ["secret", "**/*.pem"],
  "nonMainReadOnly": true
})");

	ASSERT_EQ(a.allowed_roots.size(), 2u);
	EXPECT_EQ(a.allowed_roots[0].path, "~/projects");
	EXPECT_TRUE(a.allowed_roots[0].allow_read_write);
	EXPECT_EQ(a.allowed_roots[0].description, "Projects");
	EXPECT_EQ(a.allowed_roots[1].path, "/srv/data");
	EXPECT_FALSE(a.allowed_roots[1].allow_read_write);
	EXPECT_FALSE(a.allowed_roots[1].description);

	ASSERT_EQ(a.blocked_patterns.size(), 2u);
	EXPECT_EQ(a.blocked_patterns[0], "secret");
	EXPECT_EQ(a.blocked_patterns[1], "**/*.pem");
	EXPECT_TRUE(a.non_main_read_only);
}

TEST(AllowlistJson, Empty)
{
	const auto a = ParseAllowlist(R"({"allowedRoots": [], "blockedPatterns": [], "nonMainReadOnly": false})");
	EXPECT_TRUE(a.allowed_roots.empty());
	EXPECT_TRUE(a.blocked_patterns.empty());
	EXPECT_FALSE(a.non_main_read_only);
}

TEST(AllowlistJson, MissingAllowReadWrite)
{
	const auto e = CatchParse(R"({
  "allowedRoots": [
    {"path": "/a", "allowReadWrite": true},
    {"path": "/b"}
  ],
  "blockedPatterns": [],
  "nonMainReadOnly": true
})");

	EXPECT_EQ(e.GetKind(), SchemaError::Kind::INVALID_ROOT);
	EXPECT_EQ(e.GetIndex(), 1u);
}

TEST(AllowlistJson, LegacyMode)
{
	/* even with "allowReadWrite", the obsolete field is an
	   error */
	auto e = CatchParse(R"({
  "allowedRoots": [{"path": "/a", "mode": "rw"}],
  "blockedPatterns": [],
  "nonMainReadOnly": true
})");
	EXPECT_EQ(e.GetKind(), SchemaError::Kind::INVALID_ROOT);
	EXPECT_EQ(e.GetIndex(), 0u);

	e = CatchParse(R"({
  "allowedRoots": [{"path": "/a", "mode": "ro", "allowReadWrite": false}],
  "blockedPatterns": [],
  "nonMainReadOnly": true
})");
	EXPECT_EQ(e.GetKind(), SchemaError::Kind::INVALID_ROOT);
}

TEST(AllowlistJson, InvalidRoot)
{
	static constexpr const char *invalid[] = {
		R"({"allowedRoots": [42], "blockedPatterns": [], "nonMainReadOnly": true})",
		R"({"allowedRoots": [{"allowReadWrite": true}], "blockedPatterns": [], "nonMainReadOnly": true})",
		R"({"allowedRoots": [{"path": "", "allowReadWrite": true}], "blockedPatterns": [], "nonMainReadOnly": true})",
		R"({"allowedRoots": [{"path": 1, "allowReadWrite": true}], "blockedPatterns": [], "nonMainReadOnly": true})",
		R"({"allowedRoots": [{"path": "/a", "allowReadWrite": "yes"}], "blockedPatterns": [], "nonMainReadOnly": true})",
		R"({"allowedRoots": [{"path": "/a", "allowReadWrite": 0}], "blockedPatterns": [], "nonMainReadOnly": true})",
		R"({"allowedRoots": [{"path": "/a", "allowReadWrite": true, "description": 7}], "blockedPatterns": [], "nonMainReadOnly": true})",
	};

	for (const char *i : invalid) {
		const auto e = CatchParse(i);
		EXPECT_EQ(e.GetKind(), SchemaError::Kind::INVALID_ROOT) << i;
		EXPECT_EQ(e.GetIndex(), 0u) << i;
	}
}

TEST(AllowlistJson, MissingField)
{
	auto e = CatchParse(R"({"allowedRoots": [], "nonMainReadOnly": true})");
	EXPECT_EQ(e.GetKind(), SchemaError::Kind::MISSING_FIELD);
	EXPECT_EQ(e.GetField(), "blockedPatterns");

	e = CatchParse(R"({"blockedPatterns": [], "nonMainReadOnly": true})");
	EXPECT_EQ(e.GetKind(), SchemaError::Kind::MISSING_FIELD);
	EXPECT_EQ(e.GetField(), "allowedRoots");

	e = CatchParse(R"({"allowedRoots": [], "blockedPatterns": []})");
	EXPECT_EQ(e.GetKind(), SchemaError::Kind::MISSING_FIELD);
	EXPECT_EQ(e.GetField(), "nonMainReadOnly");
}

TEST(AllowlistJson, InvalidType)
{
	auto e = CatchParse(R"({"allowedRoots": {}, "blockedPatterns": [], "nonMainReadOnly": true})");
	EXPECT_EQ(e.GetKind(), SchemaError::Kind::INVALID_TYPE);
	EXPECT_EQ(e.GetField(), "allowedRoots");

	e = CatchParse(R"({"allowedRoots": [], "blockedPatterns": "secret", "nonMainReadOnly": true})");
	EXPECT_EQ(e.GetKind(), SchemaError::Kind::INVALID_TYPE);
	EXPECT_EQ(e.GetField(), "blockedPatterns");

	e = CatchParse(R"({"allowedRoots": [], "blockedPatterns": [""], "nonMainReadOnly": true})");
	EXPECT_EQ(e.GetKind(), SchemaError::Kind::INVALID_TYPE);
	EXPECT_EQ(e.GetField(), "blockedPatterns");

	e = CatchParse(R"({"allowedRoots": [], "blockedPatterns": [], "nonMainReadOnly": "true"})");
	EXPECT_EQ(e.GetKind(), SchemaError::Kind::INVALID_TYPE);
	EXPECT_EQ(e.GetField(), "nonMainReadOnly");
}

TEST(AllowlistJson, Syntax)
{
	EXPECT_EQ(CatchParse("").GetKind(), SchemaError::Kind::SYNTAX);
	EXPECT_EQ(CatchParse("{").GetKind(), SchemaError::Kind::SYNTAX);
	EXPECT_EQ(CatchParse("[]").GetKind(), SchemaError::Kind::SYNTAX);
	EXPECT_EQ(CatchParse("null").GetKind(), SchemaError::Kind::SYNTAX);
}

TEST(AllowlistJson, RoundTrip)
{
	const MountAllowlist a{
		.allowed_roots = {
			{"~/projects", true, "Projects"},
			{"/srv/data", false, std::nullopt},
			{"/srv/data/shared", true, ""},
		},
		.blocked_patterns = {"secret", "**/node_modules/**"},
		.non_main_read_only = false,
	};

	EXPECT_EQ(ParseAllowlist(ToJson(a).dump()), a);
	EXPECT_EQ(AllowlistFromJson(ToJson(a)), a);

	/* the built-in patterns are not written */
	EXPECT_EQ(ToJson(a)["blockedPatterns"].size(), 2u);
}

TEST(AllowlistJson, Template)
{
	const auto t = MakeAllowlistTemplate();
	EXPECT_TRUE(t.non_main_read_only);
	EXPECT_FALSE(t.allowed_roots.empty());

	for (const auto &i : t.allowed_roots)
		EXPECT_TRUE(i.path.starts_with("~/"));

	EXPECT_EQ(ParseAllowlist(ToJson(t).dump(2)), t);
}
