#include <gtest/gtest.h>

#include "admit/policy.hpp"
#include "admit/policy_loader.hpp"
#include "testing.hpp"

#include <fstream>
#include <string>

namespace {

TEST(PolicyTest, DefaultTableCoversEveryContext) {
    const auto policy = admit::DefaultPolicy();
    ASSERT_TRUE(policy);
    EXPECT_EQ(policy->version, "builtin-1");

    for (auto tag : {admit::ContextTag::Assignment, admit::ContextTag::CourseMaterial,
                     admit::ContextTag::ForumAttachment, admit::ContextTag::Avatar}) {
        const auto* ctx = policy->Context(tag);
        ASSERT_NE(ctx, nullptr) << admit::ToString(tag);
        EXPECT_EQ(ctx->tag, tag);
        EXPECT_EQ(ctx->review_deadline, std::chrono::hours(24 * 7));
        EXPECT_EQ(ctx->archive.max_nesting_depth, 1u);
    }

    const auto* assignment = policy->Context(admit::ContextTag::Assignment);
    EXPECT_EQ(assignment->max_size, 50ULL * 1024 * 1024);
    EXPECT_EQ(assignment->archive.max_entries, 1000u);
    EXPECT_EQ(assignment->archive.max_total_uncompressed, 500ULL * 1024 * 1024);
    EXPECT_EQ(assignment->archive.max_member_uncompressed, 100ULL * 1024 * 1024);
    EXPECT_DOUBLE_EQ(assignment->archive.max_ratio, 100.0);
    EXPECT_DOUBLE_EQ(assignment->heuristics.quarantine_threshold, 3.0);

    const auto* avatar = policy->Context(admit::ContextTag::Avatar);
    EXPECT_NE(avatar->FindRule(".png"), nullptr);
    EXPECT_EQ(avatar->FindRule(".py"), nullptr);
    EXPECT_EQ(avatar->FindRule(".zip"), nullptr);
}

TEST(PolicyTest, DenyListHoldsExecutableScriptAndMacroFormats) {
    const auto policy = admit::DefaultPolicy();
    for (const char* ext : {".exe", ".dll", ".sh", ".ps1", ".jsp", ".php5", ".docm", ".xlsm", ".vbs", ".jar"}) {
        EXPECT_TRUE(policy->IsDenied(ext)) << ext;
    }
    for (const char* ext : {".py", ".txt", ".zip", ".jpg", ".docx"}) {
        EXPECT_FALSE(policy->IsDenied(ext)) << ext;
    }
}

TEST(PolicyTest, ExtensionOfPrefersLongestKnownSuffix) {
    const auto policy = admit::DefaultPolicy();
    EXPECT_EQ(admit::ExtensionOf("project.tar.gz", *policy), ".tar.gz");
    EXPECT_EQ(admit::ExtensionOf("my.notes.tar.gz", *policy), ".tar.gz");
    EXPECT_EQ(admit::ExtensionOf("LESSON.PY", *policy), ".py");
    EXPECT_EQ(admit::ExtensionOf("report.exe.txt", *policy), ".txt");
    EXPECT_EQ(admit::ExtensionOf("photo.jpg.exe", *policy), ".exe");
    EXPECT_EQ(admit::ExtensionOf("data.unknownext", *policy), ".unknownext");
    EXPECT_EQ(admit::ExtensionOf("Makefile", *policy), "");
    EXPECT_EQ(admit::ExtensionOf("trailingdot.", *policy), "");
    EXPECT_EQ(admit::ExtensionOf(".gitignore", *policy), ".gitignore");
}

TEST(PolicyTest, MaxSizeForTakesTheSmallerCeiling) {
    admit::ContextPolicy ctx;
    ctx.max_size = 1000;
    admit::ExtensionRule rule;
    EXPECT_EQ(ctx.MaxSizeFor(rule), 1000u);
    rule.max_size = 200;
    EXPECT_EQ(ctx.MaxSizeFor(rule), 200u);
    rule.max_size = 5000;
    EXPECT_EQ(ctx.MaxSizeFor(rule), 1000u);
}

TEST(PolicyLoaderTest, OverridesInheritDefaults) {
    admit::PolicySnapshot out;
    auto r = admit::ParsePolicyJson(R"({
        "version": "v2",
        "contexts": {
            "assignment": {
                "max_size": 1024,
                "review_deadline_hours": 48,
                "archive": { "max_entries": 10, "max_ratio": 20.5 },
                "heuristics": { "quarantine_threshold": 5.0 },
                "remove_extensions": [".gz"],
                "extensions": {
                    ".lua": { "class": "source", "deep_scan": true, "content_type": "text/x-lua",
                              "signatures": ["text", "script"] },
                    ".py": { "allowed": false }
                }
            }
        }
    })", out);
    ASSERT_TRUE(r.ok) << r.msg;
    ASSERT_TRUE(out);
    EXPECT_EQ(out->version, "v2");

    const auto* ctx = out->Context(admit::ContextTag::Assignment);
    ASSERT_NE(ctx, nullptr);
    EXPECT_EQ(ctx->max_size, 1024u);
    EXPECT_EQ(ctx->review_deadline, std::chrono::hours(48));
    EXPECT_EQ(ctx->archive.max_entries, 10u);
    EXPECT_DOUBLE_EQ(ctx->archive.max_ratio, 20.5);
    EXPECT_EQ(ctx->archive.max_member_uncompressed, 100ULL * 1024 * 1024);
    EXPECT_DOUBLE_EQ(ctx->heuristics.quarantine_threshold, 5.0);
    EXPECT_EQ(ctx->FindRule(".gz"), nullptr);

    const auto* lua = ctx->FindRule(".lua");
    ASSERT_NE(lua, nullptr);
    EXPECT_EQ(lua->file_class, admit::FileClass::Source);
    EXPECT_TRUE(lua->requires_deep_scan);
    EXPECT_EQ(lua->signatures.size(), 2u);

    const auto* py = ctx->FindRule(".py");
    ASSERT_NE(py, nullptr);
    EXPECT_FALSE(py->allowed);
    EXPECT_EQ(py->language_family, "python");

    // Other contexts and the deny-list keep the built-in values.
    EXPECT_EQ(out->Context(admit::ContextTag::Avatar)->max_size, 5ULL * 1024 * 1024);
    EXPECT_TRUE(out->IsDenied(".exe"));

    // The built-in snapshot itself is untouched.
    EXPECT_NE(admit::DefaultPolicy()->Context(admit::ContextTag::Assignment)->FindRule(".gz"), nullptr);
}

TEST(PolicyLoaderTest, RejectsBrokenDocumentsWithoutTouchingOutput) {
    const char* broken[] = {
        R"({"contexts": {}})",
        R"({"version": ""})",
        R"({"version": "x", "contexts": {"lobby": {}}})",
        R"({"version": "x", "contexts": {"assignment": {"archive": {"max_ratio": 0}}}})",
        R"({"version": "x", "contexts": {"assignment": {"extensions": {".new": {"allowed": true}}}}})",
        R"({"version": "x", "contexts": {"assignment": {"extensions": {".lua": {"class": "source", "family": "cobol"}}}}})",
        R"({"version": "x", "contexts": {"assignment": {"extensions": {".LUA": {"class": "source"}}}}})",
        R"({"version": "x", "contexts": {"assignment": {"extensions": {".lua": {"class": "source", "signatures": ["floppy"]}}}}})",
        R"({"version": "x", "pattern_families": {"generic": [""]}})",
        R"({"version": "x", "denied_extensions": [".EXE"]})",
        R"({"version": "x", "denied_extensions": ["exe"]})",
        R"({"version": 3})",
        "{ not json",
    };

    for (const char* doc : broken) {
        admit::PolicySnapshot out = admit::DefaultPolicy();
        auto r = admit::ParsePolicyJson(doc, out);
        EXPECT_FALSE(r.ok) << doc;
        EXPECT_EQ(r.kind, admit::ErrorKind::ConfigError) << doc;
        EXPECT_EQ(out, admit::DefaultPolicy()) << doc;
    }
}

TEST(PolicyLoaderTest, PatternFamiliesAreLowercased) {
    admit::PolicySnapshot out;
    auto r = admit::ParsePolicyJson(R"({"version": "p", "pattern_families": {"python": ["OS.System"]}})", out);
    ASSERT_TRUE(r.ok) << r.msg;
    const auto* fam = out->Patterns("python");
    ASSERT_NE(fam, nullptr);
    ASSERT_EQ(fam->size(), 1u);
    EXPECT_EQ(fam->front(), "os.system");
}

TEST(PolicyLoaderTest, LoadsFromFile) {
    testutil::TemporaryDirectory tmp;
    const std::string path = tmp.Path() + "/policy.json";
    {
        std::ofstream f(path);
        f << R"({"version": "file-1", "contexts": {"avatar": {"max_size": 4096}}})";
    }

    admit::PolicySnapshot out;
    auto r = admit::LoadPolicyFile(path, out);
    ASSERT_TRUE(r.ok) << r.msg;
    EXPECT_EQ(out->version, "file-1");
    EXPECT_EQ(out->Context(admit::ContextTag::Avatar)->max_size, 4096u);

    r = admit::LoadPolicyFile(tmp.Path() + "/missing.json", out);
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.kind, admit::ErrorKind::ConfigError);
}

} // namespace
