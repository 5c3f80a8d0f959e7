#include <gtest/gtest.h>

#include "admit/archive_inspector.hpp"
#include "testing.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <random>
#include <string>
#include <vector>

namespace {

using admit::ContainerKind;
using admit::ReasonCode;
using testutil::Bytes;
using testutil::TarMember;
using testutil::ZipMember;

class ArchiveInspectorTest : public ::testing::Test {
protected:
    struct Outcome {
        admit::ArchiveReport report;
        admit::ValidationVerdict verdict;
    };

    Outcome Inspect(const std::vector<std::uint8_t>& bytes, ContainerKind kind, const std::string& name) {
        admit::ArchiveInspector inspector(table_, Ctx(), "test");
        admit::VerdictBuilder vb;
        auto report = inspector.Inspect(bytes, kind, name, vb);
        return Outcome{std::move(report), vb.Build(table_.version, Ctx().heuristics.quarantine_threshold,
                                                   admit::SystemClock::now())};
    }

    admit::ContextPolicy& Ctx() { return table_.contexts[admit::ContextTag::Assignment]; }

    admit::PolicyTable table_ = admit::DefaultPolicyTable();
};

std::string CleanSource(const std::string& fn) {
    return "def " + fn + "(a, b):\n    return a + b\n";
}

TEST(ContainerKindTest, MapsArchiveExtensions) {
    EXPECT_EQ(admit::ContainerKindFor(".zip"), ContainerKind::Zip);
    EXPECT_EQ(admit::ContainerKindFor(".tar"), ContainerKind::Tar);
    EXPECT_EQ(admit::ContainerKindFor(".tar.gz"), ContainerKind::Tar);
    EXPECT_EQ(admit::ContainerKindFor(".tgz"), ContainerKind::Tar);
    EXPECT_EQ(admit::ContainerKindFor(".gz"), ContainerKind::CompressedStream);
    EXPECT_FALSE(admit::ContainerKindFor(".rar").has_value());
}

TEST_F(ArchiveInspectorTest, CleanZipProducesManifest) {
    const auto zip = testutil::BuildZip({
        {"src/", {}, false, std::nullopt},
        {"src/main.py", Bytes(CleanSource("main")), true, std::nullopt},
        {"README.md", Bytes("# Homework 3\n"), false, std::nullopt},
    });

    const auto out = Inspect(zip, ContainerKind::Zip, "hw3.zip");
    EXPECT_EQ(out.verdict.Kind(), admit::VerdictKind::Accepted);
    EXPECT_TRUE(out.verdict.Reasons().empty());

    ASSERT_EQ(out.report.entries.size(), 2u);
    const auto& main = out.report.entries[0];
    EXPECT_EQ(main.path, "src/main.py");
    ASSERT_TRUE(main.declared_size.has_value());
    EXPECT_EQ(*main.declared_size, CleanSource("main").size());
    EXPECT_EQ(main.actual_size, CleanSource("main").size());
    EXPECT_GT(main.compressed_size, 0u);
    EXPECT_EQ(main.content_type, "text/x-python");
    EXPECT_TRUE(main.allowed);
    EXPECT_EQ(out.report.entries[1].path, "README.md");
    EXPECT_EQ(out.report.entry_count, 3u);
    EXPECT_EQ(out.report.container_bytes, zip.size());
}

TEST_F(ArchiveInspectorTest, ZipBombByDeclaredSizesIsRejectedFromTheIndex) {
    // 50,000 entries each claiming 10 MB with no payload at all.
    std::vector<ZipMember> members;
    members.reserve(50000);
    for (int i = 0; i < 50000; ++i) {
        members.push_back({"f" + std::to_string(i) + ".txt", {}, false, 10u * 1024 * 1024});
    }
    const auto zip = testutil::BuildZip(members);

    const auto out = Inspect(zip, ContainerKind::Zip, "bomb.zip");
    EXPECT_EQ(out.verdict.Kind(), admit::VerdictKind::Rejected);
    EXPECT_TRUE(out.verdict.HasReason(ReasonCode::ArchiveLimitsExceeded));
    EXPECT_EQ(out.verdict.Error(), admit::ErrorKind::ResourceExceeded);
    EXPECT_EQ(out.report.total_actual, 0u);
    EXPECT_LT(out.report.entry_count, 1000u);
}

TEST_F(ArchiveInspectorTest, DeclaredRatioAboveThresholdIsRejected) {
    const auto zip = testutil::BuildZip({{"big.txt", {}, false, 10u * 1024 * 1024}});
    ASSERT_LT(zip.size(), 1024u);

    const auto out = Inspect(zip, ContainerKind::Zip, "bomb.zip");
    EXPECT_EQ(out.verdict.Kind(), admit::VerdictKind::Rejected);
    EXPECT_TRUE(out.verdict.HasReason(ReasonCode::ArchiveLimitsExceeded));
    EXPECT_EQ(out.report.total_actual, 0u);
}

TEST_F(ArchiveInspectorTest, TooManyEntriesIsRejected) {
    Ctx().archive.max_entries = 5;
    std::vector<ZipMember> members;
    for (int i = 0; i < 6; ++i) members.push_back({"n" + std::to_string(i) + ".txt", Bytes("x\n"), false, std::nullopt});

    const auto out = Inspect(testutil::BuildZip(members), ContainerKind::Zip, "many.zip");
    EXPECT_TRUE(out.verdict.HasReason(ReasonCode::ArchiveLimitsExceeded));
    EXPECT_EQ(out.report.entry_count, 6u);
}

TEST_F(ArchiveInspectorTest, ActualBytesAreCheckedAgainstDeclaredOnes) {
    // The header claims 16 bytes; the payload inflates to 200 KB.
    const std::vector<std::uint8_t> payload(200 * 1024, 'A');
    const auto zip = testutil::BuildZip({{"small.txt", payload, true, 16u}});

    const auto out = Inspect(zip, ContainerKind::Zip, "liar.zip");
    EXPECT_EQ(out.verdict.Kind(), admit::VerdictKind::Rejected);
    EXPECT_TRUE(out.verdict.HasReason(ReasonCode::ArchiveLimitsExceeded) ||
                out.verdict.HasReason(ReasonCode::ArchiveCorrupt));
    EXPECT_LE(out.report.total_actual, Ctx().archive.read_buffer_bytes + 256u * 1024);
}

TEST_F(ArchiveInspectorTest, MemberLimitAppliesToActualBytes) {
    Ctx().archive.max_member_uncompressed = 4096;
    Ctx().archive.max_ratio = 1e6;
    const std::vector<std::uint8_t> payload(64 * 1024, 'B');
    const auto zip = testutil::BuildZip({{"grow.txt", payload, true, std::nullopt}});

    const auto out = Inspect(zip, ContainerKind::Zip, "grow.zip");
    EXPECT_TRUE(out.verdict.HasReason(ReasonCode::ArchiveLimitsExceeded));
}

TEST_F(ArchiveInspectorTest, TraversalRejectsTheWholeArchive) {
    for (const char* evil : {"../../etc/passwd", "/etc/passwd", "ok/../../escape.txt", "C:\\boot.ini"}) {
        const auto zip = testutil::BuildZip({
            {"fine.txt", Bytes("fine\n"), false, std::nullopt},
            {evil, Bytes("root:x:0:0\n"), false, std::nullopt},
        });
        const auto out = Inspect(zip, ContainerKind::Zip, "evil.zip");
        EXPECT_EQ(out.verdict.Kind(), admit::VerdictKind::Rejected) << evil;
        EXPECT_TRUE(out.verdict.HasReason(ReasonCode::ArchivePathTraversal)) << evil;
        EXPECT_EQ(out.verdict.Error(), admit::ErrorKind::StructuralViolation) << evil;
        EXPECT_TRUE(out.report.entries.empty()) << evil;
    }
}

TEST_F(ArchiveInspectorTest, EntryNamesMustBeUtf8) {
    for (const char* name : {"a\xFF.txt", "caf\xC3.txt", "over\xC0\xAFlong.txt"}) {
        const auto zip = testutil::BuildZip({
            {"fine.txt", Bytes("fine\n"), false, std::nullopt},
            {name, Bytes("payload\n"), false, std::nullopt},
        });
        const auto out = Inspect(zip, ContainerKind::Zip, "names.zip");
        EXPECT_EQ(out.verdict.Kind(), admit::VerdictKind::Rejected);
        EXPECT_TRUE(out.verdict.HasReason(ReasonCode::ArchivePathTraversal));
        EXPECT_EQ(out.verdict.Error(), admit::ErrorKind::StructuralViolation);
        EXPECT_TRUE(out.report.entries.empty());
    }

    const auto zip = testutil::BuildZip({{"caf\xC3\xA9.txt", Bytes("ok\n"), false, std::nullopt}});
    EXPECT_EQ(Inspect(zip, ContainerKind::Zip, "names.zip").verdict.Kind(), admit::VerdictKind::Accepted);
}

TEST_F(ArchiveInspectorTest, DuplicatePathsAfterNormalizationAreRejected) {
    const auto zip = testutil::BuildZip({
        {"a/b.txt", Bytes("one\n"), false, std::nullopt},
        {"a/./c/../b.txt", Bytes("two\n"), false, std::nullopt},
    });
    const auto out = Inspect(zip, ContainerKind::Zip, "dup.zip");
    EXPECT_TRUE(out.verdict.HasReason(ReasonCode::ArchiveDuplicateEntry));
}

TEST_F(ArchiveInspectorTest, BlockedMemberRejectsAndUnlistedMemberSignals) {
    const auto blocked = testutil::BuildZip({{"tools/run.exe", Bytes("MZ"), false, std::nullopt}});
    auto out = Inspect(blocked, ContainerKind::Zip, "b.zip");
    EXPECT_TRUE(out.verdict.HasReason(ReasonCode::ArchiveMemberBlocked));
    EXPECT_EQ(out.verdict.Error(), admit::ErrorKind::PolicyViolation);

    const auto unlisted = testutil::BuildZip({{"model.weights", Bytes("0123456789"), false, std::nullopt}});
    out = Inspect(unlisted, ContainerKind::Zip, "u.zip");
    EXPECT_EQ(out.verdict.Kind(), admit::VerdictKind::Accepted);
    EXPECT_TRUE(out.verdict.HasReason(ReasonCode::ArchiveMemberUnlisted));
    EXPECT_DOUBLE_EQ(out.verdict.RiskScore(), 0.5);
    ASSERT_EQ(out.report.entries.size(), 1u);
    EXPECT_FALSE(out.report.entries[0].allowed);
}

TEST_F(ArchiveInspectorTest, DisguisedExecutableMemberIsFlagged) {
    const std::vector<std::uint8_t> elf = {0x7F, 'E', 'L', 'F', 2, 1, 1, 0, 0, 0, 0, 0};
    const auto zip = testutil::BuildZip({{"notes.txt", elf, false, std::nullopt}});
    const auto out = Inspect(zip, ContainerKind::Zip, "x.zip");
    EXPECT_EQ(out.verdict.Kind(), admit::VerdictKind::Quarantined);
    EXPECT_TRUE(out.verdict.HasReason(ReasonCode::SignatureMismatch));
    EXPECT_EQ(out.report.entries[0].signature, admit::SignatureKind::ElfExecutable);
}

TEST_F(ArchiveInspectorTest, MembersAreDeepScanned) {
    const auto zip = testutil::BuildZip({
        {"a.py", Bytes("import os\nos.system('x')\nexec(open('y').read())\n__import__('z')\n"), true, std::nullopt},
    });
    const auto out = Inspect(zip, ContainerKind::Zip, "s.zip");
    EXPECT_TRUE(out.verdict.HasReason(ReasonCode::DangerousPattern));
    EXPECT_DOUBLE_EQ(out.verdict.RiskScore(), 3.0);
    EXPECT_EQ(out.verdict.Kind(), admit::VerdictKind::Quarantined);
    EXPECT_DOUBLE_EQ(out.report.entries[0].risk_score, 3.0);
}

TEST_F(ArchiveInspectorTest, UnsafeTarEntriesAreRejected) {
    const auto symlink = testutil::BuildTar({
        {"project/main.py", CleanSource("f")},
        {"project/link", "", AE_IFLNK, "/etc/shadow"},
    });
    auto out = Inspect(symlink, ContainerKind::Tar, "p.tar");
    EXPECT_TRUE(out.verdict.HasReason(ReasonCode::ArchiveUnsafeEntry));

    const auto hardlink = testutil::BuildTar({
        {"project/main.py", CleanSource("f")},
        {"project/copy.py", "", AE_IFREG, "project/main.py"},
    });
    out = Inspect(hardlink, ContainerKind::Tar, "p.tar");
    EXPECT_TRUE(out.verdict.HasReason(ReasonCode::ArchiveUnsafeEntry));

    const auto fifo = testutil::BuildTar({{"pipe", "", AE_IFIFO}});
    out = Inspect(fifo, ContainerKind::Tar, "p.tar");
    EXPECT_TRUE(out.verdict.HasReason(ReasonCode::ArchiveUnsafeEntry));
}

TEST_F(ArchiveInspectorTest, CompressedTarIsWalkedWithDirectoriesSkipped) {
    const auto tgz = testutil::BuildTar({
        {"project", "", AE_IFDIR},
        {"project/main.py", CleanSource("main")},
        {"project/data.csv", "a,b\n1,2\n"},
    }, true);
    const auto out = Inspect(tgz, ContainerKind::Tar, "project.tar.gz");
    EXPECT_EQ(out.verdict.Kind(), admit::VerdictKind::Accepted);
    ASSERT_EQ(out.report.entries.size(), 2u);
    EXPECT_EQ(out.report.entries[0].path, "project/main.py");
    EXPECT_EQ(out.report.entries[1].path, "project/data.csv");
    EXPECT_EQ(out.report.total_actual, CleanSource("main").size() + 8);
}

TEST_F(ArchiveInspectorTest, BareGzipStreamHasOneMemberNamedAfterContainer) {
    const auto gz = testutil::Gzip(Bytes("plain notes\n"));
    const auto out = Inspect(gz, ContainerKind::CompressedStream, "notes.txt.gz");
    EXPECT_EQ(out.verdict.Kind(), admit::VerdictKind::Accepted);
    ASSERT_EQ(out.report.entries.size(), 1u);
    EXPECT_EQ(out.report.entries[0].path, "notes.txt");
    EXPECT_EQ(out.report.entries[0].actual_size, 12u);
    EXPECT_FALSE(out.report.entries[0].declared_size.has_value());
}

TEST_F(ArchiveInspectorTest, NestingBeyondConfiguredDepthIsRejected) {
    const auto inner = testutil::BuildZip({{"inner.txt", Bytes("hi\n"), false, std::nullopt}});
    const auto one_level = testutil::BuildZip({{"inner.zip", inner, false, std::nullopt}});

    auto out = Inspect(one_level, ContainerKind::Zip, "outer.zip");
    EXPECT_EQ(out.verdict.Kind(), admit::VerdictKind::Accepted);
    ASSERT_EQ(out.report.entries.size(), 1u);
    ASSERT_EQ(out.report.entries[0].children.size(), 1u);
    EXPECT_EQ(out.report.entries[0].children[0].path, "inner.txt");

    const auto two_levels = testutil::BuildZip({{"middle.zip", one_level, false, std::nullopt}});
    out = Inspect(two_levels, ContainerKind::Zip, "outer.zip");
    EXPECT_EQ(out.verdict.Kind(), admit::VerdictKind::Rejected);
    EXPECT_TRUE(out.verdict.HasReason(ReasonCode::ArchiveNestingTooDeep));
}

TEST_F(ArchiveInspectorTest, NestedArchiveWithoutReaderIsRejected) {
    admit::ExtensionRule rule;
    rule.extension = ".pack";
    rule.file_class = admit::FileClass::Archive;
    rule.archive_allowed = true;
    rule.content_type = "application/octet-stream";
    Ctx().extensions[".pack"] = rule;

    const auto zip = testutil::BuildZip({
        {"notes.txt", Bytes("notes\n"), false, std::nullopt},
        {"blob.pack", Bytes("opaque container bytes"), false, std::nullopt},
    });
    const auto out = Inspect(zip, ContainerKind::Zip, "outer.zip");
    EXPECT_EQ(out.verdict.Kind(), admit::VerdictKind::Rejected);
    EXPECT_TRUE(out.verdict.HasReason(ReasonCode::ArchiveCorrupt));
    EXPECT_EQ(out.verdict.Error(), admit::ErrorKind::StructuralViolation);
}

TEST_F(ArchiveInspectorTest, SingleMemberRatioIsCheckedDespiteIncompressibleSiblings) {
    std::mt19937 rng(7);
    std::vector<std::uint8_t> noise(400 * 1024);
    for (auto& b : noise) b = static_cast<std::uint8_t>(rng());

    const auto zip = testutil::BuildZip({
        {"zeros.txt", std::vector<std::uint8_t>(200 * 1024, '0'), true, std::nullopt},
        {"noise.txt", noise, false, std::nullopt},
    });
    // The container as a whole stays far below the threshold.
    ASSERT_LT(static_cast<double>(200 * 1024 + noise.size()) / static_cast<double>(zip.size()),
              Ctx().archive.max_ratio);

    const auto out = Inspect(zip, ContainerKind::Zip, "padded.zip");
    EXPECT_EQ(out.verdict.Kind(), admit::VerdictKind::Rejected);
    EXPECT_TRUE(out.verdict.HasReason(ReasonCode::ArchiveLimitsExceeded));
    EXPECT_EQ(out.verdict.Error(), admit::ErrorKind::ResourceExceeded);
    EXPECT_EQ(out.report.total_actual, 0u);
}

TEST_F(ArchiveInspectorTest, CorruptContainersAreRejectedNeverAccepted) {
    auto out = Inspect(Bytes("this is not an archive at all, just words"), ContainerKind::Zip, "c.zip");
    EXPECT_EQ(out.verdict.Kind(), admit::VerdictKind::Rejected);
    EXPECT_TRUE(out.verdict.HasReason(ReasonCode::ArchiveCorrupt));
    EXPECT_EQ(out.verdict.Error(), admit::ErrorKind::StructuralViolation);

    auto tgz = testutil::BuildTar({{"a.txt", std::string(20000, 'q')}}, true);
    tgz.resize(tgz.size() / 2);
    out = Inspect(tgz, ContainerKind::Tar, "t.tar.gz");
    EXPECT_EQ(out.verdict.Kind(), admit::VerdictKind::Rejected);
}

TEST_F(ArchiveInspectorTest, TimeBudgetAbortsInspection) {
    Ctx().archive.time_budget_ms = 0;
    Ctx().archive.read_buffer_bytes = 512;
    std::vector<ZipMember> members;
    for (int i = 0; i < 200; ++i) {
        members.push_back({"f" + std::to_string(i) + ".txt", std::vector<std::uint8_t>(1024, 'z'), false, std::nullopt});
    }
    const auto out = Inspect(testutil::BuildZip(members), ContainerKind::Zip, "slow.zip");
    EXPECT_EQ(out.verdict.Kind(), admit::VerdictKind::Rejected);
    EXPECT_TRUE(out.verdict.HasReason(ReasonCode::ArchiveLimitsExceeded));
}

TEST_F(ArchiveInspectorTest, MaterializeStoresMembersAndManifest) {
    testutil::TemporaryDirectory tmp;
    admit::StorageGateway store(tmp.Path());
    ASSERT_TRUE(store.Init().ok);

    const std::string main_py = CleanSource("main");
    const auto zip = testutil::BuildZip({
        {"src/main.py", Bytes(main_py), true, std::nullopt},
        {"notes.md", Bytes("# notes\n"), false, std::nullopt},
    });
    const auto out = Inspect(zip, ContainerKind::Zip, "hw.zip");
    ASSERT_EQ(out.verdict.Kind(), admit::VerdictKind::Accepted);

    admit::ArchiveInspector inspector(table_, Ctx(), "test");
    std::optional<admit::StoragePointer> bundle;
    auto r = inspector.Materialize(zip, ContainerKind::Zip, "hw.zip", out.report, store, table_.version, bundle);
    ASSERT_TRUE(r.ok) << r.msg;
    ASSERT_TRUE(bundle.has_value());

    std::vector<std::uint8_t> manifest_bytes;
    admit::ObjectMeta meta;
    ASSERT_TRUE(store.Read(bundle->str(), manifest_bytes, meta).ok);
    EXPECT_EQ(meta.content_type, admit::ArchiveInspector::kBundleContentType);

    const auto manifest = nlohmann::json::parse(manifest_bytes.begin(), manifest_bytes.end());
    EXPECT_EQ(manifest["policy_version"], table_.version);
    ASSERT_EQ(manifest["entries"].size(), 2u);
    EXPECT_EQ(manifest["entries"][0]["path"], "src/main.py");
    EXPECT_EQ(manifest.dump().find("hw.zip"), std::string::npos);

    std::vector<std::uint8_t> member;
    ASSERT_TRUE(store.Read(manifest["entries"][0]["pointer"].get<std::string>(), member, meta).ok);
    EXPECT_EQ(std::string(member.begin(), member.end()), main_py);
    EXPECT_EQ(meta.content_type, "text/x-python");
}

} // namespace
