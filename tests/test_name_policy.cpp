#include <gtest/gtest.h>

#include "admit/name_policy.hpp"

#include <string>

namespace {

using admit::EntryPathStatus;

class FilenameTest : public ::testing::Test {
protected:
    bool Check(const std::string& name, admit::VerdictBuilder& vb) const {
        return admit::ValidateFilename(name, *policy_, *policy_->Context(admit::ContextTag::Assignment), vb);
    }

    admit::PolicySnapshot policy_ = admit::DefaultPolicy();
};

TEST_F(FilenameTest, AcceptsOrdinaryNames) {
    for (const char* name : {"lesson.py", "Week 3 - notes (final).md", "data_[v2].csv", "a.tar.gz", ".gitignore"}) {
        admit::VerdictBuilder vb;
        EXPECT_TRUE(Check(name, vb)) << name;
        EXPECT_FALSE(vb.Rejected()) << name;
    }
}

TEST_F(FilenameTest, RejectsUnusableNames) {
    const std::string too_long = std::string(252, 'a') + ".txt";
    for (const std::string name : {std::string(), std::string("../etc/passwd"), std::string("dir/file.txt"),
                                   std::string("dir\\file.txt"), std::string("bad\nname.txt"),
                                   std::string("a..b.txt"), std::string("tab\tname.txt"), too_long,
                                   std::string("semi;colon.txt"), std::string("caf\xC3\xA9.txt"),
                                   std::string(".bashrc"), std::string(".hidden.txt")}) {
        admit::VerdictBuilder vb;
        EXPECT_FALSE(Check(name, vb)) << name;
        const auto v = vb.Build("t", 3.0, admit::SystemClock::now());
        EXPECT_EQ(v.Kind(), admit::VerdictKind::Rejected) << name;
        EXPECT_TRUE(v.HasReason(admit::ReasonCode::InvalidFilename)) << name;
        EXPECT_EQ(v.Error(), admit::ErrorKind::PolicyViolation) << name;
    }
}

TEST_F(FilenameTest, NameWithoutExtensionIsNotAllowed) {
    admit::VerdictBuilder vb;
    EXPECT_FALSE(Check("Makefile", vb));
    const auto v = vb.Build("t", 3.0, admit::SystemClock::now());
    EXPECT_TRUE(v.HasReason(admit::ReasonCode::ExtensionNotAllowed));
}

TEST_F(FilenameTest, RelaxedCharsetAllowsUnicode) {
    admit::PolicyTable table = admit::DefaultPolicyTable();
    table.contexts[admit::ContextTag::Assignment].strict_filename_charset = false;
    admit::VerdictBuilder vb;
    EXPECT_TRUE(admit::ValidateFilename("caf\xC3\xA9 & co.txt", table,
                                        *table.Context(admit::ContextTag::Assignment), vb));
}

TEST_F(FilenameTest, RelaxedCharsetStillRequiresUtf8) {
    admit::PolicyTable table = admit::DefaultPolicyTable();
    table.contexts[admit::ContextTag::Assignment].strict_filename_charset = false;
    for (const char* name : {"caf\xE9.txt", "u\xFF.txt", "half\xE2\x82.txt"}) {
        admit::VerdictBuilder vb;
        EXPECT_FALSE(admit::ValidateFilename(name, table, *table.Context(admit::ContextTag::Assignment), vb)) << name;
        EXPECT_TRUE(vb.Build("t", 3.0, admit::SystemClock::now()).HasReason(admit::ReasonCode::InvalidFilename));
    }
}

TEST(Utf8Test, AcceptsWellFormedAndRejectsTheRest) {
    for (const char* ok : {"", "plain", "caf\xC3\xA9", "\xE2\x82\xAC", "\xF0\x9F\x98\x80"}) {
        EXPECT_TRUE(admit::IsValidUtf8(ok)) << ok;
    }
    for (const char* bad : {"\xFF", "\xC3", "\xC0\xAF", "\xE0\x80\xAF", "\xED\xA0\x80",
                            "\xF4\x90\x80\x80", "\x80" "abc", "\xE2\x82"}) {
        EXPECT_FALSE(admit::IsValidUtf8(bad)) << bad;
    }
}

TEST(EntryPathTest, NormalizesRelativePaths) {
    std::string out;
    EXPECT_EQ(admit::NormalizeEntryPath("src/main.py", out), EntryPathStatus::Ok);
    EXPECT_EQ(out, "src/main.py");
    EXPECT_EQ(admit::NormalizeEntryPath("./src//lib/../main.py", out), EntryPathStatus::Ok);
    EXPECT_EQ(out, "src/main.py");
    EXPECT_EQ(admit::NormalizeEntryPath("src\\win\\file.txt", out), EntryPathStatus::Ok);
    EXPECT_EQ(out, "src/win/file.txt");
    EXPECT_EQ(admit::NormalizeEntryPath("a/b/../../c.txt", out), EntryPathStatus::Ok);
    EXPECT_EQ(out, "c.txt");
}

TEST(EntryPathTest, RejectsEscapesAndAbsolutePaths) {
    std::string out;
    EXPECT_EQ(admit::NormalizeEntryPath("../../etc/passwd", out), EntryPathStatus::Escapes);
    EXPECT_EQ(admit::NormalizeEntryPath("a/../../b", out), EntryPathStatus::Escapes);
    EXPECT_EQ(admit::NormalizeEntryPath("..\\..\\boot.ini", out), EntryPathStatus::Escapes);
    EXPECT_EQ(admit::NormalizeEntryPath("/etc/passwd", out), EntryPathStatus::Absolute);
    EXPECT_EQ(admit::NormalizeEntryPath("\\\\server\\share\\x", out), EntryPathStatus::Absolute);
    EXPECT_EQ(admit::NormalizeEntryPath("C:\\Windows\\system.ini", out), EntryPathStatus::Absolute);
    EXPECT_EQ(admit::NormalizeEntryPath("a/b:stream", out), EntryPathStatus::BadChar);
    EXPECT_EQ(admit::NormalizeEntryPath(std::string("a\0b", 3), out), EntryPathStatus::BadChar);
    EXPECT_TRUE(out.empty());
}

TEST(EntryPathTest, InvalidUtf8IsABadCharacter) {
    std::string out;
    EXPECT_EQ(admit::NormalizeEntryPath("docs/a\xFF.txt", out), EntryPathStatus::BadChar);
    EXPECT_TRUE(out.empty());
    EXPECT_EQ(admit::NormalizeEntryPath("docs/caf\xC3\xA9.txt", out), EntryPathStatus::Ok);
    EXPECT_EQ(out, "docs/caf\xC3\xA9.txt");
}

TEST(EntryPathTest, DirectoryMarkersAreEmpty) {
    std::string out;
    EXPECT_EQ(admit::NormalizeEntryPath("", out), EntryPathStatus::Empty);
    EXPECT_EQ(admit::NormalizeEntryPath("./", out), EntryPathStatus::Empty);
    EXPECT_EQ(admit::NormalizeEntryPath("a/..", out), EntryPathStatus::Empty);
}

} // namespace
