#include <gtest/gtest.h>

#include "admit/image_scrubber.hpp"
#include "testing.hpp"

#include <algorithm>
#include <string>
#include <vector>

namespace {

using admit::ScrubStatus;
using testutil::Contains;

constexpr const char* kGpsMarker = "GPS-SECRET-LOCATION";

std::vector<std::uint8_t> ExtractJpegExif(const std::vector<std::uint8_t>& jpeg) {
    const std::string_view tag("Exif\0\0", 6);
    auto it = std::search(jpeg.begin(), jpeg.end(), tag.begin(), tag.end());
    if (it == jpeg.end()) return {};
    const size_t at = static_cast<size_t>(it - jpeg.begin());
    const size_t seg_len = (static_cast<size_t>(jpeg[at - 2]) << 8) | jpeg[at - 1];
    return std::vector<std::uint8_t>(it + 6, jpeg.begin() + static_cast<std::ptrdiff_t>(at - 2 + seg_len));
}

// From the SOS marker through EOI.
std::vector<std::uint8_t> ScanTail(const std::vector<std::uint8_t>& jpeg) {
    const std::uint8_t sos[] = {0xFF, 0xDA};
    const std::uint8_t eoi[] = {0xFF, 0xD9};
    auto start = std::search(jpeg.begin(), jpeg.end(), std::begin(sos), std::end(sos));
    auto end = std::search(start, jpeg.end(), std::begin(eoi), std::end(eoi));
    if (start == jpeg.end() || end == jpeg.end()) return {};
    return std::vector<std::uint8_t>(start, end + 2);
}

class ImageScrubberTest : public ::testing::Test {
protected:
    ScrubStatus Scrub(const std::vector<std::uint8_t>& in) {
        return scrubber_.Scrub(in, out_, report_);
    }

    admit::ImageScrubber scrubber_;
    std::vector<std::uint8_t> out_;
    admit::ScrubReport report_;
};

TEST(ExifTest, ParsesOrientationAndGpsPointer) {
    admit::ExifSummary ex;
    ASSERT_TRUE(admit::ParseExif(testutil::ExifTiff(6, true), ex));
    EXPECT_EQ(ex.orientation, std::optional<std::uint16_t>(6));
    EXPECT_TRUE(ex.has_gps);

    ASSERT_TRUE(admit::ParseExif(admit::MinimalOrientationExif(8), ex));
    EXPECT_EQ(ex.orientation, std::optional<std::uint16_t>(8));
    EXPECT_FALSE(ex.has_gps);

    EXPECT_FALSE(admit::ParseExif(std::vector<std::uint8_t>{'M', 'M', 0, 42}, ex));
    EXPECT_FALSE(admit::ParseExif(testutil::Bytes("not tiff at all"), ex));

    auto truncated = testutil::ExifTiff(1, true);
    truncated.resize(12);
    EXPECT_FALSE(admit::ParseExif(truncated, ex));
}

TEST_F(ImageScrubberTest, JpegLosesLocationButKeepsPixelsAndOrientation) {
    testutil::JpegParts parts;
    parts.exif = testutil::ExifTiff(6, true);
    parts.xmp = true;
    parts.comment = true;
    parts.icc = true;
    parts.trailer = true;
    const auto in = testutil::BuildJpeg(parts);
    ASSERT_TRUE(Contains(in, kGpsMarker));

    ASSERT_EQ(Scrub(in), ScrubStatus::Ok) << report_.error;
    EXPECT_EQ(report_.format, admit::ImageFormat::Jpeg);
    EXPECT_TRUE(report_.had_location);
    EXPECT_EQ(report_.orientation, std::optional<std::uint16_t>(6));
    EXPECT_EQ(report_.removed, (std::vector<std::string>{"exif", "xmp", "comment", "trailer"}));
    EXPECT_EQ(report_.bytes_in, in.size());
    EXPECT_EQ(report_.bytes_out, out_.size());

    EXPECT_FALSE(Contains(out_, kGpsMarker));
    EXPECT_FALSE(Contains(out_, "xmpmeta"));
    EXPECT_FALSE(Contains(out_, "shot by"));
    EXPECT_FALSE(Contains(out_, "appended-payload"));
    EXPECT_TRUE(Contains(out_, std::string_view("ICC_PROFILE\0", 12)));

    admit::ExifSummary ex;
    ASSERT_TRUE(admit::ParseExif(ExtractJpegExif(out_), ex));
    EXPECT_EQ(ex.orientation, std::optional<std::uint16_t>(6));
    EXPECT_FALSE(ex.has_gps);

    const auto tail = ScanTail(in);
    ASSERT_FALSE(tail.empty());
    EXPECT_EQ(ScanTail(out_), tail);
    ASSERT_GE(out_.size(), tail.size());
    EXPECT_TRUE(std::equal(tail.begin(), tail.end(), out_.end() - static_cast<std::ptrdiff_t>(tail.size())));
}

TEST_F(ImageScrubberTest, MetadataBetweenProgressiveScansIsRemoved) {
    testutil::JpegParts parts;
    parts.exif_between_scans = testutil::ExifTiff(3, true);
    const auto in = testutil::BuildJpeg(parts);
    ASSERT_TRUE(Contains(in, kGpsMarker));

    ASSERT_EQ(Scrub(in), ScrubStatus::Ok) << report_.error;
    EXPECT_TRUE(report_.had_location);
    EXPECT_EQ(report_.orientation, std::optional<std::uint16_t>(3));
    EXPECT_EQ(report_.removed, (std::vector<std::string>{"exif", "comment"}));
    EXPECT_FALSE(Contains(out_, kGpsMarker));
    EXPECT_FALSE(Contains(out_, "late note"));

    admit::ExifSummary ex;
    ASSERT_TRUE(admit::ParseExif(ExtractJpegExif(out_), ex));
    EXPECT_EQ(ex.orientation, std::optional<std::uint16_t>(3));
    EXPECT_FALSE(ex.has_gps);

    // Both scans survive byte for byte and in order.
    const auto data = testutil::JpegScanData();
    auto first = std::search(out_.begin(), out_.end(), data.begin(), data.end());
    ASSERT_NE(first, out_.end());
    auto second = std::search(first + 1, out_.end(), data.begin(), data.end());
    EXPECT_NE(second, out_.end());
    EXPECT_EQ(out_[out_.size() - 2], 0xFF);
    EXPECT_EQ(out_.back(), 0xD9);

    std::vector<std::uint8_t> again;
    admit::ScrubReport second_report;
    ASSERT_EQ(scrubber_.Scrub(out_, again, second_report), ScrubStatus::Ok);
    EXPECT_EQ(again, out_);
}

TEST_F(ImageScrubberTest, ScrubbingTwiceIsStable) {
    testutil::JpegParts parts;
    parts.exif = testutil::ExifTiff(6, true);
    parts.icc = true;
    ASSERT_EQ(Scrub(testutil::BuildJpeg(parts)), ScrubStatus::Ok);
    const auto once = out_;

    ASSERT_EQ(Scrub(once), ScrubStatus::Ok);
    EXPECT_EQ(out_, once);
    EXPECT_FALSE(report_.had_location);
}

TEST_F(ImageScrubberTest, UprightJpegCarriesNoExifAtAll) {
    testutil::JpegParts parts;
    parts.exif = testutil::ExifTiff(1, false);
    ASSERT_EQ(Scrub(testutil::BuildJpeg(parts)), ScrubStatus::Ok);
    EXPECT_FALSE(Contains(out_, std::string_view("Exif\0\0", 6)));
    EXPECT_FALSE(report_.had_location);
}

TEST_F(ImageScrubberTest, BrokenJpegStructureIsMalformed) {
    testutil::JpegParts parts;
    parts.exif = testutil::Bytes("garbage, not a TIFF header");
    EXPECT_EQ(Scrub(testutil::BuildJpeg(parts)), ScrubStatus::Malformed);
    EXPECT_TRUE(out_.empty());
    EXPECT_FALSE(report_.error.empty());

    auto jpeg = testutil::BuildJpeg({});
    jpeg.resize(jpeg.size() - 2); // no EOI
    EXPECT_EQ(Scrub(jpeg), ScrubStatus::Malformed);

    const std::vector<std::uint8_t> overlong = {0xFF, 0xD8, 0xFF, 0xE1, 0x7F, 0xFF, 'E', 'x'};
    EXPECT_EQ(Scrub(overlong), ScrubStatus::Malformed);
}

TEST_F(ImageScrubberTest, PngDropsTextAndExifChunks) {
    testutil::PngParts parts;
    parts.exif = testutil::ExifTiff(3, true);
    parts.text = true;
    const auto in = testutil::BuildPng(parts);

    ASSERT_EQ(Scrub(in), ScrubStatus::Ok) << report_.error;
    EXPECT_EQ(report_.format, admit::ImageFormat::Png);
    EXPECT_TRUE(report_.had_location);
    EXPECT_EQ(report_.removed, (std::vector<std::string>{"tEXt", "eXIf"}));
    EXPECT_FALSE(Contains(out_, kGpsMarker));
    EXPECT_FALSE(Contains(out_, "camera owner"));
    EXPECT_TRUE(Contains(out_, "gAMA"));
    EXPECT_TRUE(Contains(out_, "IDAT"));

    // The orientation-only eXIf sits before the image data and its CRC holds.
    const auto exif_at = std::search(out_.begin(), out_.end(), std::begin("eXIf"), std::end("eXIf") - 1);
    const auto idat_at = std::search(out_.begin(), out_.end(), std::begin("IDAT"), std::end("IDAT") - 1);
    ASSERT_NE(exif_at, out_.end());
    EXPECT_LT(exif_at, idat_at);

    const auto again = out_;
    ASSERT_EQ(Scrub(again), ScrubStatus::Ok) << report_.error;
    EXPECT_EQ(report_.orientation, std::optional<std::uint16_t>(3));
    EXPECT_FALSE(report_.had_location);
}

TEST_F(ImageScrubberTest, PngCrcMismatchIsMalformed) {
    testutil::PngParts parts;
    parts.corrupt_crc = true;
    EXPECT_EQ(Scrub(testutil::BuildPng(parts)), ScrubStatus::Malformed);
    EXPECT_NE(report_.error.find("CRC"), std::string::npos);
    EXPECT_TRUE(out_.empty());
}

TEST_F(ImageScrubberTest, PngTrailerIsDropped) {
    auto png = testutil::BuildPng({});
    const size_t clean = png.size();
    testutil::detail::Append(png, "tail bytes");
    ASSERT_EQ(Scrub(png), ScrubStatus::Ok);
    EXPECT_EQ(out_.size(), clean);
    EXPECT_EQ(report_.removed, std::vector<std::string>{"trailer"});
}

TEST_F(ImageScrubberTest, GifKeepsLoopingButDropsCommentAndXmp) {
    testutil::GifParts parts;
    parts.comment = true;
    parts.netscape = true;
    parts.xmp = true;
    const auto in = testutil::BuildGif(parts);

    ASSERT_EQ(Scrub(in), ScrubStatus::Ok) << report_.error;
    EXPECT_EQ(report_.format, admit::ImageFormat::Gif);
    EXPECT_EQ(report_.removed, (std::vector<std::string>{"xmp", "comment"}));
    EXPECT_TRUE(Contains(out_, "NETSCAPE2.0"));
    EXPECT_FALSE(Contains(out_, "XMP DataXMP"));
    EXPECT_FALSE(Contains(out_, "my house"));
    ASSERT_FALSE(out_.empty());
    EXPECT_EQ(out_.back(), 0x3B);

    auto truncated = in;
    truncated.pop_back();
    EXPECT_EQ(Scrub(truncated), ScrubStatus::Malformed);
}

TEST_F(ImageScrubberTest, WebpRewritesFlagsAndRiffSize) {
    testutil::WebpParts parts;
    parts.exif = testutil::ExifTiff(6, true);
    parts.xmp = true;
    const auto in = testutil::BuildWebp(parts);
    ASSERT_EQ(in[20], 0x0C);

    ASSERT_EQ(Scrub(in), ScrubStatus::Ok) << report_.error;
    EXPECT_EQ(report_.format, admit::ImageFormat::Webp);
    EXPECT_TRUE(report_.had_location);
    EXPECT_FALSE(Contains(out_, kGpsMarker));
    EXPECT_FALSE(Contains(out_, "<xmp/>"));
    EXPECT_TRUE(Contains(out_, "VP8L"));

    EXPECT_EQ(out_[20], 0x08); // EXIF present again, XMP gone
    const std::uint32_t riff = out_[4] | (out_[5] << 8) | (out_[6] << 16) | (static_cast<std::uint32_t>(out_[7]) << 24);
    EXPECT_EQ(riff, out_.size() - 8);
    EXPECT_EQ(out_.size() % 2, 0u);
}

TEST_F(ImageScrubberTest, UprightWebpClearsMetadataFlags) {
    testutil::WebpParts parts;
    parts.exif = testutil::ExifTiff(1, false);
    ASSERT_EQ(Scrub(testutil::BuildWebp(parts)), ScrubStatus::Ok);
    EXPECT_EQ(out_[20], 0x00);
    EXPECT_FALSE(Contains(out_, "EXIF"));
}

TEST_F(ImageScrubberTest, OtherFormatsAreUnsupported) {
    EXPECT_EQ(Scrub(testutil::Bytes("BM6 bitmap header")), ScrubStatus::Unsupported);
    EXPECT_EQ(Scrub({}), ScrubStatus::Unsupported);
    EXPECT_EQ(Scrub(testutil::Bytes("<svg xmlns='http://www.w3.org/2000/svg'/>")), ScrubStatus::Unsupported);
    EXPECT_FALSE(report_.error.empty());
}

} // namespace
