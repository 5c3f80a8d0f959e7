#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace admit {

enum class ImageFormat {
    Jpeg,
    Png,
    Gif,
    Webp,
};

const char* ToString(ImageFormat f);

enum class ScrubStatus {
    Ok,
    Unsupported, // not one of the handled raster formats
    Malformed,   // container or metadata structure does not parse
};

struct ScrubReport {
    ImageFormat format = ImageFormat::Jpeg;
    std::vector<std::string> removed;      // block kinds, in file order
    bool had_location = false;             // EXIF GPS IFD present in the input
    std::optional<std::uint16_t> orientation;
    std::uint64_t bytes_in = 0;
    std::uint64_t bytes_out = 0;
    std::string error;
};

struct ExifSummary {
    std::optional<std::uint16_t> orientation;
    bool has_gps = false;
};

// Walks IFD0 of a TIFF-structured EXIF block. False if the structure is broken.
bool ParseExif(std::span<const std::uint8_t> tiff, ExifSummary& out);

// Smallest TIFF block carrying only the orientation tag.
std::vector<std::uint8_t> MinimalOrientationExif(std::uint16_t orientation);

// Rewrites a raster image without its metadata blocks. Pixel data is copied
// byte for byte; only orientation and colour information survive.
class ImageScrubber {
public:
    ScrubStatus Scrub(std::span<const std::uint8_t> in,
                      std::vector<std::uint8_t>& out,
                      ScrubReport& report) const;

private:
    ScrubStatus ScrubJpeg(std::span<const std::uint8_t> in, std::vector<std::uint8_t>& out, ScrubReport& report) const;
    ScrubStatus ScrubPng(std::span<const std::uint8_t> in, std::vector<std::uint8_t>& out, ScrubReport& report) const;
    ScrubStatus ScrubGif(std::span<const std::uint8_t> in, std::vector<std::uint8_t>& out, ScrubReport& report) const;
    ScrubStatus ScrubWebp(std::span<const std::uint8_t> in, std::vector<std::uint8_t>& out, ScrubReport& report) const;
};

} // namespace admit
