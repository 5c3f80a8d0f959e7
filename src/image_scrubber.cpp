#include "admit/image_scrubber.hpp"

#include <zlib.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <cstring>

namespace admit {

namespace {

bool Match(std::span<const std::uint8_t> bytes, size_t offset, const char* magic, size_t len) {
    if (offset + len > bytes.size()) return false;
    return std::memcmp(bytes.data() + offset, magic, len) == 0;
}

bool ReadU16(std::span<const std::uint8_t> b, size_t off, bool little, std::uint16_t* out) {
    if (off + 2 > b.size()) return false;
    *out = little ? static_cast<std::uint16_t>(b[off] | (b[off + 1] << 8))
                  : static_cast<std::uint16_t>((b[off] << 8) | b[off + 1]);
    return true;
}

bool ReadU32(std::span<const std::uint8_t> b, size_t off, bool little, std::uint32_t* out) {
    if (off + 4 > b.size()) return false;
    if (little) {
        *out = static_cast<std::uint32_t>(b[off]) | (static_cast<std::uint32_t>(b[off + 1]) << 8) |
               (static_cast<std::uint32_t>(b[off + 2]) << 16) | (static_cast<std::uint32_t>(b[off + 3]) << 24);
    } else {
        *out = (static_cast<std::uint32_t>(b[off]) << 24) | (static_cast<std::uint32_t>(b[off + 1]) << 16) |
               (static_cast<std::uint32_t>(b[off + 2]) << 8) | static_cast<std::uint32_t>(b[off + 3]);
    }
    return true;
}

void PutU16BE(std::vector<std::uint8_t>& out, std::uint16_t v) {
    out.push_back(static_cast<std::uint8_t>(v >> 8));
    out.push_back(static_cast<std::uint8_t>(v));
}

void PutU32BE(std::vector<std::uint8_t>& out, std::uint32_t v) {
    for (int shift = 24; shift >= 0; shift -= 8) out.push_back(static_cast<std::uint8_t>(v >> shift));
}

void PutU32LE(std::vector<std::uint8_t>& out, std::uint32_t v) {
    for (int shift = 0; shift <= 24; shift += 8) out.push_back(static_cast<std::uint8_t>(v >> shift));
}

void SetU32LE(std::vector<std::uint8_t>& out, size_t at, std::uint32_t v) {
    for (int i = 0; i < 4; ++i) out[at + i] = static_cast<std::uint8_t>(v >> (8 * i));
}

void Append(std::vector<std::uint8_t>& out, std::span<const std::uint8_t> in, size_t off, size_t len) {
    out.insert(out.end(), in.begin() + static_cast<std::ptrdiff_t>(off),
               in.begin() + static_cast<std::ptrdiff_t>(off + len));
}

void MergeExif(const ExifSummary& ex, ScrubReport& report) {
    if (ex.has_gps) report.had_location = true;
    if (ex.orientation && !report.orientation) report.orientation = ex.orientation;
}

bool NeedsOrientation(const ScrubReport& report) {
    return report.orientation && *report.orientation != 1;
}

// GIF data sub-blocks starting at p; end receives the offset past the terminator.
bool SkipSubBlocks(std::span<const std::uint8_t> in, size_t p, size_t* end) {
    while (p < in.size()) {
        const std::uint8_t n = in[p++];
        if (n == 0) {
            *end = p;
            return true;
        }
        if (p + n > in.size()) return false;
        p += n;
    }
    return false;
}

constexpr std::array<const char*, 10> kPngKeep = {
    "PLTE", "tRNS", "gAMA", "cHRM", "sRGB", "iCCP", "sBIT", "pHYs",
    "acTL", "fcTL",
};

bool PngKeeps(const std::string& type) {
    if (std::isupper(static_cast<unsigned char>(type[0]))) return true; // critical
    if (type == "fdAT") return true;
    return std::any_of(kPngKeep.begin(), kPngKeep.end(), [&](const char* k) { return type == k; });
}

void AppendPngChunk(std::vector<std::uint8_t>& out, const char* type, std::span<const std::uint8_t> data) {
    PutU32BE(out, static_cast<std::uint32_t>(data.size()));
    const size_t type_at = out.size();
    out.insert(out.end(), type, type + 4);
    out.insert(out.end(), data.begin(), data.end());
    uLong crc = crc32(0L, Z_NULL, 0);
    crc = crc32(crc, out.data() + type_at, static_cast<uInt>(4 + data.size()));
    PutU32BE(out, static_cast<std::uint32_t>(crc));
}

} // namespace

const char* ToString(ImageFormat f) {
    switch (f) {
        case ImageFormat::Jpeg: return "jpeg";
        case ImageFormat::Png:  return "png";
        case ImageFormat::Gif:  return "gif";
        case ImageFormat::Webp: return "webp";
    }
    return "unknown";
}

bool ParseExif(std::span<const std::uint8_t> tiff, ExifSummary& out) {
    out = ExifSummary{};
    if (tiff.size() < 8) return false;

    bool little = false;
    if (Match(tiff, 0, "II", 2)) {
        little = true;
    } else if (!Match(tiff, 0, "MM", 2)) {
        return false;
    }

    std::uint16_t magic = 0;
    std::uint32_t ifd0 = 0;
    if (!ReadU16(tiff, 2, little, &magic) || magic != 42) return false;
    if (!ReadU32(tiff, 4, little, &ifd0) || ifd0 < 8) return false;

    std::uint16_t count = 0;
    if (!ReadU16(tiff, ifd0, little, &count)) return false;
    if (static_cast<std::uint64_t>(ifd0) + 2 + static_cast<std::uint64_t>(count) * 12 > tiff.size()) return false;

    for (std::uint16_t i = 0; i < count; ++i) {
        const size_t e = ifd0 + 2 + static_cast<size_t>(i) * 12;
        std::uint16_t tag = 0;
        std::uint16_t type = 0;
        std::uint32_t n = 0;
        ReadU16(tiff, e, little, &tag);
        ReadU16(tiff, e + 2, little, &type);
        ReadU32(tiff, e + 4, little, &n);

        if (tag == 0x0112 && type == 3 && n >= 1) {
            std::uint16_t v = 0;
            ReadU16(tiff, e + 8, little, &v);
            if (v >= 1 && v <= 8) out.orientation = v;
        } else if (tag == 0x8825) {
            out.has_gps = true;
        }
    }
    return true;
}

std::vector<std::uint8_t> MinimalOrientationExif(std::uint16_t orientation) {
    std::vector<std::uint8_t> t;
    t.reserve(26);
    t.push_back('M');
    t.push_back('M');
    PutU16BE(t, 42);
    PutU32BE(t, 8);            // IFD0
    PutU16BE(t, 1);            // one entry
    PutU16BE(t, 0x0112);       // Orientation
    PutU16BE(t, 3);            // SHORT
    PutU32BE(t, 1);
    PutU16BE(t, orientation);
    PutU16BE(t, 0);
    PutU32BE(t, 0);            // no next IFD
    return t;
}

ScrubStatus ImageScrubber::Scrub(std::span<const std::uint8_t> in,
                                 std::vector<std::uint8_t>& out,
                                 ScrubReport& report) const {
    report = ScrubReport{};
    report.bytes_in = in.size();
    out.clear();

    ScrubStatus st;
    if (Match(in, 0, "\xFF\xD8\xFF", 3)) {
        report.format = ImageFormat::Jpeg;
        st = ScrubJpeg(in, out, report);
    } else if (Match(in, 0, "\x89PNG\r\n\x1A\n", 8)) {
        report.format = ImageFormat::Png;
        st = ScrubPng(in, out, report);
    } else if (Match(in, 0, "GIF87a", 6) || Match(in, 0, "GIF89a", 6)) {
        report.format = ImageFormat::Gif;
        st = ScrubGif(in, out, report);
    } else if (Match(in, 0, "RIFF", 4) && Match(in, 8, "WEBP", 4)) {
        report.format = ImageFormat::Webp;
        st = ScrubWebp(in, out, report);
    } else {
        report.error = "not a JPEG, PNG, GIF or WebP image";
        return ScrubStatus::Unsupported;
    }

    if (st != ScrubStatus::Ok) {
        out.clear();
        return st;
    }
    report.bytes_out = out.size();
    return ScrubStatus::Ok;
}

ScrubStatus ImageScrubber::ScrubJpeg(std::span<const std::uint8_t> in,
                                     std::vector<std::uint8_t>& out,
                                     ScrubReport& report) const {
    auto fail = [&](const char* msg) {
        report.error = msg;
        return ScrubStatus::Malformed;
    };

    struct Segment {
        std::uint8_t marker = 0;
        size_t start = 0;
        size_t size = 0;
        size_t payload = 0;
        size_t payload_len = 0;
        bool keep = true;
        bool entropy = false;
    };

    // Pass 1: walk every marker segment up to EOI. Progressive and multi-scan
    // files may carry APPn/COM segments between scans, so entropy-coded data
    // is skipped rather than copied through to the end.
    std::vector<Segment> segs;
    size_t off = 2;
    size_t eoi_end = 0;
    bool saw_scan = false;
    while (eoi_end == 0) {
        if (off >= in.size()) return fail(saw_scan ? "JPEG missing EOI" : "JPEG ends before image data");
        if (in[off] != 0xFF) return fail("JPEG marker expected");
        size_t m = off;
        while (m < in.size() && in[m] == 0xFF) ++m;
        if (m >= in.size()) return fail("JPEG ends inside marker");

        Segment s;
        s.marker = in[m];
        s.start = m - 1;
        off = m + 1;

        if (s.marker == 0x00 || s.marker == 0xD8) return fail("JPEG marker out of place");
        if (s.marker == 0xD9) {
            if (!saw_scan) return fail("JPEG ends before image data");
            s.size = off - s.start;
            segs.push_back(s);
            eoi_end = off;
            break;
        }
        if ((s.marker >= 0xD0 && s.marker <= 0xD7) || s.marker == 0x01) {
            s.size = off - s.start;
            segs.push_back(s);
            continue;
        }

        std::uint16_t len = 0;
        if (!ReadU16(in, off, false, &len) || len < 2 || off + len > in.size()) {
            return fail("JPEG segment length out of range");
        }
        s.payload = off + 2;
        s.payload_len = len - 2;
        s.size = off + len - s.start;
        off += len;
        segs.push_back(s);
        if (s.marker != 0xDA) continue;

        // Entropy-coded data runs until a marker other than a stuffed 0xFF00
        // or a restart marker.
        saw_scan = true;
        size_t i = off;
        while (true) {
            if (i + 1 >= in.size()) return fail("JPEG missing EOI");
            if (in[i] != 0xFF) {
                ++i;
                continue;
            }
            const std::uint8_t next = in[i + 1];
            if (next == 0x00 || (next >= 0xD0 && next <= 0xD7)) {
                i += 2;
                continue;
            }
            break;
        }
        Segment data;
        data.start = off;
        data.size = i - off;
        data.entropy = true;
        segs.push_back(data);
        off = i;
    }

    for (auto& s : segs) {
        if (s.entropy) continue;
        const auto payload = in.subspan(s.payload, s.payload_len);
        if (s.marker == 0xE0) {
            s.keep = Match(payload, 0, "JFIF\0", 5) || Match(payload, 0, "JFXX\0", 5);
            if (!s.keep) report.removed.emplace_back("app0");
        } else if (s.marker == 0xE1) {
            s.keep = false;
            if (Match(payload, 0, "Exif\0\0", 6)) {
                ExifSummary ex;
                if (!ParseExif(payload.subspan(6), ex)) return fail("EXIF block does not parse");
                MergeExif(ex, report);
                report.removed.emplace_back("exif");
            } else if (Match(payload, 0, "http://ns.adobe.com/xap/1.0/", 28)) {
                report.removed.emplace_back("xmp");
            } else {
                report.removed.emplace_back("app1");
            }
        } else if (s.marker == 0xE2) {
            s.keep = Match(payload, 0, "ICC_PROFILE\0", 12);
            if (!s.keep) report.removed.emplace_back("app2");
        } else if (s.marker == 0xEE) {
            s.keep = Match(payload, 0, "Adobe", 5);
            if (!s.keep) report.removed.emplace_back("app14");
        } else if (s.marker >= 0xE3 && s.marker <= 0xEF) {
            s.keep = false;
            report.removed.push_back("app" + std::to_string(s.marker - 0xE0));
        } else if (s.marker == 0xFE) {
            s.keep = false;
            report.removed.emplace_back("comment");
        }
    }

    // Pass 2: write kept segments; the orientation block goes right after the
    // leading JFIF segments.
    out.reserve(in.size());
    out.push_back(0xFF);
    out.push_back(0xD8);
    bool orientation_written = !NeedsOrientation(report);
    for (const auto& s : segs) {
        if (!s.keep) continue;
        if (!orientation_written && (s.entropy || s.marker != 0xE0)) {
            const auto tiff = MinimalOrientationExif(*report.orientation);
            out.push_back(0xFF);
            out.push_back(0xE1);
            PutU16BE(out, static_cast<std::uint16_t>(2 + 6 + tiff.size()));
            out.insert(out.end(), {'E', 'x', 'i', 'f', 0, 0});
            out.insert(out.end(), tiff.begin(), tiff.end());
            orientation_written = true;
        }
        Append(out, in, s.start, s.size);
    }

    if (eoi_end < in.size()) report.removed.emplace_back("trailer");
    return ScrubStatus::Ok;
}

ScrubStatus ImageScrubber::ScrubPng(std::span<const std::uint8_t> in,
                                    std::vector<std::uint8_t>& out,
                                    ScrubReport& report) const {
    auto fail = [&](std::string msg) {
        report.error = std::move(msg);
        return ScrubStatus::Malformed;
    };

    auto write_orientation = [&]() {
        const auto tiff = MinimalOrientationExif(*report.orientation);
        AppendPngChunk(out, "eXIf", tiff);
    };

    out.reserve(in.size());
    Append(out, in, 0, 8);

    size_t off = 8;
    bool first = true;
    bool saw_iend = false;
    bool orientation_written = false;

    while (off < in.size()) {
        std::uint32_t len = 0;
        if (off + 12 > in.size() || !ReadU32(in, off, false, &len)) return fail("PNG chunk truncated");
        if (len > 0x7FFFFFFFu || off + 12 + static_cast<size_t>(len) > in.size()) {
            return fail("PNG chunk length out of range");
        }

        const std::string type(reinterpret_cast<const char*>(in.data() + off + 4), 4);
        if (!std::all_of(type.begin(), type.end(), [](unsigned char c) { return std::isalpha(c); })) {
            return fail("PNG chunk type invalid");
        }

        std::uint32_t stored = 0;
        ReadU32(in, off + 8 + len, false, &stored);
        uLong crc = crc32(0L, Z_NULL, 0);
        crc = crc32(crc, in.data() + off + 4, static_cast<uInt>(4 + len));
        if (static_cast<std::uint32_t>(crc) != stored) return fail("PNG CRC mismatch in " + type);

        if (first && type != "IHDR") return fail("PNG does not start with IHDR");
        first = false;

        const size_t total = 12 + static_cast<size_t>(len);
        if (type == "eXIf") {
            ExifSummary ex;
            if (!ParseExif(in.subspan(off + 8, len), ex)) return fail("EXIF block does not parse");
            MergeExif(ex, report);
            report.removed.emplace_back("eXIf");
        } else if (PngKeeps(type)) {
            if ((type == "IDAT" || type == "IEND") && !orientation_written) {
                if (NeedsOrientation(report)) write_orientation();
                orientation_written = true;
            }
            Append(out, in, off, total);
        } else {
            report.removed.push_back(type);
        }

        off += total;
        if (type == "IEND") {
            saw_iend = true;
            break;
        }
    }

    if (!saw_iend) return fail("PNG missing IEND");
    if (off < in.size()) report.removed.emplace_back("trailer");
    return ScrubStatus::Ok;
}

ScrubStatus ImageScrubber::ScrubGif(std::span<const std::uint8_t> in,
                                    std::vector<std::uint8_t>& out,
                                    ScrubReport& report) const {
    auto fail = [&](const char* msg) {
        report.error = msg;
        return ScrubStatus::Malformed;
    };

    if (in.size() < 13) return fail("GIF header truncated");
    size_t off = 13;
    const std::uint8_t packed = in[10];
    if (packed & 0x80) off += 3ULL << ((packed & 0x07) + 1);
    if (off > in.size()) return fail("GIF colour table truncated");

    out.reserve(in.size());
    Append(out, in, 0, off);

    while (true) {
        if (off >= in.size()) return fail("GIF missing trailer");
        const std::uint8_t intro = in[off];

        if (intro == 0x3B) {
            out.push_back(0x3B);
            ++off;
            break;
        }

        size_t end = 0;
        if (intro == 0x2C) {
            if (off + 10 > in.size()) return fail("GIF image descriptor truncated");
            const std::uint8_t ipacked = in[off + 9];
            size_t p = off + 10;
            if (ipacked & 0x80) p += 3ULL << ((ipacked & 0x07) + 1);
            p += 1; // LZW minimum code size
            if (p > in.size() || !SkipSubBlocks(in, p, &end)) return fail("GIF image data truncated");
            Append(out, in, off, end - off);
            off = end;
            continue;
        }

        if (intro != 0x21 || off + 2 > in.size()) return fail("GIF block introducer invalid");
        const std::uint8_t label = in[off + 1];

        if (label == 0xFF) {
            if (off + 3 > in.size()) return fail("GIF extension truncated");
            const std::uint8_t bs = in[off + 2];
            if (!SkipSubBlocks(in, off + 3 + bs, &end)) return fail("GIF extension truncated");
            const bool keep = bs == 11 && (Match(in, off + 3, "NETSCAPE2.0", 11) ||
                                           Match(in, off + 3, "ANIMEXTS1.0", 11) ||
                                           Match(in, off + 3, "ICCRGBG1012", 11));
            if (keep) {
                Append(out, in, off, end - off);
            } else {
                report.removed.emplace_back(bs == 11 && Match(in, off + 3, "XMP DataXMP", 11) ? "xmp" : "application");
            }
        } else {
            if (!SkipSubBlocks(in, off + 2, &end)) return fail("GIF extension truncated");
            if (label == 0xF9 || label == 0x01) {
                Append(out, in, off, end - off);
            } else if (label == 0xFE) {
                report.removed.emplace_back("comment");
            } else {
                report.removed.emplace_back("extension");
            }
        }
        off = end;
    }

    if (off < in.size()) report.removed.emplace_back("trailer");
    return ScrubStatus::Ok;
}

ScrubStatus ImageScrubber::ScrubWebp(std::span<const std::uint8_t> in,
                                     std::vector<std::uint8_t>& out,
                                     ScrubReport& report) const {
    auto fail = [&](const char* msg) {
        report.error = msg;
        return ScrubStatus::Malformed;
    };

    std::uint32_t riff = 0;
    if (!ReadU32(in, 4, true, &riff) || riff < 4 || static_cast<std::uint64_t>(riff) + 8 > in.size()) {
        return fail("WebP RIFF size out of range");
    }
    const size_t end = 8 + static_cast<size_t>(riff);

    out.reserve(in.size());
    Append(out, in, 0, 12);

    std::optional<size_t> vp8x_flags_at;
    size_t off = 12;
    while (off < end) {
        std::uint32_t len = 0;
        if (off + 8 > end || !ReadU32(in, off + 4, true, &len)) return fail("WebP chunk truncated");
        if (off + 8 + static_cast<size_t>(len) > end) return fail("WebP chunk length out of range");
        const size_t padded = std::min(end - off, 8 + static_cast<size_t>(len) + (len & 1));

        const std::string fourcc(reinterpret_cast<const char*>(in.data() + off), 4);
        if (fourcc == "EXIF") {
            auto data = in.subspan(off + 8, len);
            if (Match(data, 0, "Exif\0\0", 6)) data = data.subspan(6);
            ExifSummary ex;
            if (!ParseExif(data, ex)) return fail("EXIF block does not parse");
            MergeExif(ex, report);
            report.removed.emplace_back("exif");
        } else if (fourcc == "XMP ") {
            report.removed.emplace_back("xmp");
        } else if (fourcc == "VP8 " || fourcc == "VP8L" || fourcc == "VP8X" || fourcc == "ALPH" ||
                   fourcc == "ANIM" || fourcc == "ANMF" || fourcc == "ICCP") {
            if (fourcc == "VP8X") {
                if (len < 10) return fail("WebP VP8X chunk too short");
                vp8x_flags_at = out.size() + 8;
            }
            Append(out, in, off, padded);
            if (padded < 8 + static_cast<size_t>(len) + (len & 1)) out.push_back(0);
        } else {
            report.removed.push_back(fourcc);
        }
        off += padded;
    }

    bool exif_kept = false;
    if (vp8x_flags_at && NeedsOrientation(report)) {
        const auto tiff = MinimalOrientationExif(*report.orientation);
        out.insert(out.end(), {'E', 'X', 'I', 'F'});
        PutU32LE(out, static_cast<std::uint32_t>(tiff.size()));
        out.insert(out.end(), tiff.begin(), tiff.end());
        exif_kept = true;
    }
    if (vp8x_flags_at) {
        std::uint8_t& flags = out[*vp8x_flags_at];
        flags &= static_cast<std::uint8_t>(~0x0C);
        if (exif_kept) flags |= 0x08;
    }
    SetU32LE(out, 4, static_cast<std::uint32_t>(out.size() - 8));

    if (end < in.size()) report.removed.emplace_back("trailer");
    return ScrubStatus::Ok;
}

} // namespace admit
