#include "admit/type_classifier.hpp"

#include <algorithm>
#include <cctype>
#include <cstring>

namespace admit {

namespace {

bool StartsWith(std::span<const std::uint8_t> b, const char* magic, size_t len, size_t at = 0) {
    if (b.size() < at + len) return false;
    return std::memcmp(b.data() + at, magic, len) == 0;
}

bool StartsWithNoCase(std::span<const std::uint8_t> b, std::string_view s) {
    if (b.size() < s.size()) return false;
    for (size_t i = 0; i < s.size(); ++i) {
        if (std::tolower(b[i]) != static_cast<unsigned char>(s[i])) return false;
    }
    return true;
}

// Printable for sniffing purposes: text controls, ASCII graphic, and any
// high byte (UTF-8 is not validated here).
bool IsTextByte(std::uint8_t c) {
    if (c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == 0x1B) return true;
    if (c < 0x20 || c == 0x7F) return false;
    return true;
}

bool LooksLikeText(std::span<const std::uint8_t> b) {
    size_t bad = 0;
    for (std::uint8_t c : b) {
        if (c == 0) return false;
        if (!IsTextByte(c)) ++bad;
    }
    return bad * 20 <= b.size(); // <= 5% controls
}

std::string NormalizeMime(std::string_view mime) {
    std::string m(mime.substr(0, mime.find(';')));
    while (!m.empty() && std::isspace(static_cast<unsigned char>(m.back()))) m.pop_back();
    size_t start = 0;
    while (start < m.size() && std::isspace(static_cast<unsigned char>(m[start]))) ++start;
    m.erase(0, start);
    std::transform(m.begin(), m.end(), m.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return m;
}

bool MimeConsistent(const ExtensionRule& rule, std::string_view declared) {
    const std::string mime = NormalizeMime(declared);
    // Absent or generic client MIME says nothing about the content.
    if (mime.empty() || mime == "application/octet-stream") return true;
    if (rule.mime_types.empty()) return true;
    if (std::find(rule.mime_types.begin(), rule.mime_types.end(), mime) != rule.mime_types.end()) return true;

    // Browsers disagree on text subtypes; any text/* is fine for a text rule.
    const bool declared_text = mime.rfind("text/", 0) == 0;
    const bool rule_text = std::any_of(rule.mime_types.begin(), rule.mime_types.end(),
                                       [](const std::string& m) { return m.rfind("text/", 0) == 0; });
    return declared_text && rule_text;
}

std::string Lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

} // namespace

SignatureKind SniffSignature(std::span<const std::uint8_t> prefix) {
    auto b = prefix.first(std::min(prefix.size(), kSniffPrefixBytes));
    if (b.empty()) return SignatureKind::Empty;

    if (StartsWith(b, "MZ", 2)) return SignatureKind::PeExecutable;
    if (StartsWith(b, "\x7F" "ELF", 4)) return SignatureKind::ElfExecutable;
    if (StartsWith(b, "\xFE\xED\xFA\xCE", 4) || StartsWith(b, "\xFE\xED\xFA\xCF", 4) ||
        StartsWith(b, "\xCE\xFA\xED\xFE", 4) || StartsWith(b, "\xCF\xFA\xED\xFE", 4) ||
        StartsWith(b, "\xCA\xFE\xBA\xBE", 4)) {
        return SignatureKind::MachOExecutable;
    }
    if (StartsWith(b, "\xFF\xD8\xFF", 3)) return SignatureKind::Jpeg;
    if (StartsWith(b, "\x89PNG\r\n\x1A\n", 8)) return SignatureKind::Png;
    if (StartsWith(b, "GIF87a", 6) || StartsWith(b, "GIF89a", 6)) return SignatureKind::Gif;
    if (StartsWith(b, "RIFF", 4) && StartsWith(b, "WEBP", 4, 8)) return SignatureKind::Webp;
    if (StartsWith(b, "%PDF-", 5)) return SignatureKind::Pdf;
    if (StartsWith(b, "PK\x03\x04", 4) || StartsWith(b, "PK\x05\x06", 4) || StartsWith(b, "PK\x07\x08", 4)) {
        return SignatureKind::Zip;
    }
    if (StartsWith(b, "\x1F\x8B", 2)) return SignatureKind::Gzip;
    if (StartsWith(b, "BZh", 3)) return SignatureKind::Bzip2;
    if (StartsWith(b, "\xFD" "7zXZ\x00", 6)) return SignatureKind::Xz;
    if (StartsWith(b, "7z\xBC\xAF\x27\x1C", 6)) return SignatureKind::SevenZip;
    if (StartsWith(b, "Rar!\x1A\x07", 6)) return SignatureKind::Rar;
    if (StartsWith(b, "\xD0\xCF\x11\xE0\xA1\xB1\x1A\xE1", 8)) return SignatureKind::Ole2;
    if (StartsWith(b, "ustar", 5, 257)) return SignatureKind::Tar;

    // Text-family signatures; skip a UTF-8 BOM and leading whitespace.
    auto t = b;
    if (StartsWith(t, "\xEF\xBB\xBF", 3)) t = t.subspan(3);
    if (StartsWith(t, "#!", 2)) return LooksLikeText(b) ? SignatureKind::Script : SignatureKind::Unknown;
    while (!t.empty() && std::isspace(t.front())) t = t.subspan(1);

    if (!LooksLikeText(b)) return SignatureKind::Unknown;
    if (StartsWithNoCase(t, "<?php")) return SignatureKind::Php;
    if (StartsWithNoCase(t, "<?xml") || StartsWithNoCase(t, "<svg")) return SignatureKind::Xml;
    if (StartsWithNoCase(t, "<!doctype html") || StartsWithNoCase(t, "<html")) return SignatureKind::Html;
    return SignatureKind::Text;
}

bool IsExecutableSignature(SignatureKind k) {
    return k == SignatureKind::PeExecutable || k == SignatureKind::ElfExecutable ||
           k == SignatureKind::MachOExecutable;
}

Classification TypeClassifier::ClassifyName(std::string_view filename) const {
    Classification c;
    c.extension = ExtensionOf(filename, *table_);

    // Inner segments: "notes.exe.txt" carries ".exe" before the real extension.
    const std::string name = Lower(filename);
    const size_t ext_pos = c.extension.empty() ? name.size() : name.size() - c.extension.size();
    size_t pos = name.find('.');
    while (pos != std::string::npos && pos < ext_pos) {
        const size_t next = name.find('.', pos + 1);
        const size_t end = (next == std::string::npos || next > ext_pos) ? ext_pos : next;
        const std::string seg = name.substr(pos, end - pos);
        if (pos > 0 && seg.size() > 1 && table_->IsDenied(seg)) c.denied_inner.push_back(seg);
        pos = next;
    }

    if (c.extension.empty()) return c;

    if (table_->IsDenied(c.extension)) {
        c.denied = true;
        return c;
    }

    const ExtensionRule* rule = context_->FindRule(c.extension);
    if (rule && rule->allowed) {
        c.rule = rule;
        c.allowed = true;
    }
    return c;
}

void TypeClassifier::ApplySignature(Classification& c,
                                    std::span<const std::uint8_t> prefix,
                                    std::string_view declared_mime) const {
    c.signature = SniffSignature(prefix);
    if (!c.rule) return;

    const auto& expected = c.rule->signatures;
    if (!expected.empty() && c.signature != SignatureKind::Empty) {
        c.signature_mismatch =
            std::find(expected.begin(), expected.end(), c.signature) == expected.end();
    }
    c.mime_mismatch = !MimeConsistent(*c.rule, declared_mime);
}

} // namespace admit
