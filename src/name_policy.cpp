#include "admit/name_policy.hpp"

#include <cctype>
#include <cstdint>
#include <vector>

namespace admit {

namespace {

constexpr size_t kMaxFilenameBytes = 255;

bool IsStrictChar(unsigned char c) {
    if (std::isalnum(c)) return true;
    switch (c) {
        case '.': case '_': case '-': case ' ':
        case '(': case ')': case '[': case ']':
            return true;
        default:
            return false;
    }
}

} // namespace

bool IsValidUtf8(std::string_view s) {
    size_t i = 0;
    while (i < s.size()) {
        const auto c = static_cast<unsigned char>(s[i]);
        size_t n = 0;
        std::uint32_t cp = 0;
        if (c < 0x80) {
            ++i;
            continue;
        } else if ((c & 0xE0) == 0xC0) {
            n = 1;
            cp = c & 0x1F;
        } else if ((c & 0xF0) == 0xE0) {
            n = 2;
            cp = c & 0x0F;
        } else if ((c & 0xF8) == 0xF0) {
            n = 3;
            cp = c & 0x07;
        } else {
            return false;
        }
        if (i + n >= s.size()) return false;
        for (size_t k = 1; k <= n; ++k) {
            const auto cc = static_cast<unsigned char>(s[i + k]);
            if ((cc & 0xC0) != 0x80) return false;
            cp = (cp << 6) | (cc & 0x3F);
        }
        // Overlong forms, surrogates and values past U+10FFFF.
        if ((n == 1 && cp < 0x80) || (n == 2 && cp < 0x800) || (n == 3 && cp < 0x10000)) return false;
        if ((cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF) return false;
        i += n + 1;
    }
    return true;
}

bool ValidateFilename(std::string_view name,
                      const PolicyTable& table,
                      const ContextPolicy& context,
                      VerdictBuilder& verdict) {
    auto reject = [&](std::string msg) {
        verdict.Reject(ReasonCode::InvalidFilename, ErrorKind::PolicyViolation, std::move(msg));
        return false;
    };

    if (name.empty()) return reject("filename is empty");
    if (name.size() > kMaxFilenameBytes) return reject("filename longer than 255 bytes");

    for (unsigned char c : name) {
        if (c == '/' || c == '\\') return reject("filename contains a path separator");
        if (c < 0x20 || c == 0x7F) return reject("filename contains control characters");
    }
    if (name.find("..") != std::string_view::npos) return reject("filename contains '..'");
    if (!IsValidUtf8(name)) return reject("filename is not valid UTF-8");

    if (context.strict_filename_charset) {
        for (unsigned char c : name) {
            if (!IsStrictChar(c)) return reject("filename contains characters outside [A-Za-z0-9._-()[] ]");
        }
    }

    const std::string ext = ExtensionOf(name, table);
    if (name.front() == '.') {
        // Dotfiles pass only when the whole name is itself a known entry.
        if (ext.size() != name.size() || !context.FindRule(ext)) {
            return reject("hidden filenames are not accepted");
        }
    }

    if (ext.empty()) {
        verdict.Reject(ReasonCode::ExtensionNotAllowed, ErrorKind::PolicyViolation,
                       "filename has no extension");
        return false;
    }
    return true;
}

const char* ToString(EntryPathStatus s) {
    switch (s) {
        case EntryPathStatus::Ok: return "ok";
        case EntryPathStatus::Empty: return "empty";
        case EntryPathStatus::Absolute: return "absolute";
        case EntryPathStatus::Escapes: return "escapes root";
        case EntryPathStatus::BadChar: return "bad character";
    }
    return "unknown";
}

EntryPathStatus NormalizeEntryPath(std::string_view raw, std::string& out_relative) {
    out_relative.clear();

    std::string s(raw);
    for (char& c : s) {
        if (c == '\\') c = '/';
    }

    for (unsigned char c : s) {
        if (c < 0x20 || c == 0x7F) return EntryPathStatus::BadChar;
    }
    if (!IsValidUtf8(s)) return EntryPathStatus::BadChar;
    if (!s.empty() && s.front() == '/') return EntryPathStatus::Absolute;
    if (s.size() >= 2 && std::isalpha(static_cast<unsigned char>(s[0])) && s[1] == ':') {
        return EntryPathStatus::Absolute;
    }
    if (s.find(':') != std::string::npos) return EntryPathStatus::BadChar;

    std::vector<std::string_view> segs;
    std::string_view sv(s);
    while (!sv.empty()) {
        const size_t pos = sv.find('/');
        const std::string_view seg = sv.substr(0, pos);
        if (seg == "..") {
            if (segs.empty()) return EntryPathStatus::Escapes;
            segs.pop_back();
        } else if (!seg.empty() && seg != ".") {
            segs.push_back(seg);
        }
        if (pos == std::string_view::npos) break;
        sv.remove_prefix(pos + 1);
    }

    if (segs.empty()) return EntryPathStatus::Empty;

    for (size_t i = 0; i < segs.size(); ++i) {
        if (i) out_relative.push_back('/');
        out_relative.append(segs[i]);
    }
    return EntryPathStatus::Ok;
}

} // namespace admit
