#include "admit/policy_loader.hpp"

#include "admit/errors.hpp"
#include "admit/logger.hpp"

#include <cctype>
#include <cerrno>
#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>

namespace admit {

namespace {

using nlohmann::json;

std::vector<SignatureKind> ParseSignatures(const json& arr, const std::string& where) {
    std::vector<SignatureKind> out;
    for (const auto& s : arr) {
        auto k = ParseSignatureKind(s.get<std::string>());
        if (!k) throw PolicyError(where + ": unknown signature '" + s.get<std::string>() + "'");
        out.push_back(*k);
    }
    return out;
}

void ApplyArchive(const json& j, ArchiveLimits& a, const std::string& where) {
    a.max_entries = j.value("max_entries", a.max_entries);
    a.max_total_uncompressed = j.value("max_total_uncompressed", a.max_total_uncompressed);
    a.max_member_uncompressed = j.value("max_member_uncompressed", a.max_member_uncompressed);
    a.max_ratio = j.value("max_ratio", a.max_ratio);
    a.max_nesting_depth = j.value("max_nesting_depth", a.max_nesting_depth);
    a.read_buffer_bytes = j.value("read_buffer_bytes", a.read_buffer_bytes);
    a.time_budget_ms = j.value("time_budget_ms", a.time_budget_ms);

    if (a.max_ratio <= 0.0) throw PolicyError(where + ".archive.max_ratio must be positive");
    if (a.read_buffer_bytes < 512) throw PolicyError(where + ".archive.read_buffer_bytes must be >= 512");
    if (a.max_member_uncompressed > a.max_total_uncompressed) {
        throw PolicyError(where + ".archive.max_member_uncompressed exceeds max_total_uncompressed");
    }
}

void ApplyHeuristics(const json& j, HeuristicWeights& h, const std::string& where) {
    h.long_line_threshold = j.value("long_line_threshold", h.long_line_threshold);
    h.long_line = j.value("long_line", h.long_line);
    h.dangerous_pattern = j.value("dangerous_pattern", h.dangerous_pattern);
    h.non_printable_ratio = j.value("non_printable_ratio", h.non_printable_ratio);
    h.non_printable = j.value("non_printable", h.non_printable);
    h.entropy_window = j.value("entropy_window", h.entropy_window);
    h.entropy_bits_threshold = j.value("entropy_bits_threshold", h.entropy_bits_threshold);
    h.high_entropy_window_ratio = j.value("high_entropy_window_ratio", h.high_entropy_window_ratio);
    h.high_entropy = j.value("high_entropy", h.high_entropy);
    h.declared_mime_mismatch = j.value("declared_mime_mismatch", h.declared_mime_mismatch);
    h.archive_member_unlisted = j.value("archive_member_unlisted", h.archive_member_unlisted);
    h.double_extension = j.value("double_extension", h.double_extension);
    h.quarantine_threshold = j.value("quarantine_threshold", h.quarantine_threshold);

    if (h.quarantine_threshold <= 0.0) throw PolicyError(where + ".heuristics.quarantine_threshold must be positive");
    if (h.entropy_window < 64) throw PolicyError(where + ".heuristics.entropy_window must be >= 64");
}

// Lookups lowercase the filename, so table keys must already be lowercase.
void CheckExtension(const std::string& ext, const std::string& where) {
    if (ext.size() < 2 || ext.front() != '.') throw PolicyError(where + ": extension '" + ext + "' must start with '.'");
    for (char c : ext) {
        if (c >= 'A' && c <= 'Z') throw PolicyError(where + ": extension '" + ext + "' must be lowercase");
    }
}

void ApplyExtension(const std::string& ext, const json& j, ContextPolicy& ctx, const std::string& where) {
    CheckExtension(ext, where);

    auto it = ctx.extensions.find(ext);
    ExtensionRule rule;
    if (it != ctx.extensions.end()) {
        rule = it->second;
    } else {
        if (!j.contains("class")) throw PolicyError(where + ": new extension '" + ext + "' needs a class");
        rule.extension = ext;
        rule.language_family = "generic";
        rule.content_type = "application/octet-stream";
    }

    if (j.contains("class")) {
        auto cls = ParseFileClass(j["class"].get<std::string>());
        if (!cls) throw PolicyError(where + ": unknown class for '" + ext + "'");
        rule.file_class = *cls;
        rule.archive_allowed = (*cls == FileClass::Archive);
    }
    rule.allowed = j.value("allowed", rule.allowed);
    rule.max_size = j.value("max_size", rule.max_size);
    rule.requires_deep_scan = j.value("deep_scan", rule.requires_deep_scan);
    rule.archive_allowed = j.value("archive_allowed", rule.archive_allowed);
    rule.language_family = j.value("family", rule.language_family);
    rule.content_type = j.value("content_type", rule.content_type);
    if (j.contains("signatures")) rule.signatures = ParseSignatures(j["signatures"], where + "." + ext);
    if (j.contains("mime")) rule.mime_types = j["mime"].get<std::vector<std::string>>();

    ctx.extensions[ext] = std::move(rule);
}

void ApplyContext(const json& j, ContextPolicy& ctx, const std::string& where) {
    ctx.max_size = j.value("max_size", ctx.max_size);
    ctx.strict_filename_charset = j.value("strict_filename_charset", ctx.strict_filename_charset);
    if (j.contains("review_deadline_hours")) {
        const auto hours = j["review_deadline_hours"].get<std::int64_t>();
        if (hours <= 0) throw PolicyError(where + ".review_deadline_hours must be positive");
        ctx.review_deadline = std::chrono::hours(hours);
    }
    if (j.contains("archive")) ApplyArchive(j["archive"], ctx.archive, where);
    if (j.contains("heuristics")) ApplyHeuristics(j["heuristics"], ctx.heuristics, where);
    if (j.contains("remove_extensions")) {
        for (const auto& e : j["remove_extensions"]) ctx.extensions.erase(e.get<std::string>());
    }
    if (j.contains("extensions")) {
        for (auto& [ext, rule] : j["extensions"].items()) {
            ApplyExtension(ext, rule, ctx, where + ".extensions");
        }
    }
}

PolicyTable BuildTable(const json& j) {
    if (!j.is_object()) throw PolicyError("policy document must be a JSON object");
    if (!j.contains("version") || !j["version"].is_string() || j["version"].get<std::string>().empty()) {
        throw PolicyError("policy document is missing 'version'");
    }

    PolicyTable t = DefaultPolicyTable();
    t.version = j["version"].get<std::string>();

    if (j.contains("denied_extensions")) {
        t.denied_extensions = j["denied_extensions"].get<std::vector<std::string>>();
        for (const auto& ext : t.denied_extensions) CheckExtension(ext, "denied_extensions");
    }

    if (j.contains("pattern_families")) {
        for (auto& [family, patterns] : j["pattern_families"].items()) {
            auto list = patterns.get<std::vector<std::string>>();
            for (auto& p : list) {
                if (p.empty()) throw PolicyError("pattern_families." + family + " contains an empty pattern");
                for (auto& c : p) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
            }
            t.pattern_families[family] = std::move(list);
        }
    }

    if (j.contains("contexts")) {
        for (auto& [name, body] : j["contexts"].items()) {
            auto tag = ParseContextTag(name);
            if (!tag) throw PolicyError("unknown context '" + name + "'");
            ApplyContext(body, t.contexts[*tag], "contexts." + name);
        }
    }

    for (const auto& [tag, ctx] : t.contexts) {
        for (const auto& [ext, rule] : ctx.extensions) {
            if (!t.Patterns(rule.language_family)) {
                throw PolicyError(std::string("contexts.") + ToString(tag) + ".extensions." + ext +
                                  ": unknown family '" + rule.language_family + "'");
            }
        }
    }
    return t;
}

} // namespace

Result ParsePolicyJson(const std::string& text, PolicySnapshot& out) {
    try {
        const json j = json::parse(text);
        auto table = std::make_shared<const PolicyTable>(BuildTable(j));
        LogInfo("policy loaded: version=%s contexts=%zu", table->version.c_str(), table->contexts.size());
        out = std::move(table);
        return Result::Ok();
    } catch (const PolicyError& e) {
        return Result::Fail(-1, std::string("invalid policy: ") + e.what(), ErrorKind::ConfigError);
    } catch (const json::exception& e) {
        return Result::Fail(-1, std::string("policy JSON error: ") + e.what(), ErrorKind::ConfigError);
    }
}

Result LoadPolicyFile(const std::string& path, PolicySnapshot& out) {
    std::ifstream file(path);
    if (!file.is_open()) return Result::Fail(ENOENT, "policy file not found: " + path, ErrorKind::ConfigError);

    std::stringstream ss;
    ss << file.rdbuf();
    return ParsePolicyJson(ss.str(), out);
}

} // namespace admit
