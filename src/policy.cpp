#include "admit/policy.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <initializer_list>

namespace admit {

namespace {

constexpr std::uint64_t kMiB = 1024ULL * 1024ULL;

struct SignatureName {
    SignatureKind kind;
    const char* name;
};

constexpr std::array<SignatureName, 23> kSignatureNames = {{
    {SignatureKind::Unknown, "unknown"},
    {SignatureKind::Empty, "empty"},
    {SignatureKind::Text, "text"},
    {SignatureKind::Script, "script"},
    {SignatureKind::Php, "php"},
    {SignatureKind::Html, "html"},
    {SignatureKind::Xml, "xml"},
    {SignatureKind::Pdf, "pdf"},
    {SignatureKind::Zip, "zip"},
    {SignatureKind::Gzip, "gzip"},
    {SignatureKind::Bzip2, "bzip2"},
    {SignatureKind::Xz, "xz"},
    {SignatureKind::SevenZip, "7z"},
    {SignatureKind::Rar, "rar"},
    {SignatureKind::Tar, "tar"},
    {SignatureKind::Ole2, "ole2"},
    {SignatureKind::PeExecutable, "pe"},
    {SignatureKind::ElfExecutable, "elf"},
    {SignatureKind::MachOExecutable, "macho"},
    {SignatureKind::Jpeg, "jpeg"},
    {SignatureKind::Png, "png"},
    {SignatureKind::Gif, "gif"},
    {SignatureKind::Webp, "webp"},
}};

std::string Lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

using Sigs = std::initializer_list<SignatureKind>;
using Strs = std::initializer_list<const char*>;

ExtensionRule MakeRule(const char* ext, FileClass cls, Sigs sigs, const char* content_type,
                       Strs mimes, bool deep_scan, const char* family = "generic") {
    ExtensionRule r;
    r.extension = ext;
    r.file_class = cls;
    r.allowed = true;
    r.requires_deep_scan = deep_scan;
    r.archive_allowed = (cls == FileClass::Archive);
    r.signatures.assign(sigs.begin(), sigs.end());
    r.language_family = family;
    for (const char* m : mimes) r.mime_types.emplace_back(m);
    r.content_type = content_type;
    return r;
}

ExtensionRule TextRule(const char* ext, const char* content_type, Strs mimes = {"text/plain"}) {
    return MakeRule(ext, FileClass::Text, {SignatureKind::Text}, content_type, mimes, true);
}

ExtensionRule SourceRule(const char* ext, const char* family, const char* content_type, Strs mimes = {"text/plain"}) {
    return MakeRule(ext, FileClass::Source, {SignatureKind::Text, SignatureKind::Script}, content_type, mimes, true, family);
}

ExtensionRule DataRule(const char* ext, const char* content_type, Strs mimes, Sigs sigs = {SignatureKind::Text}) {
    return MakeRule(ext, FileClass::Data, sigs, content_type, mimes, true);
}

ExtensionRule ImageRule(const char* ext, SignatureKind sig, const char* content_type) {
    return MakeRule(ext, FileClass::Image, {sig}, content_type, {content_type}, false);
}

ExtensionRule DocumentRule(const char* ext, SignatureKind sig, const char* content_type) {
    return MakeRule(ext, FileClass::Document, {sig}, content_type, {content_type}, false);
}

ExtensionRule ArchiveRule(const char* ext, SignatureKind sig, const char* content_type, Strs mimes) {
    return MakeRule(ext, FileClass::Archive, {sig}, content_type, mimes, false);
}

void Add(ContextPolicy& ctx, ExtensionRule rule) {
    ctx.extensions[rule.extension] = std::move(rule);
}

void AddPlainText(ContextPolicy& ctx) {
    Add(ctx, TextRule(".txt", "text/plain"));
    Add(ctx, TextRule(".md", "text/markdown", {"text/plain", "text/markdown"}));
    Add(ctx, TextRule(".rst", "text/plain"));
    Add(ctx, TextRule(".readme", "text/plain"));
    Add(ctx, TextRule(".license", "text/plain"));
    Add(ctx, TextRule(".changelog", "text/plain"));
}

void AddSource(ContextPolicy& ctx) {
    Add(ctx, SourceRule(".py", "python", "text/x-python", {"text/plain", "text/x-python", "application/x-python-code"}));
    Add(ctx, SourceRule(".go", "generic", "text/x-go"));
    Add(ctx, SourceRule(".rs", "generic", "text/x-rust"));
    Add(ctx, SourceRule(".js", "javascript", "text/javascript", {"text/plain", "application/javascript", "text/javascript"}));
    Add(ctx, SourceRule(".ts", "javascript", "text/x-typescript"));
    Add(ctx, SourceRule(".jsx", "javascript", "text/javascript"));
    Add(ctx, SourceRule(".tsx", "javascript", "text/x-typescript"));
    Add(ctx, SourceRule(".vue", "javascript", "text/plain"));
    Add(ctx, SourceRule(".java", "generic", "text/x-java-source", {"text/plain", "text/x-java-source"}));
    Add(ctx, SourceRule(".c", "generic", "text/x-csrc", {"text/plain", "text/x-csrc"}));
    Add(ctx, SourceRule(".h", "generic", "text/x-chdr", {"text/plain", "text/x-chdr"}));
    Add(ctx, SourceRule(".cpp", "generic", "text/x-c++src", {"text/plain", "text/x-c++src"}));
    Add(ctx, SourceRule(".hpp", "generic", "text/x-c++hdr"));
    Add(ctx, SourceRule(".cs", "generic", "text/x-csharp"));
    Add(ctx, SourceRule(".rb", "generic", "text/x-ruby"));
    Add(ctx, SourceRule(".php", "php", "text/x-php"));
    ctx.extensions[".php"].signatures.push_back(SignatureKind::Php);
    Add(ctx, SourceRule(".swift", "generic", "text/x-swift"));
    Add(ctx, SourceRule(".kt", "generic", "text/x-kotlin"));
    Add(ctx, SourceRule(".scala", "generic", "text/x-scala"));
    Add(ctx, SourceRule(".clj", "generic", "text/x-clojure"));
    Add(ctx, SourceRule(".hs", "generic", "text/x-haskell"));
    Add(ctx, SourceRule(".ml", "generic", "text/x-ocaml"));
    Add(ctx, SourceRule(".r", "generic", "text/x-r"));
    Add(ctx, SourceRule(".m", "generic", "text/x-objcsrc"));
    Add(ctx, SourceRule(".sql", "generic", "application/sql", {"text/plain", "application/sql"}));
    Add(ctx, SourceRule(".html", "javascript", "text/html", {"text/html"}));
    ctx.extensions[".html"].signatures = {SignatureKind::Html, SignatureKind::Text};
    Add(ctx, SourceRule(".css", "generic", "text/css", {"text/css", "text/plain"}));
    Add(ctx, SourceRule(".scss", "generic", "text/x-scss"));
    Add(ctx, SourceRule(".sass", "generic", "text/x-sass"));
    Add(ctx, SourceRule(".less", "generic", "text/x-less"));
    Add(ctx, SourceRule(".cmake", "generic", "text/plain"));
    Add(ctx, SourceRule(".gradle", "generic", "text/plain"));
    Add(ctx, SourceRule(".sbt", "generic", "text/plain"));
    Add(ctx, SourceRule(".makefile", "generic", "text/plain"));
}

void AddData(ContextPolicy& ctx) {
    Add(ctx, DataRule(".json", "application/json", {"application/json", "text/json", "text/plain"}));
    Add(ctx, DataRule(".ipynb", "application/x-ipynb+json", {"application/json", "text/plain"}));
    ctx.extensions[".ipynb"].language_family = "python";
    Add(ctx, DataRule(".xml", "application/xml", {"application/xml", "text/xml"}, {SignatureKind::Xml, SignatureKind::Text}));
    Add(ctx, DataRule(".svg", "image/svg+xml", {"image/svg+xml"}, {SignatureKind::Xml, SignatureKind::Text}));
    ctx.extensions[".svg"].language_family = "javascript";
    Add(ctx, DataRule(".yaml", "application/x-yaml", {"text/plain", "application/x-yaml"}));
    Add(ctx, DataRule(".yml", "application/x-yaml", {"text/plain", "application/x-yaml"}));
    Add(ctx, DataRule(".toml", "application/toml", {"text/plain", "application/toml"}));
    Add(ctx, DataRule(".ini", "text/plain", {"text/plain"}));
    Add(ctx, DataRule(".csv", "text/csv", {"text/csv", "text/plain"}));
    Add(ctx, DataRule(".tsv", "text/tab-separated-values", {"text/tab-separated-values", "text/plain"}));
    Add(ctx, DataRule(".env", "text/plain", {"text/plain"}));
    Add(ctx, DataRule(".gitignore", "text/plain", {"text/plain"}));
    Add(ctx, DataRule(".dockerignore", "text/plain", {"text/plain"}));
}

void AddDocuments(ContextPolicy& ctx) {
    Add(ctx, DocumentRule(".pdf", SignatureKind::Pdf, "application/pdf"));
    Add(ctx, DocumentRule(".doc", SignatureKind::Ole2, "application/msword"));
    Add(ctx, DocumentRule(".docx", SignatureKind::Zip, "application/vnd.openxmlformats-officedocument.wordprocessingml.document"));
    Add(ctx, DocumentRule(".xlsx", SignatureKind::Zip, "application/vnd.openxmlformats-officedocument.spreadsheetml.sheet"));
    Add(ctx, DocumentRule(".ods", SignatureKind::Zip, "application/vnd.oasis.opendocument.spreadsheet"));
    Add(ctx, DocumentRule(".rtf", SignatureKind::Text, "application/rtf"));
}

void AddImages(ContextPolicy& ctx) {
    Add(ctx, ImageRule(".jpg", SignatureKind::Jpeg, "image/jpeg"));
    Add(ctx, ImageRule(".jpeg", SignatureKind::Jpeg, "image/jpeg"));
    Add(ctx, ImageRule(".png", SignatureKind::Png, "image/png"));
    Add(ctx, ImageRule(".gif", SignatureKind::Gif, "image/gif"));
    Add(ctx, ImageRule(".webp", SignatureKind::Webp, "image/webp"));
}

void AddArchives(ContextPolicy& ctx) {
    Add(ctx, ArchiveRule(".zip", SignatureKind::Zip, "application/zip", {"application/zip", "application/x-zip-compressed"}));
    Add(ctx, ArchiveRule(".tar", SignatureKind::Tar, "application/x-tar", {"application/x-tar"}));
    Add(ctx, ArchiveRule(".tar.gz", SignatureKind::Gzip, "application/gzip", {"application/gzip", "application/x-gzip"}));
    Add(ctx, ArchiveRule(".tgz", SignatureKind::Gzip, "application/gzip", {"application/gzip", "application/x-gzip"}));
    Add(ctx, ArchiveRule(".gz", SignatureKind::Gzip, "application/gzip", {"application/gzip", "application/x-gzip"}));
}

ContextPolicy AssignmentContext() {
    ContextPolicy ctx;
    ctx.tag = ContextTag::Assignment;
    ctx.max_size = 50 * kMiB;
    AddPlainText(ctx);
    AddSource(ctx);
    AddData(ctx);
    AddDocuments(ctx);
    AddImages(ctx);
    AddArchives(ctx);
    return ctx;
}

ContextPolicy CourseMaterialContext() {
    ContextPolicy ctx;
    ctx.tag = ContextTag::CourseMaterial;
    ctx.max_size = 100 * kMiB;
    AddPlainText(ctx);
    AddSource(ctx);
    AddData(ctx);
    AddDocuments(ctx);
    Add(ctx, DocumentRule(".pptx", SignatureKind::Zip, "application/vnd.openxmlformats-officedocument.presentationml.presentation"));
    Add(ctx, DocumentRule(".ppt", SignatureKind::Ole2, "application/vnd.ms-powerpoint"));
    Add(ctx, DocumentRule(".odt", SignatureKind::Zip, "application/vnd.oasis.opendocument.text"));
    Add(ctx, DocumentRule(".odp", SignatureKind::Zip, "application/vnd.oasis.opendocument.presentation"));
    AddImages(ctx);
    AddArchives(ctx);
    return ctx;
}

ContextPolicy ForumAttachmentContext() {
    ContextPolicy ctx;
    ctx.tag = ContextTag::ForumAttachment;
    ctx.max_size = 10 * kMiB;
    AddPlainText(ctx);
    AddSource(ctx);
    Add(ctx, DocumentRule(".pdf", SignatureKind::Pdf, "application/pdf"));
    AddImages(ctx);
    Add(ctx, ArchiveRule(".zip", SignatureKind::Zip, "application/zip", {"application/zip", "application/x-zip-compressed"}));
    ctx.archive.max_entries = 200;
    ctx.archive.max_total_uncompressed = 50 * kMiB;
    ctx.archive.max_member_uncompressed = 10 * kMiB;
    return ctx;
}

ContextPolicy AvatarContext() {
    ContextPolicy ctx;
    ctx.tag = ContextTag::Avatar;
    ctx.max_size = 5 * kMiB;
    AddImages(ctx);
    return ctx;
}

} // namespace

const char* ToString(FileClass c) {
    switch (c) {
        case FileClass::Text:     return "text";
        case FileClass::Source:   return "source";
        case FileClass::Document: return "document";
        case FileClass::Data:     return "data";
        case FileClass::Image:    return "image";
        case FileClass::Archive:  return "archive";
    }
    return "text";
}

std::optional<FileClass> ParseFileClass(std::string_view s) {
    if (s == "text") return FileClass::Text;
    if (s == "source") return FileClass::Source;
    if (s == "document") return FileClass::Document;
    if (s == "data") return FileClass::Data;
    if (s == "image") return FileClass::Image;
    if (s == "archive") return FileClass::Archive;
    return std::nullopt;
}

const char* ToString(SignatureKind k) {
    for (const auto& s : kSignatureNames) {
        if (s.kind == k) return s.name;
    }
    return "unknown";
}

std::optional<SignatureKind> ParseSignatureKind(std::string_view s) {
    for (const auto& n : kSignatureNames) {
        if (s == n.name) return n.kind;
    }
    return std::nullopt;
}

const ExtensionRule* ContextPolicy::FindRule(std::string_view extension) const {
    auto it = extensions.find(std::string(extension));
    return it == extensions.end() ? nullptr : &it->second;
}

std::uint64_t ContextPolicy::MaxSizeFor(const ExtensionRule& rule) const {
    if (rule.max_size == 0) return max_size;
    return std::min(rule.max_size, max_size);
}

bool PolicyTable::IsDenied(std::string_view extension) const {
    return std::find(denied_extensions.begin(), denied_extensions.end(), extension) != denied_extensions.end();
}

const ContextPolicy* PolicyTable::Context(ContextTag tag) const {
    auto it = contexts.find(tag);
    return it == contexts.end() ? nullptr : &it->second;
}

const std::vector<std::string>* PolicyTable::Patterns(std::string_view family) const {
    auto it = pattern_families.find(std::string(family));
    return it == pattern_families.end() ? nullptr : &it->second;
}

PolicyTable DefaultPolicyTable() {
    PolicyTable t;
    t.version = "builtin-1";

    t.denied_extensions = {
        // Windows executables
        ".exe", ".bat", ".cmd", ".com", ".scr", ".msi", ".dll", ".pif",
        ".application", ".gadget", ".msp", ".mst", ".cpl", ".lnk", ".hta",
        // Unix executables and shell scripts
        ".sh", ".bash", ".zsh", ".fish", ".csh", ".tcsh", ".ksh",
        ".bin", ".run", ".app", ".deb", ".rpm", ".pkg", ".dmg", ".so", ".dylib", ".elf",
        // PowerShell
        ".ps1", ".ps1xml", ".psm1", ".psd1", ".pssc", ".psrc",
        // Server-executed scripts
        ".asp", ".aspx", ".jsp", ".jspx", ".cfm", ".cgi", ".pl", ".phtml", ".php5", ".phar", ".shtml",
        // Macro-enabled documents
        ".docm", ".dotm", ".xlsm", ".xltm", ".xlam", ".pptm", ".potm", ".ppam", ".sldm",
        // Windows script host
        ".vbs", ".vbe", ".jse", ".wsf", ".wsh", ".ws", ".sct",
        // Java executables
        ".jar", ".war", ".ear", ".class",
    };

    t.pattern_families["generic"] = {
        "rm -rf", "chmod +x", "/bin/bash", "/bin/sh -i", "rundll32", "regsvr32", "powershell",
        "/dev/tcp/", "nc -e",
    };
    t.pattern_families["python"] = {
        "urllib.request.urlopen", "requests.get", "socket.connect", "subprocess.popen",
        "os.system", "exec(", "eval(", "os.remove", "os.rmdir", "shutil.rmtree", "os.chmod",
        "base64.b64decode", "zlib.decompress", "__import__", "marshal.loads", "pickle.loads",
        "ctypes.cdll",
    };
    t.pattern_families["javascript"] = {
        "eval(", "new function(", "child_process", "document.write(", "atob(",
        "string.fromcharcode", "unescape(", "settimeout(\"", "window.location=",
    };
    t.pattern_families["php"] = {
        "eval(", "assert(", "base64_decode(", "gzinflate(", "str_rot13(", "shell_exec(",
        "system(", "passthru(", "proc_open(", "popen(", "create_function(", "move_uploaded_file(",
    };
    t.pattern_families["shell"] = {
        "curl ", "wget ", "| sh", "| bash", "base64 -d", "mkfifo", "crontab", "/etc/passwd",
    };
    t.pattern_families["powershell"] = {
        "invoke-expression", "iex(", "downloadstring", "-encodedcommand", "frombase64string",
        "start-process", "net.webclient", "bypass",
    };

    t.contexts[ContextTag::Assignment] = AssignmentContext();
    t.contexts[ContextTag::CourseMaterial] = CourseMaterialContext();
    t.contexts[ContextTag::ForumAttachment] = ForumAttachmentContext();
    t.contexts[ContextTag::Avatar] = AvatarContext();
    return t;
}

PolicySnapshot DefaultPolicy() {
    static const PolicySnapshot kDefault = std::make_shared<const PolicyTable>(DefaultPolicyTable());
    return kDefault;
}

std::string ExtensionOf(std::string_view filename, const PolicyTable& table) {
    const std::string name = Lower(filename);

    auto known = [&](const std::string& ext) {
        if (table.IsDenied(ext)) return true;
        for (const auto& [tag, ctx] : table.contexts) {
            if (ctx.extensions.count(ext)) return true;
        }
        return false;
    };

    for (size_t pos = name.find('.'); pos != std::string::npos; pos = name.find('.', pos + 1)) {
        std::string candidate = name.substr(pos);
        if (known(candidate)) return candidate;
    }

    const size_t last = name.rfind('.');
    if (last == std::string::npos || last + 1 == name.size()) return {};
    return name.substr(last);
}

} // namespace admit
