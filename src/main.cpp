#include "admit/admission_pipeline.hpp"
#include "admit/file_reader.hpp"
#include "admit/file_writer.hpp"
#include "admit/image_scrubber.hpp"
#include "admit/logger.hpp"
#include "admit/policy_loader.hpp"

#include <nlohmann/json.hpp>

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <getopt.h>
#include <memory>
#include <string>
#include <unistd.h>

using json = nlohmann::json;

namespace {

void PrintUsage(const char* argv) {
    std::fprintf(stderr,
        "Usage:\n"
        "  %s [--root <dir>] [--policy <file>] [--verbose] <command>\n"
        "\n"
        "Commands:\n"
        "      --submit <file|->     Run one upload through admission\n"
        "          --name <filename>     Declared filename (default: basename of file)\n"
        "          --context <tag>       assignment|course_material|forum_attachment|avatar\n"
        "          --mime <type>         Declared MIME type\n"
        "          --uploader <id>       Uploader identity (default: cli)\n"
        "      --retrieve <pointer>  Read a stored object (-o writes it to a file)\n"
        "      --list-pending        List records awaiting review (--context filters)\n"
        "      --decide <id>         Decide a record: --decision approve|reject|escalate --expect <state>\n"
        "      --extend <id>         Extend a record's review deadline: --expect <state>\n"
        "      --sweep               Reject and purge records past their deadline\n"
        "      --scrub <image>       Strip image metadata (-o output, --dry-run reports only)\n"
        "\n"
        "Options:\n"
        "  -r, --root <dir>          Data directory (default ./admit-data)\n"
        "  -p, --policy <file>       Policy JSON (default: built-in)\n"
        "  -a, --actor <name>        Reviewer identity for --decide/--extend (default: cli)\n"
        "  -o, --output <file>       Output file for --retrieve/--scrub\n"
        "  -v, --verbose             Debug logging\n"
        "  -h, --help                Show this help\n",
        argv);
}

enum class Command { None, Submit, Retrieve, ListPending, Decide, Extend, Sweep, Scrub };

struct CliArgs {
    Command cmd = Command::None;
    std::string target;
    std::string root = "./admit-data";
    std::string policy;
    std::string name;
    std::string context;
    std::string mime;
    std::string uploader = "cli";
    std::string actor = "cli";
    std::string decision;
    std::string expect;
    std::string output;
    bool dry_run = false;
};

void PrintJson(const json& j) {
    std::printf("%s\n", j.dump(2, ' ', false, json::error_handler_t::replace).c_str());
}

int Fail(const admit::Result& r) {
    PrintJson(json{{"ok", false}, {"error", admit::ToString(r.kind)}, {"message", r.msg}});
    if (r.kind == admit::ErrorKind::ConcurrencyConflict) return 3;
    if (r.kind == admit::ErrorKind::NotFound) return 4;
    return 1;
}

json VerdictJson(const admit::ValidationVerdict& v) {
    json reasons = json::array();
    for (auto code : v.Reasons()) reasons.push_back(admit::ToString(code));
    return json{
        {"kind", admit::ToString(v.Kind())},
        {"reasons", reasons},
        {"messages", v.Messages()},
        {"risk_score", v.RiskScore()},
        {"policy_version", v.PolicyVersion()},
        {"error", admit::ToString(v.Error())},
        {"timestamp", admit::FormatTimestamp(v.Timestamp())},
    };
}

json ScrubJson(const admit::ScrubReport& s) {
    json j = {
        {"format", admit::ToString(s.format)},
        {"removed", s.removed},
        {"had_location", s.had_location},
        {"bytes_in", s.bytes_in},
        {"bytes_out", s.bytes_out},
    };
    j["orientation"] = s.orientation ? json(*s.orientation) : json(nullptr);
    if (!s.error.empty()) j["error"] = s.error;
    return j;
}

json RecordJson(const admit::QuarantineRecord& r) {
    json reasons = json::array();
    for (auto code : r.reasons) reasons.push_back(admit::ToString(code));
    json j = {
        {"id", r.id},
        {"state", admit::ToString(r.state)},
        {"context", admit::ToString(r.context)},
        {"filename", r.filename},
        {"uploader", r.uploader},
        {"size", r.size},
        {"risk_score", r.risk_score},
        {"reasons", reasons},
        {"policy_version", r.policy_version},
        {"created", admit::FormatTimestamp(r.created)},
        {"deadline", admit::FormatTimestamp(r.deadline)},
    };
    j["pointer"] = r.pointer ? json(*r.pointer) : json(nullptr);
    return j;
}

std::string Basename(const std::string& path) {
    const auto slash = path.find_last_of('/');
    return slash == std::string::npos ? path : path.substr(slash + 1);
}

bool ReadFile(const std::string& path, std::vector<std::uint8_t>& out, admit::Result& err) {
    admit::FileOrStdinReader reader;
    err = admit::FileOrStdinReader::Open(path, reader);
    if (!err.is_ok()) return false;
    err = admit::ReadAllBounded(reader, 1ULL << 32, out);
    return err.is_ok();
}

int RunSubmit(admit::AdmissionPipeline& pipeline, const CliArgs& args) {
    auto ctx = admit::ParseContextTag(args.context.empty() ? "assignment" : args.context);
    if (!ctx) {
        std::fprintf(stderr, "Invalid --context: %s\n", args.context.c_str());
        return 2;
    }

    auto reader = std::make_unique<admit::FileOrStdinReader>();
    if (auto r = admit::FileOrStdinReader::Open(args.target, *reader); !r.is_ok()) return Fail(r);

    const std::string name = !args.name.empty() ? args.name : Basename(args.target);
    admit::UploadArtifact artifact(std::move(reader), name, args.mime, *ctx, args.uploader);
    const admit::AdmissionOutcome out = pipeline.Admit(artifact);

    json j = {{"ok", true}, {"verdict", VerdictJson(out.verdict)}};
    j["pointer"] = out.pointer ? json(out.pointer->str()) : json(nullptr);
    j["quarantine_id"] = out.quarantine_id ? json(*out.quarantine_id) : json(nullptr);
    if (out.scrub) j["scrub"] = ScrubJson(*out.scrub);
    PrintJson(j);

    return out.verdict.Kind() == admit::VerdictKind::Rejected ? 5 : 0;
}

int RunRetrieve(admit::AdmissionPipeline& pipeline, const CliArgs& args) {
    admit::RetrievedObject obj;
    if (auto r = pipeline.Retrieve(args.target, obj); !r.is_ok()) return Fail(r);

    if (args.output.empty()) {
        // Raw bytes to stdout, nothing else.
        size_t off = 0;
        while (off < obj.bytes.size()) {
            const ssize_t n = ::write(STDOUT_FILENO, obj.bytes.data() + off, obj.bytes.size() - off);
            if (n < 0) {
                if (errno == EINTR) continue;
                std::fprintf(stderr, "ERROR: write stdout: %s\n", std::strerror(errno));
                return 1;
            }
            off += static_cast<size_t>(n);
        }
        return 0;
    }

    if (auto r = admit::WriteFileAtomic(args.output, obj.bytes); !r.is_ok()) return Fail(r);
    PrintJson(json{{"ok", true}, {"pointer", args.target}, {"content_type", obj.content_type},
                   {"size", obj.bytes.size()}, {"output", args.output}});
    return 0;
}

int RunListPending(admit::AdmissionPipeline& pipeline, const CliArgs& args) {
    std::optional<admit::ContextTag> filter;
    if (!args.context.empty()) {
        filter = admit::ParseContextTag(args.context);
        if (!filter) {
            std::fprintf(stderr, "Invalid --context: %s\n", args.context.c_str());
            return 2;
        }
    }
    json arr = json::array();
    for (const auto& rec : pipeline.Quarantine().ListPending(filter)) arr.push_back(RecordJson(rec));
    PrintJson(json{{"ok", true}, {"pending", arr}});
    return 0;
}

int RunDecide(admit::AdmissionPipeline& pipeline, const CliArgs& args) {
    const auto decision = admit::ParseDecision(args.decision);
    const auto expect = admit::ParseReviewState(args.expect);
    if (!decision || !expect) {
        std::fprintf(stderr, "--decide needs --decision approve|reject|escalate and --expect <state>\n");
        return 2;
    }

    auto r = pipeline.Quarantine().Decide(args.target, args.actor, *decision, *expect);
    if (!r.is_ok()) return Fail(r);

    admit::QuarantineRecord rec;
    if (r = pipeline.Quarantine().Get(args.target, rec); !r.is_ok()) return Fail(r);
    PrintJson(json{{"ok", true}, {"record", RecordJson(rec)}});
    return 0;
}

int RunExtend(admit::AdmissionPipeline& pipeline, const CliArgs& args) {
    const auto expect = admit::ParseReviewState(args.expect);
    if (!expect) {
        std::fprintf(stderr, "--extend needs --expect <state>\n");
        return 2;
    }

    auto r = pipeline.ExtendDeadline(args.target, args.actor, *expect);
    if (!r.is_ok()) return Fail(r);

    admit::QuarantineRecord rec;
    if (r = pipeline.Quarantine().Get(args.target, rec); !r.is_ok()) return Fail(r);
    PrintJson(json{{"ok", true}, {"record", RecordJson(rec)}});
    return 0;
}

int RunSweep(admit::AdmissionPipeline& pipeline) {
    const size_t n = pipeline.Quarantine().ExpireOverdue(admit::SystemClock::now());
    PrintJson(json{{"ok", true}, {"expired", n}});
    return 0;
}

// Scrubs one image outside the pipeline, e.g. to clean files already on disk.
int RunScrub(const CliArgs& args) {
    std::vector<std::uint8_t> in;
    admit::Result err;
    if (!ReadFile(args.target, in, err)) return Fail(err);

    std::vector<std::uint8_t> out;
    admit::ScrubReport report;
    const admit::ScrubStatus st = admit::ImageScrubber().Scrub(in, out, report);
    if (st != admit::ScrubStatus::Ok) {
        const char* what = st == admit::ScrubStatus::Unsupported ? "unsupported image format" : "malformed image";
        PrintJson(json{{"ok", false}, {"error", admit::ToString(admit::ErrorKind::StructuralViolation)},
                       {"message", std::string(what) + (report.error.empty() ? "" : ": " + report.error)}});
        return 5;
    }

    json j = {{"ok", true}, {"dry_run", args.dry_run}, {"report", ScrubJson(report)}};
    if (!args.dry_run) {
        if (args.output.empty()) {
            std::fprintf(stderr, "--scrub needs --output unless --dry-run is given\n");
            return 2;
        }
        if (auto r = admit::WriteFileAtomic(args.output, out); !r.is_ok()) return Fail(r);
        j["output"] = args.output;
    }
    PrintJson(j);
    return 0;
}

bool SetCommand(CliArgs& args, Command cmd, const char* target) {
    if (args.cmd != Command::None) return false;
    args.cmd = cmd;
    if (target) args.target = target;
    return true;
}

} // namespace

int main(int argc, char** argv) {
    CliArgs args;

    enum {
        kSubmit = 1000, kRetrieve, kListPending, kDecide, kExtend, kSweep, kScrub,
        kName, kContext, kMime, kUploader, kDecision, kExpect, kDryRun,
    };

    static option long_opts[] = {
        {"submit", required_argument, nullptr, kSubmit},
        {"retrieve", required_argument, nullptr, kRetrieve},
        {"list-pending", no_argument, nullptr, kListPending},
        {"decide", required_argument, nullptr, kDecide},
        {"extend", required_argument, nullptr, kExtend},
        {"sweep", no_argument, nullptr, kSweep},
        {"scrub", required_argument, nullptr, kScrub},
        {"name", required_argument, nullptr, kName},
        {"context", required_argument, nullptr, kContext},
        {"mime", required_argument, nullptr, kMime},
        {"uploader", required_argument, nullptr, kUploader},
        {"decision", required_argument, nullptr, kDecision},
        {"expect", required_argument, nullptr, kExpect},
        {"dry-run", no_argument, nullptr, kDryRun},
        {"root", required_argument, nullptr, 'r'},
        {"policy", required_argument, nullptr, 'p'},
        {"actor", required_argument, nullptr, 'a'},
        {"output", required_argument, nullptr, 'o'},
        {"verbose", no_argument, nullptr, 'v'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0},
    };

    int idx = 0;
    int c;
    bool dup = false;
    while ((c = getopt_long(argc, argv, "hvr:p:a:o:", long_opts, &idx)) != -1) {
        switch (c) {
            case 'h':
                PrintUsage(argv[0]);
                return 0;
            case 'v':
                admit::SetLogLevel(admit::LogLevel::Debug);
                break;
            case 'r':
                args.root = optarg;
                break;
            case 'p':
                args.policy = optarg;
                break;
            case 'a':
                args.actor = optarg;
                break;
            case 'o':
                args.output = optarg;
                break;
            case kSubmit:
                dup |= !SetCommand(args, Command::Submit, optarg);
                break;
            case kRetrieve:
                dup |= !SetCommand(args, Command::Retrieve, optarg);
                break;
            case kListPending:
                dup |= !SetCommand(args, Command::ListPending, nullptr);
                break;
            case kDecide:
                dup |= !SetCommand(args, Command::Decide, optarg);
                break;
            case kExtend:
                dup |= !SetCommand(args, Command::Extend, optarg);
                break;
            case kSweep:
                dup |= !SetCommand(args, Command::Sweep, nullptr);
                break;
            case kScrub:
                dup |= !SetCommand(args, Command::Scrub, optarg);
                break;
            case kName:
                args.name = optarg;
                break;
            case kContext:
                args.context = optarg;
                break;
            case kMime:
                args.mime = optarg;
                break;
            case kUploader:
                args.uploader = optarg;
                break;
            case kDecision:
                args.decision = optarg;
                break;
            case kExpect:
                args.expect = optarg;
                break;
            case kDryRun:
                args.dry_run = true;
                break;
            default:
                PrintUsage(argv[0]);
                return 2;
        }
    }

    if (args.cmd == Command::None || dup || optind != argc) {
        PrintUsage(argv[0]);
        return 2;
    }

    if (args.cmd == Command::Scrub) return RunScrub(args);

    admit::PolicySnapshot policy = admit::DefaultPolicy();
    if (!args.policy.empty()) {
        if (auto r = admit::LoadPolicyFile(args.policy, policy); !r.is_ok()) return Fail(r);
    }

    admit::AdmissionPipeline pipeline({args.root, {}}, policy);
    if (auto r = pipeline.Init(); !r.is_ok()) return Fail(r);

    switch (args.cmd) {
        case Command::Submit:
            return RunSubmit(pipeline, args);
        case Command::Retrieve:
            return RunRetrieve(pipeline, args);
        case Command::ListPending:
            return RunListPending(pipeline, args);
        case Command::Decide:
            return RunDecide(pipeline, args);
        case Command::Extend:
            return RunExtend(pipeline, args);
        case Command::Sweep:
            return RunSweep(pipeline);
        default:
            break;
    }
    PrintUsage(argv[0]);
    return 2;
}
