#include "parcp_cli.hpp"
#include "console_progress.hpp"
#include "theme.hpp"
#include <core/constants.hpp>
#include <core/errors.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/terminal.hpp>
#include <ssh/auth.hpp>
#include <ssh/destination.hpp>
#include <ssh/session.hpp>
#include <transfer/checksum.hpp>
#include <transfer/frame_codec.hpp>
#include <transfer/local_backend.hpp>
#include <transfer/remote_backend.hpp>
#include <transfer/scanner.hpp>
#include <fmt/format.h>
#include <unistd.h>
#include <filesystem>
#include <fstream>
#include <memory>

namespace fs = std::filesystem;

Result<CopyOptions> parse_copy_args(const std::vector<std::string>& args) {
    CopyOptions opts;
    std::vector<std::string> positional;

    for (size_t i = 0; i < args.size(); i++) {
        const std::string& arg = args[i];
        if (arg == "-j" || arg == "--jobs") {
            if (i + 1 >= args.size()) {
                return Result<CopyOptions>::Err(arg + " needs a value");
            }
            int jobs = safe_stoi(args[++i], 0);
            if (jobs < 1) {
                return Result<CopyOptions>::Err("invalid job count: " + args[i]);
            }
            opts.jobs = jobs;
        } else if (arg == "-c" || arg == "--config") {
            if (i + 1 >= args.size()) {
                return Result<CopyOptions>::Err(arg + " needs a value");
            }
            opts.config_path = args[++i];
        } else if (arg == "--no-compress") {
            opts.no_compress = true;
        } else if (arg == "-q" || arg == "--quiet") {
            opts.quiet = true;
        } else if (arg == "--") {
            positional.insert(positional.end(), args.begin() + static_cast<long>(i) + 1, args.end());
            break;
        } else if (arg.size() > 1 && arg[0] == '-') {
            return Result<CopyOptions>::Err("unknown option: " + arg);
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.size() < 2) {
        return Result<CopyOptions>::Err("need at least one source and a destination");
    }

    opts.destination = positional.back();
    positional.pop_back();
    opts.sources = std::move(positional);
    return Result<CopyOptions>::Ok(opts);
}

ParcpCLI::ParcpCLI(std::ostream& out) : out_(out) {
}

void ParcpCLI::print_version() const {
    out_ << theme::color::BROWN << theme::color::BOLD << "parcp"
         << theme::color::RESET << theme::color::DIM
         << " version " << PARCP_VERSION << theme::color::RESET << "\n";
}

void ParcpCLI::print_usage() const {
    out_ << theme::banner(PARCP_VERSION);
    out_ << theme::section("Usage");
    out_ << theme::color::BLUE << "    parcp " << theme::color::RESET
         << theme::color::BROWN << "[options] <source>... <destination>" << theme::color::RESET << "\n";
    out_ << theme::color::BLUE << "    parcp unpack " << theme::color::RESET
         << theme::color::BROWN << "<frame> <output>" << theme::color::RESET << "\n";
    out_ << theme::color::BLUE << "    parcp inspect " << theme::color::RESET
         << theme::color::BROWN << "<frame>" << theme::color::RESET << "\n";
    out_ << theme::section("Destination");
    out_ << theme::color::DIM
         << "    user@host:path        Upload over SSH (raw files)\n"
         << "    path                  Local directory (one frame per file)"
         << theme::color::RESET << "\n";
    out_ << theme::section("Options");
    out_ << theme::color::DIM
         << "    -j, --jobs N          Concurrent transfers (default "
         << DEFAULT_CONCURRENCY << ")\n"
         << "    --no-compress         Store frame payloads uncompressed\n"
         << "    -c, --config FILE     Config file (default ~/.parcp/config.yaml)\n"
         << "    -q, --quiet           Only print failures and the summary\n"
         << "    --version             Show version\n"
         << "    --help                Show this help"
         << theme::color::RESET << "\n\n";
}

Result<Config> ParcpCLI::load_config(const CopyOptions& options) const {
    auto config = options.config_path
        ? Config::load_file(expand_home(*options.config_path))
        : Config::load_global();
    if (config.is_err()) return config;

    if (options.jobs) config.value.set_concurrency(*options.jobs);
    if (options.no_compress) config.value.set_compress(false);
    return config;
}

std::optional<std::string> ParcpCLI::read_password(const std::string& prompt) {
    if (!platform::stdin_is_tty()) return std::nullopt;

    std::cout << prompt;
    std::cout.flush();

    std::string password;
    bool entered = false;
    {
        platform::NoEchoGuard guard;
        // Read character by character (no echo, no canonical)
        while (true) {
            if (!platform::poll_stdin(PASSWORD_PROMPT_TIMEOUT_MS)) break;
            char c;
            if (read(STDIN_FILENO, &c, 1) != 1) break;
            if (c == '\n' || c == '\r') { entered = true; break; }
            if (c == 3) break;  // Ctrl-C while signals are off
            if (c == 127 || c == 8) {  // backspace
                if (!password.empty()) password.pop_back();
                continue;
            }
            if (c >= 32) password += c;
        }
    }

    std::cout << "\n";
    if (!entered || password.empty()) return std::nullopt;
    return password;
}

int ParcpCLI::run_copy(const CopyOptions& options) {
    auto config = load_config(options);
    if (config.is_err()) {
        out_ << theme::fail(config.error);
        return EXIT_NOT_STARTED;
    }
    const Config& cfg = config.value;
    if (!cfg.log().file.empty()) {
        set_log_path(expand_home(cfg.log().file).string());
    }

    auto dest = parse_destination(options.destination);
    if (dest.is_err()) {
        out_ << theme::fail(dest.error);
        return EXIT_NOT_STARTED;
    }

    parcp_log(fmt::format("parcp {}: {} source(s) -> {}", PARCP_VERSION,
                          options.sources.size(), options.destination));

    // Connect before scanning so a bad host or password costs nothing
    std::shared_ptr<RemoteSession> session;
    std::unique_ptr<TransferBackend> backend;
    std::string destination_root;
    if (dest.value.remote) {
        const RemoteTarget& target = dest.value.target;
        if (!options.quiet) out_ << theme::step("Connecting to " + target.user + "@" + target.host);
        try {
            auto chain = default_auth_chain(cfg, &ParcpCLI::read_password);
            session = connect_session(target, cfg.ssh().port, chain,
                                      [](const std::string& msg) { parcp_log("ssh: " + msg); });
        } catch (const ConnectError& e) {
            out_ << theme::fail(std::string("Connection failed: ") + e.what());
            return EXIT_NOT_STARTED;
        } catch (const AuthError& e) {
            out_ << theme::fail(std::string("Authentication failed: ") + e.what());
            return EXIT_NOT_STARTED;
        }
        if (!options.quiet) out_ << theme::ok("Authenticated (" + session->auth_method() + ")");
        backend = std::make_unique<RemoteShellBackend>(session);
        destination_root = target.path;
    } else {
        EncodeOptions encode;
        encode.chunk_size = static_cast<size_t>(cfg.transfer().chunk_size);
        encode.compression_level = cfg.transfer().compression_level;
        backend = std::make_unique<LocalBackend>(encode, cfg.transfer().compress);
        destination_root = dest.value.local_path;
    }

    std::vector<fs::path> roots;
    for (const auto& src : options.sources) roots.emplace_back(src);

    FingerprintScanner scanner([this](const std::string& msg) {
        out_ << theme::warn(msg);
    });
    Manifest manifest = scanner.scan(roots);
    if (!options.quiet) {
        out_ << theme::step(fmt::format("{} files, {}", manifest.entries.size(),
                                        format_bytes(manifest.total_bytes())));
    }

    ConsoleProgress progress(out_, options.quiet);
    Scheduler scheduler(cfg.transfer().concurrency);
    RunReport report = scheduler.run(manifest, *backend, destination_root, progress);

    print_summary(report, backend->name(),
                  dest.value.remote ? dest.value.target.display() : destination_root);

    if (session) session->close();
    return report.all_succeeded() ? EXIT_ALL_TRANSFERRED : EXIT_SOME_FAILED;
}

void ParcpCLI::print_summary(const RunReport& report, const std::string& backend,
                             const std::string& destination) const {
    out_ << theme::section("Summary");
    out_ << theme::kv("Target", destination + theme::dim(" (" + backend + ")"));
    out_ << theme::kv("Files", fmt::format("{} ok, {} failed", report.succeeded(), report.failed()));
    out_ << theme::kv("Written", format_bytes(report.bytes_written()));
    out_ << theme::kv("Elapsed", fmt::format("{:.2f}s", report.elapsed.count() / 1000.0));
    if (!report.warnings.empty()) {
        out_ << theme::kv("Skipped", std::to_string(report.warnings.size()));
    }

    if (report.failed() > 0) {
        out_ << theme::section("Failed");
        for (const auto& outcome : report.outcomes) {
            if (!outcome.success) out_ << theme::fail(outcome.path + ": " + outcome.error);
        }
    }
    out_ << "\n";
}

int ParcpCLI::run_unpack(const std::string& frame_path, const std::string& output_path) {
    std::ifstream frame(frame_path, std::ios::binary);
    if (!frame) {
        out_ << theme::fail("Cannot open " + frame_path);
        return EXIT_NOT_STARTED;
    }
    std::ofstream output(output_path, std::ios::binary | std::ios::trunc);
    if (!output) {
        out_ << theme::fail("Cannot create " + output_path);
        return EXIT_NOT_STARTED;
    }

    try {
        FrameHeader header = decode_frame(frame, output);
        output.close();
        if (!output) {
            throw std::runtime_error("write to " + output_path + " failed");
        }
        out_ << theme::ok(fmt::format("{} -> {} ({}, checksums verified)", header.path,
                                      output_path, format_bytes(header.size)));
        return EXIT_ALL_TRANSFERRED;
    } catch (const IntegrityError& e) {
        out_ << theme::fail(std::string("Integrity check failed: ") + e.what());
    } catch (const FrameError& e) {
        out_ << theme::fail(std::string("Malformed frame: ") + e.what());
    } catch (const std::runtime_error& e) {
        out_ << theme::fail(e.what());
    }

    output.close();
    std::error_code ec;
    fs::remove(output_path, ec);
    return EXIT_NOT_STARTED;
}

int ParcpCLI::run_inspect(const std::string& frame_path) {
    std::ifstream frame(frame_path, std::ios::binary);
    if (!frame) {
        out_ << theme::fail("Cannot open " + frame_path);
        return EXIT_NOT_STARTED;
    }

    try {
        FrameInfo info = inspect_frame(frame);
        out_ << theme::section(frame_path);
        out_ << theme::kv("Path", info.header.path);
        out_ << theme::kv("Size", fmt::format("{} ({})", info.header.size, format_bytes(info.header.size)));
        out_ << theme::kv("Modified", format_unix_time(info.header.mtime));
        out_ << theme::kv("Compressed", info.header.compressed ? "yes" : "no");
        out_ << theme::kv("Payload", fmt::format("{} bytes", info.payload_bytes));
        out_ << theme::kv("CRC32", fmt::format("{:08x}", info.footer.crc32));
        out_ << theme::kv("SHA-256", digest_to_hex(info.footer.sha256));
        out_ << "\n";
        return EXIT_ALL_TRANSFERRED;
    } catch (const FrameError& e) {
        out_ << theme::fail(std::string("Malformed frame: ") + e.what());
        return EXIT_NOT_STARTED;
    }
}
