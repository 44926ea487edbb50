#include <cstddef>
#include <exception>
#include <iostream>
#include <limits>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#ifdef _WIN32
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#include <shellapi.h>
#endif

#include "safeshred/pass_pattern.hpp"
#include "safeshred/shred_engine.hpp"
#include "safeshred/shred_logger.hpp"
#include "safeshred/shred_status.hpp"
#include "safeshred/shred_storage.hpp"

namespace {

constexpr int kDefaultPasses = 3;
constexpr const char* kDefaultLogFile = "safeshred.log";

struct CliOptions {
    bool help = false;
    bool log = false;
    bool verbose = false;
    std::optional<std::string> path;
    std::optional<std::string> patterns;
    std::string log_file = kDefaultLogFile;
    int passes = kDefaultPasses;
    std::size_t buffer_size = safeshred::kDefaultShredBufferSize;
    bool random_final = true;
    bool keep_name = false;
    bool truncate = true;
};

std::string UnquotePathArg(std::string value) {
    if (value.size() < 2) {
        return value;
    }
    const char first = value.front();
    const char last = value.back();
    if ((first == '"' && last == '"') || (first == '\'' && last == '\'')) {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

bool ParsePositive(const std::string& value, const unsigned long long max, unsigned long long& out) {
    std::size_t idx = 0;
    try {
        const unsigned long long parsed = std::stoull(value, &idx);
        if (idx != value.size() || parsed == 0 || parsed > max) {
            return false;
        }
        out = parsed;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

#ifdef _WIN32
bool WideToUtf8(const wchar_t* input, std::string& out) {
    out.clear();
    if (input == nullptr) {
        return false;
    }
    const int required = WideCharToMultiByte(CP_UTF8, 0, input, -1, nullptr, 0, nullptr, nullptr);
    if (required <= 0) {
        return false;
    }
    std::vector<char> converted(static_cast<std::size_t>(required), '\0');
    const int written = WideCharToMultiByte(CP_UTF8, 0, input, -1, converted.data(), required, nullptr, nullptr);
    if (written <= 0) {
        return false;
    }
    out.assign(converted.data(), static_cast<std::size_t>(written - 1));
    return true;
}

bool BuildUtf8ArgsFromCommandLine(std::vector<std::string>& out_args) {
    out_args.clear();
    int wide_argc = 0;
    LPWSTR* wide_argv = CommandLineToArgvW(GetCommandLineW(), &wide_argc);
    if (wide_argv == nullptr || wide_argc <= 0) {
        return false;
    }

    out_args.reserve(static_cast<std::size_t>(wide_argc));
    bool ok = true;
    for (int i = 0; i < wide_argc; ++i) {
        std::string converted;
        if (!WideToUtf8(wide_argv[i], converted)) {
            ok = false;
            break;
        }
        out_args.push_back(std::move(converted));
    }
    LocalFree(wide_argv);
    return ok;
}
#endif

bool ParseArgs(const int argc, char* argv[], CliOptions& opts, std::string& error) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg(argv[i]);
        auto require_value = [&](std::string& dst) -> bool {
            if (i + 1 >= argc) {
                error = "Missing value for " + arg;
                return false;
            }
            dst = argv[++i];
            return true;
        };

        if (arg == "--help" || arg == "-h") {
            opts.help = true;
        } else if (arg == "--log") {
            opts.log = true;
        } else if (arg == "--verbose") {
            opts.verbose = true;
        } else if (arg == "--keep-name") {
            opts.keep_name = true;
        } else if (arg == "--no-truncate") {
            opts.truncate = false;
        } else if (arg == "--no-random-final") {
            opts.random_final = false;
        } else if (arg == "--path") {
            std::string value;
            if (!require_value(value)) {
                return false;
            }
            opts.path = UnquotePathArg(std::move(value));
        } else if (arg == "--log-file") {
            std::string value;
            if (!require_value(value)) {
                return false;
            }
            opts.log_file = UnquotePathArg(std::move(value));
        } else if (arg == "--patterns") {
            std::string value;
            if (!require_value(value)) {
                return false;
            }
            opts.patterns = std::move(value);
        } else if (arg == "--passes") {
            std::string value;
            if (!require_value(value)) {
                return false;
            }
            unsigned long long parsed = 0;
            if (!ParsePositive(value, static_cast<unsigned long long>(std::numeric_limits<int>::max()), parsed)) {
                error = "Invalid value for --passes";
                return false;
            }
            opts.passes = static_cast<int>(parsed);
        } else if (arg == "--buffer-size") {
            std::string value;
            if (!require_value(value)) {
                return false;
            }
            unsigned long long parsed = 0;
            if (!ParsePositive(value, 1ULL << 30U, parsed)) {
                error = "Invalid value for --buffer-size";
                return false;
            }
            opts.buffer_size = static_cast<std::size_t>(parsed);
        } else {
            error = "Unknown argument: " + arg;
            return false;
        }
    }

    if (opts.help) {
        return true;
    }
    if (!opts.path.has_value()) {
        error = "Missing required argument --path";
        return false;
    }
    if (opts.log_file.empty()) {
        error = "Invalid value for --log-file";
        return false;
    }
    return true;
}

void PrintHelp(std::ostream& out) {
    out << "SafeShred - overwrite a file several times, then delete it\n\n";
    out << "Usage:\n";
    out << "  safeshred --path <file> [--passes N] [options]\n\n";
    out << "Options:\n";
    out << "  --path <file>          Regular file to shred (symbolic links are followed; the link stays)\n";
    out << "  --passes <N>           Overwrite passes (default " << kDefaultPasses << ")\n";
    out << "  --patterns <list>      Pass patterns: zero, ones, random or 0xNN, comma separated\n";
    out << "                         (default zero,ones)\n";
    out << "  --no-random-final      Do not force the last pass to random data\n";
    out << "  --buffer-size <bytes>  Write chunk size (default " << safeshred::kDefaultShredBufferSize << ")\n";
    out << "  --keep-name            Unlink under the original name, skip random renames\n";
    out << "  --no-truncate          Do not truncate to zero length before unlinking\n";
    out << "  --log-file <file>      Log destination (default " << kDefaultLogFile << ")\n";
    out << "  --log                  Echo log records and progress to stderr\n";
    out << "  --verbose              Log each pass\n";
    out << "  --help, -h             Show this help\n\n";
    out << "Warning:\n";
    out << "  - This is best effort. Journaling filesystems, wear leveling SSDs, snapshots, and backups\n";
    out << "    can retain data outside direct file overwrite control.\n";
}

int ShredFlow(const CliOptions& opts) {
    safeshred::ShredOptions shred_options;
    shred_options.buffer_size = opts.buffer_size;
    shred_options.truncate_after = opts.truncate;
    shred_options.obfuscate_name = !opts.keep_name;
    if (opts.patterns.has_value()) {
        const safeshred::ShredStatus status = safeshred::ParsePatternPolicy(*opts.patterns, shred_options.patterns);
        if (status != safeshred::ShredStatus::Ok) {
            std::cerr << "Invalid value for --patterns\n";
            return 1;
        }
    }
    shred_options.patterns.random_final = opts.random_final;

    safeshred::ShredLogger logger;
    if (!logger.Init(opts.log_file)) {
        std::cerr << "Cannot open log file: " << opts.log_file << "\n";
        return 1;
    }
    logger.SetMirrorToStderr(opts.log);
    if (opts.verbose) {
        logger.SetMinLevel(safeshred::LogLevel::Debug);
    }

    safeshred::FileSystemStorage storage;
    safeshred::ShredEngine engine(logger, storage, shred_options);

    int shown_percent = -1;
    safeshred::ProgressCallback progress;
    if (opts.log) {
        progress = [&](const int percent) {
            shown_percent = percent;
            std::cerr << "\r[log] Shredding: " << percent << "%" << std::flush;
            if (percent >= 100) {
                std::cerr << "\n";
            }
        };
    }

    const safeshred::ShredResult result = engine.Shred(safeshred::ShredRequest{*opts.path, opts.passes}, progress);
    if (opts.log && shown_percent >= 0 && shown_percent < 100) {
        std::cerr << "\n";
    }
    logger.Close();

    if (!result.Succeeded()) {
        std::cerr << safeshred::ToString(result.status);
        if (!result.detail.empty()) {
            std::cerr << ": " << result.detail;
        }
        std::cerr << "\n";
        return 1;
    }
    if (result.warning != safeshred::ShredStatus::Ok) {
        std::cerr << "Warning: " << safeshred::ToString(result.warning) << ": " << result.detail << "\n";
    }
    return 0;
}

int RunCliMain(const int argc, char* argv[]) {
    CliOptions opts;
    std::string error;
    if (!ParseArgs(argc, argv, opts, error)) {
        std::cerr << error << "\n";
        return 1;
    }
    if (opts.help) {
        PrintHelp(std::cout);
        return 0;
    }
    return ShredFlow(opts);
}

}  // namespace

#ifdef _WIN32
int main(const int argc, char* argv[]) {
    std::vector<std::string> utf8_args;
    if (BuildUtf8ArgsFromCommandLine(utf8_args)) {
        std::vector<char*> utf8_argv;
        utf8_argv.reserve(utf8_args.size());
        for (auto& arg : utf8_args) {
            utf8_argv.push_back(arg.data());
        }
        return RunCliMain(static_cast<int>(utf8_argv.size()), utf8_argv.data());
    }
    return RunCliMain(argc, argv);
}
#else
int main(const int argc, char* argv[]) {
    return RunCliMain(argc, argv);
}
#endif
