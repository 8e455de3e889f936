// Copyright (c) 2026 changcheng967. All rights reserved.

#include <dashgrab/cli/commands.hpp>
#include <dashgrab/cli/progress_bar.hpp>
#include <dashgrab/core/error.hpp>
#include <dashgrab/core/http_session.hpp>
#include <dashgrab/media/media_downloader.hpp>
#include <dashgrab/media/merger.hpp>
#include <dashgrab/version.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <charconv>
#include <filesystem>
#include <iostream>

using namespace dashgrab::core;

namespace dashgrab::cli {

namespace {

constexpr std::string_view IFRAME_SUFFIX = "/iframe";
constexpr std::string_view MANIFEST_SUFFIX = "/manifest/video.mpd";

// Fetch the value of an option that takes one
bool take_value(int argc, char* argv[], int& i, std::string_view option, std::string& out, CliArgs& args) {
    if (i + 1 >= argc) {
        args.error = std::string("option ") + std::string(option) + " requires a value";
        return false;
    }
    out = argv[++i];
    return true;
}

bool is_cancelled(std::error_code ec) noexcept {
    return ec == make_error_code(DownloadErrc::cancelled);
}

} // namespace

//=============================================================================
// Argument parsing
//=============================================================================

CliArgs parse_args(int argc, char* argv[]) noexcept {
    CliArgs args;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];
        std::string value;

        if (arg == "-h" || arg == "--help") {
            args.help = true;
            return args;
        }
        if (arg == "-v" || arg == "--version") {
            args.version = true;
            return args;
        }

        if (arg == "-V" || arg == "--verbose") {
            args.verbose = true;
        } else if (arg == "-q" || arg == "--quiet") {
            args.quiet = true;
        } else if (arg == "--check-dependencies") {
            args.check_dependencies = true;
        } else if (arg == "-u" || arg == "--url") {
            if (!take_value(argc, argv, i, arg, value, args)) return args;
            args.url = value;
        } else if (arg == "-d" || arg == "--output-dir") {
            if (!take_value(argc, argv, i, arg, value, args)) return args;
            args.output_dir = value;
        } else if (arg == "-o" || arg == "--filename") {
            if (!take_value(argc, argv, i, arg, value, args)) return args;
            args.filename = value;
        } else if (arg == "-r" || arg == "--resolution") {
            if (!take_value(argc, argv, i, arg, value, args)) return args;
            args.resolution = value;
        } else if (arg == "-c" || arg == "--config") {
            if (!take_value(argc, argv, i, arg, value, args)) return args;
            args.config_path = value;
        } else if (arg == "-w" || arg == "--workers") {
            if (!take_value(argc, argv, i, arg, value, args)) return args;
            std::uint32_t workers = 0;
            auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), workers);
            if (ec != std::errc{} || ptr != value.data() + value.size() || workers == 0) {
                args.error = "invalid worker count: " + value;
                return args;
            }
            args.workers = workers;
        } else if (arg.starts_with('-')) {
            args.error = "unknown option: " + std::string(arg);
            return args;
        } else if (args.url.empty()) {
            // URL argument (no option)
            args.url = arg;
        } else {
            args.error = "unexpected argument: " + std::string(arg);
            return args;
        }
    }

    return args;
}

std::expected<AppConfig, std::error_code> resolve_config(const CliArgs& args) noexcept {
    AppConfig config;
    if (!args.config_path.empty()) {
        auto loaded = AppConfig::load(args.config_path);
        if (!loaded) {
            return std::unexpected(loaded.error());
        }
        config = std::move(*loaded);
    }

    if (args.output_dir) config.output_dir = *args.output_dir;
    if (args.resolution) config.resolution = *args.resolution;
    if (args.workers) config.workers = *args.workers;

    if (config.workers == 0 || config.workers > MAX_WORKERS) {
        return std::unexpected(make_error_code(DownloadErrc::config_invalid));
    }
    return config;
}

//=============================================================================
// Helpers
//=============================================================================

std::string extract_manifest_url(std::string_view url) {
    if (url.ends_with(IFRAME_SUFFIX)) {
        url.remove_suffix(IFRAME_SUFFIX.size());
        return std::string(url) + std::string(MANIFEST_SUFFIX);
    }
    if (url.ends_with(".mpd")) {
        return std::string(url);
    }
    return std::string(url) + std::string(MANIFEST_SUFFIX);
}

std::string sanitize_filename(std::string_view name) {
    std::string safe;
    safe.reserve(name.size());
    for (char c : name) {
        switch (c) {
            case '/': case '\\': case ':':
                safe += '-';
                break;
            case '*': case '?': case '"': case '<': case '>': case '|':
                break;
            default:
                safe += c;
        }
    }

    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    safe.erase(safe.begin(), std::find_if(safe.begin(), safe.end(), not_space));
    safe.erase(std::find_if(safe.rbegin(), safe.rend(), not_space).base(), safe.end());
    return safe;
}

std::uint32_t parse_resolution(std::string_view resolution) noexcept {
    std::string lower;
    lower.reserve(resolution.size());
    for (char c : resolution) {
        lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    if (lower.ends_with('p')) {
        lower.pop_back();
    }

    std::uint32_t height = 0;
    auto [ptr, ec] = std::from_chars(lower.data(), lower.data() + lower.size(), height);
    if (lower.empty() || ec != std::errc{} || ptr != lower.data() + lower.size()) {
        return DEFAULT_HEIGHT;
    }
    return height;
}

std::string output_filename(std::string_view filename, std::string_view title) {
    if (filename == DEFAULT_FILENAME && !title.empty()) {
        auto safe_title = sanitize_filename(title);
        if (!safe_title.empty()) {
            return safe_title + ".mp4";
        }
    }
    return std::string(filename);
}

void setup_logging(const CliArgs& args, const AppConfig& config) noexcept {
    if (args.verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else if (args.quiet) {
        spdlog::set_level(spdlog::level::warn);
    } else {
        spdlog::set_level(spdlog::level::from_str(config.log_level));
    }
}

bool check_dependencies(const AppConfig& config) noexcept {
    return media::find_executable(config.ffmpeg).has_value();
}

//=============================================================================
// Commands
//=============================================================================

CliResult download(const CliArgs& args, const AppConfig& config, std::stop_token stoken) noexcept {
    try {
        if (!check_dependencies(config)) {
            std::cout << "Error: " << config.ffmpeg << " not found in PATH" << std::endl;
            return std::unexpected(make_error_code(DownloadErrc::dependency_missing));
        }

        auto manifest_url = extract_manifest_url(args.url);

        HttpSession session(HttpOptions{config.connect_timeout_sec, config.stall_timeout_sec});
        media::MediaDownloader downloader(session,
                                          media::Merger(config.ffmpeg),
                                          DownloaderOptions{config.workers, config.temp_dir});

        if (auto ec = downloader.fetch_manifest(manifest_url, stoken)) {
            if (is_cancelled(ec)) {
                std::cout << "Download cancelled." << std::endl;
                return 0;
            }
            std::cout << "Error: " << downloader.error_detail() << std::endl;
            return std::unexpected(ec);
        }

        auto requested = args.filename.value_or(std::string(DEFAULT_FILENAME));
        auto filename = output_filename(requested, downloader.dash_manifest().title);
        if (filename != requested) {
            std::cout << "Using title from manifest: " << filename << std::endl;
        }

        std::error_code dir_ec;
        std::filesystem::create_directories(config.output_dir, dir_ec);
        if (dir_ec) {
            std::cout << "Error creating output directory: " << dir_ec.message() << std::endl;
            return std::unexpected(dir_ec);
        }
        auto output_path = (std::filesystem::path(config.output_dir) / filename).string();

        ProgressBar bar;
        if (!args.quiet) {
            downloader.callback([&bar](const media::MediaProgress& p) {
                if (bar.label() != p.stream) {
                    if (!bar.label().empty()) bar.finish();
                    bar.reset(p.stream, p.total_segments);
                }
                bar.update(p.segments_downloaded, p.downloaded_bytes);
            });
        }

        auto ec = downloader.download_dash(output_path, parse_resolution(config.resolution), stoken);
        if (!args.quiet && !bar.label().empty()) {
            if (ec) bar.clear(); else bar.finish();
        }

        if (ec) {
            if (is_cancelled(ec) || stoken.stop_requested()) {
                std::cout << "Download cancelled." << std::endl;
                return 0;
            }
            std::cout << "Error: " << downloader.error_detail() << std::endl;
            return std::unexpected(ec);
        }

        std::cout << "Successfully created " << output_path << std::endl;
        return 0;
    } catch (const std::exception& e) {
        spdlog::error("Download aborted: {}", e.what());
        return std::unexpected(make_error_code(DownloadErrc::network_error));
    }
}

int run(const CliArgs& args, std::string_view program_name, std::stop_token stoken) noexcept {
    if (args.help) {
        print_help(program_name);
        return 0;
    }
    if (args.version) {
        print_version();
        return 0;
    }
    if (!args.error.empty()) {
        std::cerr << "Error: " << args.error << std::endl;
        std::cout << "Use -h for help" << std::endl;
        return 1;
    }

    auto config = resolve_config(args);
    if (!config) {
        std::cerr << "Error: invalid configuration: " << config.error().message() << std::endl;
        return 1;
    }
    setup_logging(args, *config);

    if (args.check_dependencies) {
        if (!check_dependencies(*config)) {
            std::cout << "Dependency Check: FAIL\n" << config->ffmpeg << " not found in PATH" << std::endl;
            return 1;
        }
        std::cout << "Dependency Check: PASS\n" << config->ffmpeg << " is installed and available." << std::endl;
        return 0;
    }

    if (args.url.empty()) {
        std::cout << "Error: --url is required" << std::endl;
        std::cout << "Use -h for help" << std::endl;
        return 1;
    }

    auto result = download(args, *config, stoken);
    return result ? *result : 1;
}

void print_help(std::string_view program_name) noexcept {
    std::cout << "dashgrab " << dashgrab::version.to_string() << " - DASH stream downloader\n";
    std::cout << "\n";
    std::cout << "USAGE:\n";
    std::cout << "  " << program_name << " [OPTIONS] --url <URL>\n";
    std::cout << "\n";
    std::cout << "OPTIONS:\n";
    std::cout << "  -h, --help               Show this help message\n";
    std::cout << "  -v, --version            Show version information\n";
    std::cout << "  -V, --verbose            Enable debug logging\n";
    std::cout << "  -q, --quiet              Quiet mode (warnings only, no progress bar)\n";
    std::cout << "  -u, --url <URL>          iframe, stream or .mpd URL\n";
    std::cout << "  -d, --output-dir <DIR>   Output directory (default: " << DEFAULT_OUTPUT_DIR << ")\n";
    std::cout << "  -o, --filename <FILE>    Output filename (default: " << DEFAULT_FILENAME << ")\n";
    std::cout << "  -r, --resolution <RES>   Target video height (default: " << DEFAULT_RESOLUTION << ")\n";
    std::cout << "  -w, --workers <N>        Parallel segment fetches (default: " << DEFAULT_WORKERS << ")\n";
    std::cout << "  -c, --config <FILE>      JSON configuration file\n";
    std::cout << "      --check-dependencies Check that ffmpeg is installed\n";
    std::cout << "\n";
    std::cout << "EXAMPLES:\n";
    std::cout << "  " << program_name << " --url https://example.com/video/iframe\n";
    std::cout << "  " << program_name << " -r 720p -o talk.mp4 https://example.com/video/manifest/video.mpd\n";
    std::cout << "\n";
    std::cout << "Created by changcheng967\n";
}

void print_version() noexcept {
    std::cout << "dashgrab " << dashgrab::version.to_string()
              << " (built " << dashgrab::BUILD_DATE << ")" << std::endl;
    std::cout << "Created by changcheng967\n";
    std::cout << "\n";
    std::cout << "Built with C++23, libcurl, pugixml, spdlog\n";
}

} // namespace dashgrab::cli
