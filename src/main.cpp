/// @file main.cpp
/// @brief uvmask_cachectl - inspect and maintain a persistent UV island cache

#include <uvmask/cache/cache.hpp>
#include <uvmask/core/log.hpp>

#include <spdlog/spdlog.h>

#include <filesystem>
#include <iostream>
#include <string>

namespace fs = std::filesystem;

namespace {

void print_usage(const char* program_name) {
    std::cerr << "Usage: " << program_name << " [OPTIONS] COMMAND\n"
              << "\n"
              << "Commands:\n"
              << "  stats               Show cache statistics\n"
              << "  clear               Remove every cached entry\n"
              << "  cleanup [--force]   Purge expired and over-budget entries (--force clears all)\n"
              << "\n"
              << "Options:\n"
              << "  --dir PATH          Cache directory (default from config)\n"
              << "  --config FILE       JSON cache configuration\n"
              << "  --log-level LEVEL   trace, debug, info, warn, error, critical, off\n"
              << "  --help, -h          Show this help message\n"
              << "  --version, -v       Show version information\n"
              << "\n"
              << "Examples:\n"
              << "  " << program_name << " --dir Library/UVIslandCache stats\n"
              << "  " << program_name << " cleanup --force\n";
}

void print_version() {
    std::cout << "uvmask_cachectl 0.1.0\n"
              << "UV island cache maintenance tool\n";
}

} // anonymous namespace

// =============================================================================
// Main
// =============================================================================

int main(int argc, char** argv) {
    fs::path cache_dir;
    fs::path config_path;
    std::string log_level;
    std::string command;
    bool force = false;

    // Parse command line arguments
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--version" || arg == "-v") {
            print_version();
            return 0;
        } else if (arg == "--force") {
            force = true;
        } else if (arg == "--dir" || arg == "--config" || arg == "--log-level") {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << arg << "\n";
                print_usage(argv[0]);
                return 1;
            }
            std::string value = argv[++i];
            if (arg == "--dir") {
                cache_dir = value;
            } else if (arg == "--config") {
                config_path = value;
            } else {
                log_level = value;
            }
        } else if (!arg.empty() && arg[0] != '-' && command.empty()) {
            command = arg;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    if (command != "stats" && command != "clear" && command != "cleanup") {
        if (command.empty()) {
            std::cerr << "Error: No command specified.\n\n";
        } else {
            std::cerr << "Unknown command: " << command << "\n\n";
        }
        print_usage(argv[0]);
        return 1;
    }

    uvmask_cache::CacheConfig config;
    if (!config_path.empty()) {
        auto loaded = uvmask_cache::CacheConfig::load(config_path);
        if (!loaded) {
            std::cerr << "Failed to load config: " << uvmask_core::build_error_chain(loaded.error()) << "\n";
            return 1;
        }
        config = std::move(*loaded);
    }
    if (!cache_dir.empty()) {
        config.cache_directory = cache_dir;
    }
    if (!log_level.empty()) {
        config.log_level = log_level;
    }

    auto level = uvmask_core::parse_log_level(config.log_level);
    if (!level) {
        std::cerr << "Unknown log level: " << config.log_level << "\n";
        print_usage(argv[0]);
        return 1;
    }

    uvmask_core::LogConfig log_config;
    log_config.level = *level;
    uvmask_core::configure_logging(log_config);

    auto storage = uvmask_cache::FileStorage::open(config.cache_directory, config);
    if (!storage) {
        spdlog::error("Cannot open cache: {}", uvmask_core::build_error_chain(storage.error()));
        uvmask_core::shutdown_logging();
        return 1;
    }

    uvmask_cache::UVCache cache(std::move(*storage), config);

    if (command == "stats") {
        std::cout << uvmask_cache::format_statistics(cache.primary().get_statistics(),
                                                     "UV Island Cache (" + config.cache_directory.string() + ")");
    } else if (command == "clear") {
        auto removed = cache.cleanup(true);
        std::cout << "Cleared " << removed << " entries\n";
    } else {
        auto removed = cache.cleanup(force);
        std::cout << (force ? "Force cleanup" : "Cleanup") << " removed " << removed << " entries\n";
    }

    uvmask_core::shutdown_logging();
    return 0;
}
