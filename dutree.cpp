// dutree.cpp - Disk usage tree reporter main program

#include "dutree_core.h"
#include "dutree_report.h"

#include <cstdio>
#include <unistd.h>

// Function declarations
int report_mode(const Config& config);
void print_usage(const char* program_name);
void print_version();

// Report mode implementation
int report_mode(const Config& config) {
    try {
        WorkStealingThreadPool pool(config.thread_count);
        SizeAggregator aggregator(pool, config);

        Entry root = aggregator.resolve_root(config.root_path);

        bool use_colors = !config.no_colors && isatty(fileno(stdout));
        print_report(root, config, std::cout, use_colors);

        if (config.show_stats) {
            aggregator.print_stats();
        }
    } catch (const ScanError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    } catch (const std::system_error& e) {
        // Worker threads could not be started
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}

void print_usage(const char* program_name) {
    std::cout << "dutree " << DUTREE_VERSION << " - Disk usage tree reporter\n";
    std::cout << "Usage: " << program_name << " [OPTIONS] [PATH]\n\n";
    std::cout << "Prints every entry below PATH with its size and share of its parent,\n";
    std::cout << "directories first, largest first.\n\n";
    std::cout << "Options:\n";
    std::cout << "  -h, --help              Show this help message\n";
    std::cout << "  -v, --version           Show version information\n";
    std::cout << "  -f, --format FMT        Size format: metric, binary, bytes, gb, gib, mb, mib\n";
    std::cout << "  -j, --threads N         Number of worker threads, at most 1024 (default: auto)\n";
    std::cout << "  -s, --stats             Print scan statistics to stderr\n";
    std::cout << "  --strict-root           Fail if PATH cannot be read instead of reporting 0\n";
    std::cout << "  --no-colors             Disable colored output\n";
    std::cout << "  --no-progress           Disable progress reporting\n\n";
    std::cout << "If no path is provided, the current directory is used.\n";
}

void print_version() {
    std::cout << "dutree " << DUTREE_VERSION << "\n";
    std::cout << "Build date: " << BUILD_DATE << "\n";
    std::cout << "Git hash: " << GIT_HASH << "\n";
}

int main(int argc, char* argv[]) {
    Config config;
    bool have_path = false;

    std::vector<std::string> args(argv + 1, argv + argc);

    auto fail = [&](const std::string& message) {
        std::cerr << message << "\n";
        std::cerr << "Try '" << argv[0] << " --help' for more information.\n";
        return 1;
    };

    for (size_t i = 0; i < args.size(); i++) {
        const std::string& arg = args[i];

        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "-v" || arg == "--version") {
            print_version();
            return 0;
        } else if (arg == "-s" || arg == "--stats") {
            config.show_stats = true;
        } else if (arg == "--strict-root") {
            config.strict_root = true;
        } else if (arg == "--no-colors") {
            config.no_colors = true;
        } else if (arg == "--no-progress") {
            config.show_progress = false;
        } else if (arg == "-f" || arg == "--format") {
            if (i + 1 >= args.size()) {
                return fail("Missing value for " + arg);
            }
            config.format = to_lower(args[++i]);
        } else if (arg == "-j" || arg == "--threads") {
            if (i + 1 >= args.size()) {
                return fail("Missing value for " + arg);
            }
            try {
                int threads = std::stoi(args[++i]);
                if (threads < 0 || static_cast<size_t>(threads) > MAX_THREAD_COUNT) {
                    return fail("Invalid thread count: " + args[i]);
                }
                config.thread_count = static_cast<size_t>(threads);
            } catch (const std::logic_error&) {
                return fail("Invalid thread count: " + args[i]);
            }
        } else if (!arg.empty() && arg[0] != '-') {
            if (have_path) {
                return fail("Only one path can be scanned: " + arg);
            }
            config.root_path = arg;
            have_path = true;
        } else {
            return fail("Unknown option: " + arg);
        }
    }

    return report_mode(config);
}
