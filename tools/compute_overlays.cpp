/// Command-line tool for batch overlay computation
///
/// Usage:
///   compute_overlays <ohlcv_file> <config_file> <output_file> [options]
///
/// Options:
///   --sequential         Run sequentially instead of parallel
///   --threads <N>        Number of threads (default: auto-detect)
///   --quiet              Suppress progress output
///
/// Example:
///   compute_overlays btc_1h.txt overlays.txt overlays.csv
///   compute_overlays data.csv config.txt out.csv --threads 2

#include "TaskExecutor.hpp"
#include "IndicatorConfig.hpp"

#include <chrono>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <mutex>

using namespace tdcore;

namespace {

std::mutex progress_mutex;

void print_progress(int completed, int total, const std::string& current_name)
{
    std::lock_guard<std::mutex> lock(progress_mutex);

    int percent = (completed * 100) / total;
    int bar_width = 40;
    int filled = (completed * bar_width) / total;

    std::cout << "\r[";
    for (int i = 0; i < bar_width; ++i) {
        if (i < filled) {
            std::cout << "=";
        } else if (i == filled) {
            std::cout << ">";
        } else {
            std::cout << " ";
        }
    }
    std::cout << "] " << std::setw(3) << percent << "% ("
              << completed << "/" << total << ") "
              << current_name << "    ";
    std::cout.flush();
}

void print_usage(const char* program_name)
{
    std::cout << "Usage: " << program_name
              << " <ohlcv_file> <config_file> <output_file> [options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  --sequential      Run sequentially instead of parallel\n";
    std::cout << "  --threads <N>     Number of threads (default: auto-detect)\n";
    std::cout << "  --quiet           Suppress progress output\n";
    std::cout << "  --help            Show this help message\n\n";
    std::cout << "Config file format:\n";
    std::cout << "  VARIABLE_NAME: INDICATOR_TYPE param1 param2 ... --flag=value\n\n";
    std::cout << "Examples:\n";
    std::cout << "  HA: HEIKEN ASHI\n";
    std::cout << "  TD: TD SEQUENTIAL 4 2 --source=heiken_ashi\n";
    std::cout << "  TD_FULL: TD SEQUENTIAL 4 2 9 13 8 --tdst=true_range\n";
    std::cout << "  BB: BOLLINGER BANDS 20 1 2 3 --ma=ema\n";
}

} // anonymous namespace

int main(int argc, char** argv)
{
    if (argc < 4) {
        print_usage(argv[0]);
        return 1;
    }

    std::string ohlcv_file = argv[1];
    std::string config_file = argv[2];
    std::string output_file = argv[3];

    bool parallel = true;
    int num_threads = 0;
    bool quiet = false;

    for (int i = 4; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--sequential") {
            parallel = false;
        } else if (arg == "--threads" && i + 1 < argc) {
            num_threads = std::atoi(argv[++i]);
        } else if (arg == "--quiet" || arg == "-q") {
            quiet = true;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    auto start_time = std::chrono::high_resolution_clock::now();

    ProgressCallback progress_callback = nullptr;
    if (!quiet) {
        progress_callback = print_progress;
    }

    std::string error;
    bool success = BatchIndicatorComputer::compute_from_files(
        ohlcv_file,
        config_file,
        output_file,
        parallel,
        num_threads,
        progress_callback,
        &error
    );

    auto end_time = std::chrono::high_resolution_clock::now();
    auto duration = std::chrono::duration<double>(end_time - start_time).count();

    if (!quiet) {
        std::cout << "\n";
    }

    if (!success) {
        std::cerr << "\nFailed: " << error << "\n";
        return 1;
    }

    std::cout << "\nCompleted in " << std::fixed << std::setprecision(2) << duration << " seconds ("
              << (parallel ? "parallel" : "sequential") << ")\n";
    return 0;
}
