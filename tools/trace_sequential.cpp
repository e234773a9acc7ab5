#include "HeikenAshi.hpp"
#include "SequentialEngine.hpp"
#include "validation/DataParsers.hpp"

#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <stdexcept>

using namespace tdcore;
using namespace tdcore::validation;

namespace {

void print_usage(const char* program_name)
{
    std::cerr << "Usage: " << program_name << " <ohlcv_file> [first_bar] [last_bar] [options]\n\n"
              << "Options:\n"
              << "  --heiken-ashi        Run on Heiken-Ashi candles\n"
              << "  --tdst=true_range    Measure TDST from true high/low\n"
              << "  --lookback=<N>       Setup lookback (default 4)\n";
}

} // anonymous namespace

int main(int argc, char** argv)
{
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    SequentialParameters params;
    bool heiken_ashi = false;
    long first_bar = 0;
    long last_bar = -1;
    int positional = 0;

    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--heiken-ashi") {
            heiken_ashi = true;
        } else if (arg == "--tdst=true_range") {
            params.tdst_source = TdstSource::TrueRange;
        } else if (arg.rfind("--lookback=", 0) == 0) {
            params.setup_lookback = std::atoi(arg.c_str() + 11);
        } else if (positional == 0) {
            first_bar = std::atol(arg.c_str());
            ++positional;
        } else if (positional == 1) {
            last_bar = std::atol(arg.c_str());
            ++positional;
        } else {
            print_usage(argv[0]);
            return 1;
        }
    }

    auto raw = OhlcvParser::parse_file(argv[1]);
    if (raw.empty()) {
        std::cerr << "Failed to load " << argv[1] << ": " << OhlcvParser::get_last_error() << "\n";
        return 1;
    }
    const BarSeries series = heiken_ashi ? compute_heiken_ashi(raw) : raw;

    std::string error;
    if (!validate_series(series, error)) {
        std::cerr << "Invalid series: " << error << "\n";
        return 1;
    }

    if (last_bar < 0 || last_bar >= static_cast<long>(series.size())) {
        last_bar = static_cast<long>(series.size()) - 1;
    }

    std::cout << "TD Sequential trace, " << series.size() << " bars"
              << (heiken_ashi ? " (Heiken-Ashi)" : "") << "\n";
    std::cout << std::setw(6) << "bar" << std::setw(12) << "close"
              << std::setw(9) << "flip" << std::setw(6) << "setup" << std::setw(4) << "n"
              << std::setw(5) << "prf" << std::setw(12) << "tdst"
              << std::setw(6) << "cd" << std::setw(5) << "n" << "  events\n";

    try {
        SequentialStateMachine machine(params);
        for (std::size_t i = 0; i < series.size() && static_cast<long>(i) <= last_bar; ++i) {
            const auto state = machine.step(series, i);
            if (static_cast<long>(i) < first_bar) {
                continue;
            }

            std::cout << std::setw(6) << i << std::setw(12) << std::fixed << std::setprecision(4)
                      << series.close[i]
                      << std::setw(9) << to_string(state.price_flip)
                      << std::setw(6) << to_string(state.setup_direction)
                      << std::setw(4) << state.setup_count
                      << std::setw(5) << (state.setup_perfected ? "P" : "");
            if (state.tdst) {
                std::cout << std::setw(12) << state.tdst->price;
            } else {
                std::cout << std::setw(12) << "-";
            }
            std::cout << std::setw(6) << to_string(state.countdown_direction)
                      << std::setw(5) << state.countdown.label() << " ";
            if (state.countdown_advanced) {
                std::cout << " advanced";
            }
            if (state.countdown_cancelled) {
                std::cout << " cancelled";
            }
            if (state.countdown_completed) {
                std::cout << " completed";
            }
            std::cout << "\n";
        }
    } catch (const std::exception& ex) {
        std::cerr << "Trace failed: " << ex.what() << "\n";
        return 1;
    }

    return 0;
}
