#include <cstdint>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include "minblep/minblep.hpp"
#include "minblep/audio/wav_writer.hpp"
#include "square_render.hpp"

namespace {

void print_usage(const char* program) {
    std::cout << "minBLEP table tool v" << minblep::Version::string() << "\n\n"
              << "Usage: " << program << " [options]\n\n"
              << "Renders a band-limited square wave through a minBLEP table.\n\n"
              << "Options:\n"
              << "  -h, --help              Show this help message\n"
              << "  -v, --version           Show version information\n"
              << "  -n, --naive-rate <hz>   Naive sample rate (default: 250000)\n"
              << "  -r, --out-rate <hz>     Output sample rate (default: 44100)\n"
              << "  -s, --scale <n>         Expected scale (must match the ideal one)\n"
              << "  -c, --cutoff <f>        Cutoff, fraction of naive rate (default: 0.475)\n"
              << "  -t, --transition <f>    Transition width (default: 0.05)\n"
              << "  -f, --freq <hz>         Square wave frequency (default: 440)\n"
              << "  -d, --seconds <s>       Duration in seconds (default: 1)\n"
              << "  -o, --output <file>     Output WAV file (default: square.wav)\n"
              << "      --no-cache          Always build the table\n"
              << "      --verbose           Print table construction progress\n"
              << std::endl;
}

void print_version() {
    std::cout << "minblep " << minblep::Version::string() << std::endl;
}

void stderr_log(minblep::LogLevel level, std::string_view message) {
    std::cerr << "[minblep] " << minblep::level_name(level) << ": " << message << '\n';
}

}  // namespace

int main(int argc, char* argv[]) {
    int naiverate = 250000;
    int outrate = 44100;
    std::optional<int> scale;
    double cutoff = minblep::DEFAULT_CUTOFF;
    double transition = minblep::DEFAULT_TRANSITION;
    double freq = 440.0;
    double seconds = 1.0;
    std::string output = "square.wav";
    bool use_cache = true;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string_view arg = argv[i];

            auto next_value = [&]() -> std::string {
                if (i + 1 >= argc) {
                    throw std::invalid_argument("missing value for " + std::string(arg));
                }
                return argv[++i];
            };

            if (arg == "-h" || arg == "--help") {
                print_usage(argv[0]);
                return EXIT_SUCCESS;
            } else if (arg == "-v" || arg == "--version") {
                print_version();
                return EXIT_SUCCESS;
            } else if (arg == "-n" || arg == "--naive-rate") {
                naiverate = std::stoi(next_value());
            } else if (arg == "-r" || arg == "--out-rate") {
                outrate = std::stoi(next_value());
            } else if (arg == "-s" || arg == "--scale") {
                scale = std::stoi(next_value());
            } else if (arg == "-c" || arg == "--cutoff") {
                cutoff = std::stod(next_value());
            } else if (arg == "-t" || arg == "--transition") {
                transition = std::stod(next_value());
            } else if (arg == "-f" || arg == "--freq") {
                freq = std::stod(next_value());
            } else if (arg == "-d" || arg == "--seconds") {
                seconds = std::stod(next_value());
            } else if (arg == "-o" || arg == "--output") {
                output = next_value();
            } else if (arg == "--no-cache") {
                use_cache = false;
            } else if (arg == "--verbose") {
                minblep::set_log_handler(stderr_log);
            } else {
                std::cerr << "error: unknown option '" << arg << "'\n";
                return EXIT_FAILURE;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        return EXIT_FAILURE;
    }

    if (freq <= 0.0 || seconds <= 0.0) {
        std::cerr << "error: frequency and duration must be positive\n";
        return EXIT_FAILURE;
    }

    try {
        const auto table = use_cache
            ? minblep::MinBleps::load_or_create(naiverate, outrate, scale, cutoff, transition)
            : minblep::MinBleps::create(naiverate, outrate, scale, cutoff, transition);

        std::cout << "Table ready (scale: " << table.scale()
                  << ", mixin size: " << table.mixin_size() << ")\n";

        const auto naive_count = static_cast<std::int64_t>(seconds * naiverate);
        auto diff = minblep_cli::square_diffs(freq, naive_count, naiverate);
        auto signal = minblep_cli::render(table, diff);
        for (auto& s : signal) {
            s *= 0.5f;
        }

        auto result = minblep::WavWriter::write_to_file(output, signal.data(),
                                                        static_cast<std::uint32_t>(signal.size()),
                                                        1, static_cast<std::uint32_t>(outrate));
        if (!result.success) {
            std::cerr << "error: " << result.error_message << "\n";
            return EXIT_FAILURE;
        }

        std::cout << "Wrote " << signal.size() << " samples at " << outrate << " Hz to "
                  << output << "\n";
    } catch (const minblep::ConfigurationError& e) {
        std::cerr << "error: " << e.what() << "\n";
        return EXIT_FAILURE;
    } catch (const minblep::CacheError& e) {
        std::cerr << "error: cache: " << e.what() << "\n";
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
