#pragma once

#include <cstddef>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>

#include "config.hpp"
#include "error.hpp"

namespace ps {

inline void print_usage(std::ostream& out, std::string_view program) {
    out << "Usage: " << program << " -s SIZE -f LENGTH [options] FILE\n"
        << "Finds RSA primes in memory and disk dumps.\n\n"
        << "  -s, --prime-size SIZE          size in bytes of the primes to search for\n"
        << "  -f, --null-filter-length LEN   skip windows holding LEN consecutive null bytes\n"
        << "  -p, --dump-primes              print all primes without verifying P*Q\n"
        << "  -m, --matcher NAME             naive, automaton or rolling-hash (default automaton)\n"
        << "  -o, --orders ORDER             msf, lsf or both (default both)\n"
        << "  -t, --threads N                worker threads, 0 for all cores (default 0)\n"
        << "      --max-primes N             fail if more than N primes are found\n"
        << "  -q, --quiet                    no progress output\n"
        << "  -h, --help                     show this help\n"
        << "  -V, --version                  show the version\n";
}

// Malformed command line: missing or unknown options, non-numeric values.
class usage_error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

inline size_t parse_size(std::string_view option, const std::string& text) {
    if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
        throw usage_error("option " + std::string(option) + " expects a non-negative integer, got '" + text + "'");
    }
    try {
        return static_cast<size_t>(std::stoull(text));
    } catch (const std::out_of_range&) {
        throw usage_error("value for " + std::string(option) + " is out of range: " + text);
    }
}

struct cli_options {
    scan_config config;
    std::string file;
    bool quiet = false;
    bool help = false;
    bool show_version = false;
};

// Throws usage_error for malformed input and a configuration scan_error for
// unknown matcher or order names. Value ranges are left to scan_config::validate().
inline cli_options parse_args(int argc, const char* const* argv) {
    cli_options options;
    std::optional<size_t> prime_size;
    std::optional<size_t> null_filter_length;

    for (int i = 1; i < argc; ++i) {
        const std::string_view arg = argv[i];

        auto value = [&]() -> std::string {
            if (i + 1 >= argc) {
                throw usage_error("option " + std::string(arg) + " requires a value");
            }
            return argv[++i];
        };

        if (arg == "-h" || arg == "--help") {
            options.help = true;
        } else if (arg == "-V" || arg == "--version") {
            options.show_version = true;
        } else if (arg == "-s" || arg == "--prime-size") {
            prime_size = parse_size(arg, value());
        } else if (arg == "-f" || arg == "--null-filter-length") {
            null_filter_length = parse_size(arg, value());
        } else if (arg == "-p" || arg == "--dump-primes") {
            options.config.dump_primes = true;
        } else if (arg == "-m" || arg == "--matcher") {
            options.config.strategy = parse_matcher_strategy(value());
        } else if (arg == "-o" || arg == "--orders") {
            options.config.orders = parse_candidate_orders(value());
        } else if (arg == "-t" || arg == "--threads") {
            options.config.threads = parse_size(arg, value());
        } else if (arg == "--max-primes") {
            options.config.max_primes = parse_size(arg, value());
        } else if (arg == "-q" || arg == "--quiet") {
            options.quiet = true;
        } else if (arg.size() > 1 && arg[0] == '-') {
            throw usage_error("unknown option " + std::string(arg));
        } else if (options.file.empty()) {
            options.file = std::string(arg);
        } else {
            throw usage_error("unexpected argument " + std::string(arg));
        }
    }

    if (options.help || options.show_version) {
        return options;
    }
    if (!prime_size) throw usage_error("missing required option --prime-size");
    if (!null_filter_length) throw usage_error("missing required option --null-filter-length");
    if (options.file.empty()) throw usage_error("missing input FILE");

    options.config.prime_size = *prime_size;
    options.config.null_filter_length = *null_filter_length;
    return options;
}

} // namespace ps
