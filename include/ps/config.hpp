#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include "error.hpp"
#include "thread_pool.hpp"

namespace ps {

enum class matcher_strategy {
    naive,        // direct index lookup of every buffer window
    automaton,    // Aho-Corasick over every composite key
    rolling_hash  // rolling fingerprint separators, exact re-verification
};

// Which byte orders a window is interpreted in.
enum class candidate_orders {
    msf,
    lsf,
    both
};

inline std::string_view to_string(matcher_strategy strategy) noexcept {
    switch (strategy) {
        case matcher_strategy::naive:        return "naive";
        case matcher_strategy::automaton:    return "automaton";
        case matcher_strategy::rolling_hash: return "rolling-hash";
    }
    return "";
}

inline std::string_view to_string(candidate_orders orders) noexcept {
    switch (orders) {
        case candidate_orders::msf:  return "msf";
        case candidate_orders::lsf:  return "lsf";
        case candidate_orders::both: return "both";
    }
    return "";
}

inline matcher_strategy parse_matcher_strategy(std::string_view name) {
    if (name == "naive") return matcher_strategy::naive;
    if (name == "automaton") return matcher_strategy::automaton;
    if (name == "rolling-hash" || name == "rolling_hash") return matcher_strategy::rolling_hash;
    throw scan_error(errc::configuration, "unknown matcher strategy '" + std::string(name) + "'");
}

inline candidate_orders parse_candidate_orders(std::string_view name) {
    if (name == "msf") return candidate_orders::msf;
    if (name == "lsf") return candidate_orders::lsf;
    if (name == "both") return candidate_orders::both;
    throw scan_error(errc::configuration, "unknown byte order '" + std::string(name) + "'");
}

struct scan_config {
    size_t prime_size = 0;
    size_t null_filter_length = 0;
    bool dump_primes = false;
    matcher_strategy strategy = matcher_strategy::automaton;
    candidate_orders orders = candidate_orders::both;

    int fast_rounds = 1;
    int strong_rounds = 20;

    size_t prime_warning_threshold = 1000;
    size_t max_primes = 0;  // 0: no ceiling

    size_t threads = 0;     // 0: shared pool sized to the hardware
    size_t chunk_size = 65536 * 4;

    cancel_token cancel;

    void validate() const {
        if (prime_size == 0) {
            throw scan_error(errc::configuration, "prime size must be positive");
        }
        if (null_filter_length == 0) {
            throw scan_error(errc::configuration, "null filter length must be positive");
        }
        if (fast_rounds < 1) {
            throw scan_error(errc::configuration, "fast primality rounds must be at least 1");
        }
        if (strong_rounds < fast_rounds) {
            throw scan_error(errc::configuration, "strong primality rounds must not be below the fast rounds");
        }
        if (chunk_size == 0) {
            throw scan_error(errc::configuration, "chunk size must be positive");
        }
    }
};

} // namespace ps
