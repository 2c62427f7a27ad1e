#pragma once

#include <cstddef>
#include <optional>
#include <set>
#include <span>
#include <string>
#include <vector>

#include "big_integer.hpp"
#include "config.hpp"
#include "error.hpp"
#include "observer.hpp"
#include "thread_pool.hpp"
#include "window_scanner.hpp"

namespace ps {

using prime_set = std::set<mpz_class>;

// Two-stage probable-prime test: the cheap round count rejects most
// composites, the expensive one runs only on the survivors.
class primality_filter {
public:
    primality_filter(int fast_rounds, int strong_rounds)
        : fast_rounds_(fast_rounds), strong_rounds_(strong_rounds) {}

    bool accepts(const mpz_class& candidate) const {
        return bigint::is_probably_prime(candidate, fast_rounds_) &&
               bigint::is_probably_prime(candidate, strong_rounds_);
    }

    std::optional<mpz_class> confirm(std::span<const std::byte> window, byte_order order) const {
        mpz_class candidate = bigint::from_bytes(window, order);
        if (!accepts(candidate)) {
            return std::nullopt;
        }
        return candidate;
    }

    // Appends the confirmed interpretations of one window to out.
    void confirm_window(std::span<const std::byte> window, candidate_orders orders,
                        std::vector<mpz_class>& out) const {
        if (orders != candidate_orders::lsf) {
            if (auto prime = confirm(window, byte_order::msf)) out.push_back(std::move(*prime));
        }
        if (orders != candidate_orders::msf) {
            if (auto prime = confirm(window, byte_order::lsf)) out.push_back(std::move(*prime));
        }
    }

private:
    int fast_rounds_;
    int strong_rounds_;
};

// Emits the quadratic-growth advisory when count exceeds the warning
// threshold, and fails when a hard ceiling is configured and exceeded.
// Returns true if the advisory was raised.
inline bool check_prime_count(size_t count, const scan_config& config, scan_observer& observer) {
    bool warned = false;
    if (count > config.prime_warning_threshold) {
        observer.on_advisory({advisory_kind::too_many_primes, count,
            "found " + std::to_string(count) + " candidate primes; pairing them is quadratic in time and memory. "
            "Consider raising the null filter length."});
        warned = true;
    }
    if (config.max_primes != 0 && count > config.max_primes) {
        throw scan_error(errc::resource,
            "found " + std::to_string(count) + " candidate primes, above the configured ceiling of " +
            std::to_string(config.max_primes));
    }
    return warned;
}

inline prime_set find_primes(std::span<const std::byte> buffer, const scan_config& config,
                             ThreadPool& pool, scan_observer& observer = null_observer()) {
    const window_scanner scanner(buffer, config.prime_size, config.null_filter_length);
    const primality_filter filter(config.fast_rounds, config.strong_rounds);

    observer.on_stage(scan_stage::finding_candidates);
    auto chunks = parallel_chunks(pool, scanner.window_count(), config.chunk_size, config.cancel,
        [&](chunk_range range) {
            std::vector<mpz_class> found;
            scanner.for_each_window(range.begin, range.end, [&](size_t, std::span<const std::byte> window) {
                filter.confirm_window(window, config.orders, found);
            });
            return found;
        },
        [&](size_t done, size_t total) { observer.on_progress(scan_stage::finding_candidates, done, total); });

    if (is_cancelled(config.cancel)) {
        throw scan_error(errc::cancelled, "scan cancelled while finding candidate primes");
    }

    prime_set primes;
    for (auto& chunk : chunks) {
        for (auto& prime : chunk) {
            primes.insert(std::move(prime));
        }
    }
    return primes;
}

} // namespace ps
