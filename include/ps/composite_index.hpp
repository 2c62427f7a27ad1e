#pragma once

#include <algorithm>
#include <cstddef>
#include <iterator>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "big_integer.hpp"
#include "error.hpp"
#include "observer.hpp"
#include "primality_filter.hpp"
#include "thread_pool.hpp"

namespace ps {

// Product of two confirmed primes with p <= q, plus both minimal encodings of n.
struct composite_candidate {
    mpz_class p;
    mpz_class q;
    mpz_class n;
    std::vector<std::byte> lsf;
    std::vector<std::byte> msf;
};

inline composite_candidate make_composite(const mpz_class& a, const mpz_class& b) {
    composite_candidate candidate;
    if (a <= b) {
        candidate.p = a;
        candidate.q = b;
    } else {
        candidate.p = b;
        candidate.q = a;
    }
    candidate.n = candidate.p * candidate.q;
    candidate.lsf = bigint::to_bytes(candidate.n, byte_order::lsf);
    candidate.msf = bigint::to_bytes(candidate.n, byte_order::msf);
    return candidate;
}

inline std::string_view as_key(std::span<const std::byte> bytes) noexcept {
    return {reinterpret_cast<const char*>(bytes.data()), bytes.size()};
}

// Byte-key lookup over a fixed set of composite candidates. Keys are views
// into the candidates' own encodings, so the index is movable but not copyable.
class composite_index {
public:
    composite_index() = default;

    explicit composite_index(std::vector<composite_candidate> candidates, size_t rejected = 0)
        : candidates_(std::move(candidates)), rejected_(rejected) {
        keys_.reserve(candidates_.size() * 2);
        for (size_t i = 0; i < candidates_.size(); ++i) {
            const auto& candidate = candidates_[i];
            if (candidate.lsf.empty()) {
                continue;
            }
            keys_.emplace(as_key(candidate.lsf), i);
            // A palindromic product has a single key.
            if (candidate.msf != candidate.lsf) {
                keys_.emplace(as_key(candidate.msf), i);
            }
            add_length(candidate.lsf.size());
        }
    }

    composite_index(const composite_index&) = delete;
    composite_index& operator=(const composite_index&) = delete;
    composite_index(composite_index&&) = default;
    composite_index& operator=(composite_index&&) = default;

    const std::vector<composite_candidate>& candidates() const noexcept { return candidates_; }
    size_t size() const noexcept { return candidates_.size(); }
    bool empty() const noexcept { return keys_.empty(); }

    // Products rejected by the width guard at build time.
    size_t rejected_count() const noexcept { return rejected_; }

    // Distinct key lengths, ascending.
    const std::vector<size_t>& key_lengths() const noexcept { return lengths_; }
    size_t shortest_key() const noexcept { return lengths_.empty() ? 0 : lengths_.front(); }
    size_t longest_key() const noexcept { return lengths_.empty() ? 0 : lengths_.back(); }

    // Calls fn(candidate_index) for every candidate carrying key.
    template<class F>
    void for_each_match(std::span<const std::byte> key, F&& fn) const {
        auto [first, last] = keys_.equal_range(as_key(key));
        for (; first != last; ++first) {
            fn(first->second);
        }
    }

    bool contains(std::span<const std::byte> key) const {
        return keys_.find(as_key(key)) != keys_.end();
    }

    // Calls fn(key_bytes) once for every distinct key.
    template<class F>
    void for_each_key(F&& fn) const {
        for (const auto& candidate : candidates_) {
            if (candidate.lsf.empty()) continue;
            fn(std::span<const std::byte>(candidate.lsf));
            if (candidate.msf != candidate.lsf) {
                fn(std::span<const std::byte>(candidate.msf));
            }
        }
    }

private:
    void add_length(size_t length) {
        auto it = std::lower_bound(lengths_.begin(), lengths_.end(), length);
        if (it == lengths_.end() || *it != length) {
            lengths_.insert(it, length);
        }
    }

    std::vector<composite_candidate> candidates_;
    std::unordered_multimap<std::string_view, size_t> keys_;
    std::vector<size_t> lengths_;
    size_t rejected_ = 0;
};

namespace detail {
    struct pair_block {
        std::vector<composite_candidate> candidates;
        size_t rejected = 0;
    };
}

// Forms every unordered pair (p, q), p <= q, self-pairs included, and indexes
// both encodings of p * q. Products wider than max_key_length bytes are
// dropped and counted instead of indexed.
inline composite_index build_composite_index(const prime_set& primes, size_t max_key_length, ThreadPool& pool,
                                             const cancel_token& cancel = {},
                                             scan_observer& observer = null_observer()) {
    const std::vector<mpz_class> sorted(primes.begin(), primes.end());
    const size_t count = sorted.size();

    observer.on_stage(scan_stage::building_index);

    // Row i pairs sorted[i] with sorted[i..]; rows shrink, so chunks stay small
    // and the pool's stealing evens them out.
    const size_t rows_per_chunk = std::max<size_t>(1, count / (pool.size() * 8));
    auto blocks = parallel_chunks(pool, count, rows_per_chunk, cancel,
        [&](chunk_range range) {
            detail::pair_block block;
            for (size_t i = range.begin; i < range.end; ++i) {
                for (size_t j = i; j < count; ++j) {
                    auto candidate = make_composite(sorted[i], sorted[j]);
                    if (candidate.lsf.size() > max_key_length) {
                        ++block.rejected;
                        continue;
                    }
                    block.candidates.push_back(std::move(candidate));
                }
            }
            return block;
        },
        [&](size_t done, size_t total) { observer.on_progress(scan_stage::building_index, done, total); });

    if (is_cancelled(cancel)) {
        throw scan_error(errc::cancelled, "scan cancelled while building the composite index");
    }

    std::vector<composite_candidate> candidates;
    candidates.reserve(count * (count + 1) / 2);
    size_t rejected = 0;
    for (auto& block : blocks) {
        std::move(block.candidates.begin(), block.candidates.end(), std::back_inserter(candidates));
        rejected += block.rejected;
    }

    if (rejected > 0) {
        observer.on_advisory({advisory_kind::oversized_products, rejected,
            std::to_string(rejected) + " products are wider than " + std::to_string(max_key_length) +
            " bytes and were left out of the index"});
    }
    return composite_index(std::move(candidates), rejected);
}

} // namespace ps
