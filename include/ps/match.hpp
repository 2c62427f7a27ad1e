#pragma once

#include <algorithm>
#include <cstddef>
#include <functional>
#include <set>
#include <span>
#include <tuple>
#include <vector>

#include "composite_index.hpp"
#include "config.hpp"
#include "thread_pool.hpp"

namespace ps {

// A composite found in the buffer together with its two prime factors.
struct match_result {
    mpz_class p;
    mpz_class q;
    mpz_class n;

    friend bool operator<(const match_result& a, const match_result& b) {
        if (a.p != b.p) return a.p < b.p;
        return a.q < b.q;
    }
    friend bool operator==(const match_result& a, const match_result& b) {
        return a.p == b.p && a.q == b.q;
    }
};

using match_set = std::set<match_result>;

// Candidate indices into composite_index::candidates(); may repeat.
using candidate_hits = std::vector<size_t>;

using progress_fn = std::function<void(size_t, size_t)>;

namespace detail {

    // Splits the buffer into chunks of start offsets and hands each worker the
    // slice [begin, end + overlap) so a key starting near a chunk edge is still
    // seen whole. Matches inside the overlap may be reported by two chunks;
    // to_match_set() folds them.
    template<class F>
    std::vector<candidate_hits> scan_partitioned(std::span<const std::byte> buffer, size_t overlap,
                                                 ThreadPool& pool, const scan_config& config,
                                                 const progress_fn& on_progress, F&& scan_slice) {
        return parallel_chunks(pool, buffer.size(), config.chunk_size, config.cancel,
            [&](chunk_range range) {
                const size_t end = std::min(range.end + overlap, buffer.size());
                return scan_slice(buffer.subspan(range.begin, end - range.begin), range.end - range.begin);
            },
            [&](size_t done, size_t total) {
                if (on_progress) on_progress(done, total);
            });
    }

    inline match_set to_match_set(const composite_index& index, const std::vector<candidate_hits>& chunks) {
        std::vector<bool> seen(index.size(), false);
        match_set matches;
        for (const auto& hits : chunks) {
            for (size_t id : hits) {
                if (seen[id]) continue;
                seen[id] = true;
                const auto& candidate = index.candidates()[id];
                matches.insert({candidate.p, candidate.q, candidate.n});
            }
        }
        return matches;
    }

} // namespace detail

} // namespace ps
