#pragma once

#include <cstddef>
#include <span>

#include "composite_index.hpp"
#include "match.hpp"

namespace ps {

// Looks up every buffer window of every indexed key length directly in the
// index. Key lengths are usually 2 * prime_size and occasionally one byte
// shorter, so this is one or two hash lookups per offset.
class naive_matcher {
public:
    explicit naive_matcher(const composite_index& index) : index_(index) {}

    // Scans the first `starts` offsets of slice; keys may run into the rest.
    candidate_hits scan(std::span<const std::byte> slice, size_t starts) const {
        candidate_hits hits;
        const auto& lengths = index_.key_lengths();
        for (size_t i = 0; i < starts && i < slice.size(); ++i) {
            for (size_t length : lengths) {
                if (i + length > slice.size()) break;  // lengths ascend
                index_.for_each_match(slice.subspan(i, length), [&](size_t id) { hits.push_back(id); });
            }
        }
        return hits;
    }

    match_set match(std::span<const std::byte> buffer, ThreadPool& pool, const scan_config& config,
                    const progress_fn& on_progress = {}) const {
        if (index_.empty() || buffer.size() < index_.shortest_key()) {
            return {};
        }
        auto chunks = detail::scan_partitioned(buffer, index_.longest_key() - 1, pool, config, on_progress,
            [this](std::span<const std::byte> slice, size_t starts) { return scan(slice, starts); });
        return detail::to_match_set(index_, chunks);
    }

private:
    const composite_index& index_;
};

} // namespace ps
