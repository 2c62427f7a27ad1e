#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <span>
#include <stdexcept>
#include <unordered_map>
#include <vector>

#include "composite_index.hpp"
#include "match.hpp"

namespace ps {

// Polynomial rolling fingerprint over a fixed window, arithmetic mod 2^64,
// truncated to the low `bits` bits.
class rolling_fingerprint {
public:
    static constexpr uint64_t base = 1315423911ULL;

    rolling_fingerprint(size_t window, unsigned bits) : window_(window) {
        if (window_ == 0) {
            throw std::invalid_argument("fingerprint window must be positive");
        }
        if (bits == 0 || bits > 64) {
            throw std::invalid_argument("fingerprint width must be between 1 and 64 bits");
        }
        mask_ = bits == 64 ? ~uint64_t{0} : ((uint64_t{1} << bits) - 1);
        lead_ = 1;
        for (size_t i = 1; i < window_; ++i) lead_ *= base;
    }

    size_t window() const noexcept { return window_; }

    // Raw (untruncated) hash of bytes[0, window).
    uint64_t hash(std::span<const std::byte> bytes) const noexcept {
        uint64_t h = 0;
        for (size_t i = 0; i < window_; ++i) {
            h = h * base + static_cast<uint8_t>(bytes[i]);
        }
        return h;
    }

    // Slides the window one byte: drops `out`, appends `in`.
    uint64_t roll(uint64_t h, std::byte out, std::byte in) const noexcept {
        return (h - static_cast<uint8_t>(out) * lead_) * base + static_cast<uint8_t>(in);
    }

    uint64_t truncate(uint64_t h) const noexcept { return h & mask_; }

private:
    size_t window_;
    uint64_t mask_ = 0;
    uint64_t lead_ = 1;  // base^(window - 1)
};

// Flags "separator" offsets whose rolling fingerprint equals the fingerprint
// of some key's leading bytes, then re-slices the buffer there and confirms
// against the exact byte index. Fingerprint hits alone never produce a match.
// Keys shorter than the fingerprint window get no separator; their lengths
// are looked up directly at every offset instead.
class rolling_hash_matcher {
public:
    static constexpr size_t default_window = 8;
    static constexpr unsigned default_bits = 32;

    explicit rolling_hash_matcher(const composite_index& index, size_t window = default_window,
                                  unsigned bits = default_bits)
        : index_(index), fingerprint_(window, bits) {
        index_.for_each_key([&](std::span<const std::byte> key) {
            const auto length = static_cast<uint32_t>(key.size());
            if (key.size() < fingerprint_.window()) {
                insert_length(short_lengths_, length);
                return;
            }
            insert_length(separators_[fingerprint_.truncate(fingerprint_.hash(key))], length);
        });
    }

    size_t window() const noexcept { return fingerprint_.window(); }
    size_t separator_count() const noexcept { return separators_.size(); }
    const std::vector<uint32_t>& short_key_lengths() const noexcept { return short_lengths_; }

    // Offsets in slice whose fingerprint is a separator, true key or not.
    size_t count_separator_hits(std::span<const std::byte> slice) const {
        size_t count = 0;
        for_each_separator(slice, slice.size(), [&](size_t, const std::vector<uint32_t>&) { ++count; });
        return count;
    }

    candidate_hits scan(std::span<const std::byte> slice, size_t starts) const {
        candidate_hits hits;
        for_each_separator(slice, starts, [&](size_t offset, const std::vector<uint32_t>& lengths) {
            for (uint32_t length : lengths) {
                if (offset + length > slice.size()) break;  // lengths ascend
                index_.for_each_match(slice.subspan(offset, length), [&](size_t id) { hits.push_back(id); });
            }
        });
        if (!short_lengths_.empty()) {
            for (size_t i = 0; i < starts && i < slice.size(); ++i) {
                for (uint32_t length : short_lengths_) {
                    if (i + length > slice.size()) break;
                    index_.for_each_match(slice.subspan(i, length), [&](size_t id) { hits.push_back(id); });
                }
            }
        }
        return hits;
    }

    match_set match(std::span<const std::byte> buffer, ThreadPool& pool, const scan_config& config,
                    const progress_fn& on_progress = {}) const {
        if (index_.empty() || buffer.size() < index_.shortest_key()) {
            return {};
        }
        // Each chunk starts from a fresh hash state, so the overlap must cover
        // a full key beyond the chunk's last owned offset.
        auto chunks = detail::scan_partitioned(buffer, index_.longest_key() - 1, pool, config, on_progress,
            [this](std::span<const std::byte> slice, size_t starts) { return scan(slice, starts); });
        return detail::to_match_set(index_, chunks);
    }

private:
    static void insert_length(std::vector<uint32_t>& lengths, uint32_t length) {
        auto it = std::lower_bound(lengths.begin(), lengths.end(), length);
        if (it == lengths.end() || *it != length) {
            lengths.insert(it, length);
        }
    }

    template<class F>
    void for_each_separator(std::span<const std::byte> slice, size_t starts, F&& on_separator) const {
        const size_t w = fingerprint_.window();
        if (slice.size() < w) {
            return;
        }
        const size_t last = std::min(starts, slice.size() - w + 1);
        if (last == 0) {
            return;
        }
        uint64_t h = fingerprint_.hash(slice);
        for (size_t i = 0; ; ++i) {
            auto it = separators_.find(fingerprint_.truncate(h));
            if (it != separators_.end()) {
                on_separator(i, it->second);
            }
            if (i + 1 >= last) break;
            h = fingerprint_.roll(h, slice[i], slice[i + w]);
        }
    }

    const composite_index& index_;
    rolling_fingerprint fingerprint_;
    std::unordered_map<uint64_t, std::vector<uint32_t>> separators_;
    std::vector<uint32_t> short_lengths_;  // ascending, all below the window
};

} // namespace ps
