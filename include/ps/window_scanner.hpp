#pragma once

#include <cstddef>
#include <cstring>
#include <span>
#include <string>

#include "error.hpp"

namespace ps {

// True if bytes holds run_length consecutive zero bytes anywhere.
// Returns at the first run found.
inline bool has_null_run(std::span<const std::byte> bytes, size_t run_length) {
    if (run_length == 0 || bytes.size() < run_length) {
        return false;
    }
    const std::byte* const data = bytes.data();
    const std::byte* const end = data + bytes.size();

    // Jump between zero bytes with memchr instead of testing every position.
    for (const std::byte* p = data; p < end; ) {
        p = static_cast<const std::byte*>(memchr(p, 0, end - p));
        if (!p) break;
        if (static_cast<size_t>(end - p) < run_length) break;

        size_t run = 1;
        while (run < run_length && p[run] == std::byte{0}) ++run;
        if (run == run_length) {
            return true;
        }
        p += run + 1;  // p[run] is non-zero
    }
    return false;
}

// Fixed-size windows over a read-only buffer, one per start offset in
// [0, size - window_size]. Index addressable so it can be split across workers.
class window_scanner {
public:
    window_scanner(std::span<const std::byte> buffer, size_t window_size, size_t null_filter_length)
        : buffer_(buffer), window_size_(window_size), null_filter_length_(null_filter_length) {
        if (window_size_ == 0) {
            throw scan_error(errc::configuration, "window size must be positive");
        }
        if (window_size_ > buffer_.size()) {
            throw scan_error(errc::precondition,
                "prime size (" + std::to_string(window_size_) + " bytes) exceeds the input length (" +
                std::to_string(buffer_.size()) + " bytes); no window fits");
        }
    }

    size_t window_count() const noexcept { return buffer_.size() - window_size_ + 1; }
    size_t window_size() const noexcept { return window_size_; }

    std::span<const std::byte> window_at(size_t index) const {
        return buffer_.subspan(index, window_size_);
    }

    bool passes_filter(std::span<const std::byte> window) const {
        return !has_null_run(window, null_filter_length_);
    }

    // Calls fn(offset, window) for every window in [begin, end) that survives
    // the null-run filter.
    template<class F>
    void for_each_window(size_t begin, size_t end, F&& fn) const {
        end = end < window_count() ? end : window_count();
        for (size_t i = begin; i < end; ++i) {
            const auto window = window_at(i);
            if (passes_filter(window)) {
                fn(i, window);
            }
        }
    }

private:
    std::span<const std::byte> buffer_;
    size_t window_size_;
    size_t null_filter_length_;
};

} // namespace ps
