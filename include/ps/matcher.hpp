#pragma once

#include <span>
#include <string>

#include "automaton_matcher.hpp"
#include "composite_index.hpp"
#include "config.hpp"
#include "error.hpp"
#include "match.hpp"
#include "naive_matcher.hpp"
#include "observer.hpp"
#include "rolling_hash_matcher.hpp"

namespace ps {

namespace detail {

    inline match_set run_strategy(std::span<const std::byte> buffer, const composite_index& index,
                                  const scan_config& config, ThreadPool& pool, const progress_fn& progress) {
        switch (config.strategy) {
            case matcher_strategy::naive:
                return naive_matcher(index).match(buffer, pool, config, progress);
            case matcher_strategy::automaton:
                return automaton_matcher(index).match(buffer, pool, config, progress);
            case matcher_strategy::rolling_hash:
                return rolling_hash_matcher(index).match(buffer, pool, config, progress);
        }
        throw scan_error(errc::configuration,
            "unknown matcher strategy " + std::to_string(static_cast<int>(config.strategy)));
    }

} // namespace detail

// Every strategy returns the same set for the same buffer and index; they
// differ only in time and memory profile.
inline match_set find_composites(std::span<const std::byte> buffer, const composite_index& index,
                                 const scan_config& config, ThreadPool& pool,
                                 scan_observer& observer = null_observer()) {
    observer.on_stage(scan_stage::matching);
    const progress_fn progress = [&observer](size_t done, size_t total) {
        observer.on_progress(scan_stage::matching, done, total);
    };

    auto matches = detail::run_strategy(buffer, index, config, pool, progress);

    if (is_cancelled(config.cancel)) {
        throw scan_error(errc::cancelled, "scan cancelled while matching composites");
    }
    return matches;
}

} // namespace ps
