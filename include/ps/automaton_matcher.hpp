#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <span>
#include <stdexcept>
#include <utility>
#include <vector>

#include "composite_index.hpp"
#include "match.hpp"

namespace ps {

// Aho-Corasick automaton over byte patterns.
//
// Transitions are kept sparse (sorted byte/target pairs) because composite
// keys are long and almost every trie node has a single child; a dense
// 256-entry table per node would not fit for realistic key counts.
// Failure and dictionary-suffix links are computed breadth first in build().
// After build() the automaton is immutable and search() may run concurrently.
class aho_corasick {
public:
    using state_id = uint32_t;
    static constexpr state_id root = 0;
    static constexpr state_id none = static_cast<state_id>(-1);

    aho_corasick() { states_.emplace_back(); }

    aho_corasick(const aho_corasick&) = delete;
    aho_corasick& operator=(const aho_corasick&) = delete;
    aho_corasick(aho_corasick&&) = default;
    aho_corasick& operator=(aho_corasick&&) = default;

    void add_pattern(std::span<const std::byte> pattern, size_t value) {
        if (pattern.empty()) {
            throw std::invalid_argument("empty pattern");
        }
        state_id current = root;
        for (std::byte b : pattern) {
            const auto c = static_cast<uint8_t>(b);
            state_id next = find_edge(current, c);
            if (next == none) {
                next = static_cast<state_id>(states_.size());
                states_.emplace_back();
                insert_edge(current, c, next);
            }
            current = next;
        }
        auto& terminal = states_[current];
        if (terminal.output == none) {
            terminal.output = static_cast<state_id>(outputs_.size());
            outputs_.emplace_back();
        }
        outputs_[terminal.output].push_back(value);
        ++pattern_count_;
        built_ = false;
    }

    void build() {
        std::vector<state_id> queue;
        queue.reserve(states_.size());

        for (const auto& [c, child] : states_[root].edges) {
            states_[child].fail = root;
            states_[child].dict = none;
            queue.push_back(child);
        }

        for (size_t head = 0; head < queue.size(); ++head) {
            const state_id current = queue[head];
            for (const auto& [c, child] : states_[current].edges) {
                queue.push_back(child);

                // Longest proper suffix of child's path that is also a trie path.
                state_id fail = states_[current].fail;
                state_id target = find_edge(fail, c);
                while (target == none && fail != root) {
                    fail = states_[fail].fail;
                    target = find_edge(fail, c);
                }
                if (target == none || target == child) {
                    target = root;
                }
                states_[child].fail = target;
                states_[child].dict = states_[target].output != none ? target : states_[target].dict;
            }
        }
        built_ = true;
    }

    // Calls on_match(value, end_offset) for every pattern occurrence, with
    // end_offset one past the last matched byte.
    template<class F>
    void search(std::span<const std::byte> text, F&& on_match) const {
        if (!built_) {
            throw std::logic_error("aho_corasick::search before build()");
        }
        state_id current = root;
        for (size_t i = 0; i < text.size(); ++i) {
            const auto c = static_cast<uint8_t>(text[i]);
            state_id next = find_edge(current, c);
            while (next == none && current != root) {
                current = states_[current].fail;
                next = find_edge(current, c);
            }
            current = next == none ? root : next;

            for (state_id s = states_[current].output != none ? current : states_[current].dict;
                 s != none; s = states_[s].dict) {
                for (size_t value : outputs_[states_[s].output]) {
                    on_match(value, i + 1);
                }
            }
        }
    }

    size_t state_count() const noexcept { return states_.size(); }
    size_t pattern_count() const noexcept { return pattern_count_; }
    bool built() const noexcept { return built_; }

private:
    struct state {
        std::vector<std::pair<uint8_t, state_id>> edges;  // sorted by byte
        state_id fail = root;
        state_id dict = none;    // nearest proper suffix state with output
        state_id output = none;  // index into outputs_
    };

    state_id find_edge(state_id from, uint8_t c) const {
        const auto& edges = states_[from].edges;
        auto it = std::lower_bound(edges.begin(), edges.end(), c,
            [](const std::pair<uint8_t, state_id>& edge, uint8_t value) { return edge.first < value; });
        return (it != edges.end() && it->first == c) ? it->second : none;
    }

    void insert_edge(state_id from, uint8_t c, state_id to) {
        auto& edges = states_[from].edges;
        auto it = std::lower_bound(edges.begin(), edges.end(), c,
            [](const std::pair<uint8_t, state_id>& edge, uint8_t value) { return edge.first < value; });
        edges.insert(it, {c, to});
    }

    std::vector<state> states_;
    std::vector<std::vector<size_t>> outputs_;
    size_t pattern_count_ = 0;
    bool built_ = false;
};

// Streams the buffer through one automaton holding every composite key.
class automaton_matcher {
public:
    explicit automaton_matcher(const composite_index& index) : index_(index) {
        const auto& candidates = index_.candidates();
        for (size_t i = 0; i < candidates.size(); ++i) {
            const auto& candidate = candidates[i];
            if (candidate.lsf.empty()) continue;
            automaton_.add_pattern(candidate.lsf, i);
            if (candidate.msf != candidate.lsf) {
                automaton_.add_pattern(candidate.msf, i);
            }
        }
        automaton_.build();
    }

    candidate_hits scan(std::span<const std::byte> slice) const {
        candidate_hits hits;
        automaton_.search(slice, [&](size_t id, size_t) { hits.push_back(id); });
        return hits;
    }

    match_set match(std::span<const std::byte> buffer, ThreadPool& pool, const scan_config& config,
                    const progress_fn& on_progress = {}) const {
        if (index_.empty() || buffer.size() < index_.shortest_key()) {
            return {};
        }
        auto chunks = detail::scan_partitioned(buffer, index_.longest_key() - 1, pool, config, on_progress,
            [this](std::span<const std::byte> slice, size_t) { return scan(slice); });
        return detail::to_match_set(index_, chunks);
    }

private:
    const composite_index& index_;
    aho_corasick automaton_;
};

} // namespace ps
