#pragma once

#include <cstddef>
#include <ostream>
#include <string>
#include <string_view>

namespace ps {

enum class scan_stage {
    finding_candidates,
    building_index,
    matching
};

inline std::string_view to_string(scan_stage stage) noexcept {
    switch (stage) {
        case scan_stage::finding_candidates: return "Finding candidate primes";
        case scan_stage::building_index:     return "Building composite index";
        case scan_stage::matching:           return "Validating candidates";
    }
    return "";
}

enum class advisory_kind {
    too_many_primes,     // pair construction is quadratic in the prime count
    oversized_products   // products too wide for the windowed matchers
};

struct advisory {
    advisory_kind kind;
    size_t count = 0;
    std::string message;
};

// Receives progress and advisories from the pipeline. All callbacks are made
// from the thread that called into the pipeline, never from pool workers.
class scan_observer {
public:
    virtual ~scan_observer() = default;

    virtual void on_stage(scan_stage) {}
    virtual void on_progress(scan_stage, size_t /*done*/, size_t /*total*/) {}
    virtual void on_advisory(const advisory&) {}
};

inline scan_observer& null_observer() {
    static scan_observer observer;
    return observer;
}

// Plain line-oriented console output.
class stream_observer : public scan_observer {
public:
    explicit stream_observer(std::ostream& out, bool show_progress = true)
        : out_(out), show_progress_(show_progress) {}

    void on_stage(scan_stage stage) override {
        if (show_progress_) {
            out_ << to_string(stage) << std::endl;
        }
        last_percent_ = -1;
    }

    void on_progress(scan_stage, size_t done, size_t total) override {
        if (!show_progress_ || total == 0) {
            return;
        }
        const int percent = static_cast<int>((done * 100) / total);
        // One line per 10% step keeps multi-gigabyte scans readable.
        if (percent / 10 != last_percent_ / 10 || done == total) {
            if (percent != last_percent_) {
                out_ << "    " << done << "/" << total << " (" << percent << "%)" << std::endl;
            }
            last_percent_ = percent;
        }
    }

    void on_advisory(const advisory& adv) override {
        out_ << "Warning: " << adv.message << std::endl;
    }

private:
    std::ostream& out_;
    bool show_progress_;
    int last_percent_ = -1;
};

} // namespace ps
