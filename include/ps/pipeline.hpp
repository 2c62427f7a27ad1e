#pragma once

#include <cstddef>
#include <filesystem>
#include <fstream>
#include <memory>
#include <span>
#include <string>
#include <system_error>
#include <vector>

#include "composite_index.hpp"
#include "config.hpp"
#include "error.hpp"
#include "matcher.hpp"
#include "observer.hpp"
#include "primality_filter.hpp"
#include "thread_pool.hpp"

namespace ps {

// Reads the whole file into memory.
inline std::vector<std::byte> load_file(const std::string& path) {
    std::error_code ec;
    const auto status = std::filesystem::status(path, ec);
    // Some standard libraries also set ec for a missing file.
    if (status.type() == std::filesystem::file_type::not_found) {
        throw scan_error(errc::io, "cannot open '" + path + "': no such file");
    }
    if (ec) {
        throw scan_error(errc::io, "cannot open '" + path + "': " + ec.message());
    }
    if (status.type() != std::filesystem::file_type::regular) {
        throw scan_error(errc::io, "cannot open '" + path + "': not a regular file");
    }
    std::ifstream in(path, std::ios::binary | std::ios::ate);
    if (!in) {
        throw scan_error(errc::io, "cannot open '" + path + "'");
    }
    const std::streamoff size = in.tellg();
    if (size < 0) {
        throw scan_error(errc::io, "cannot determine the size of '" + path + "'");
    }
    std::vector<std::byte> contents(static_cast<size_t>(size));
    in.seekg(0, std::ios::beg);
    if (size > 0 && !in.read(reinterpret_cast<char*>(contents.data()), size)) {
        throw scan_error(errc::io, "short read from '" + path + "'");
    }
    return contents;
}

struct scan_report {
    prime_set primes;
    match_set matches;
    bool primes_only = false;  // dump_primes run: matches is empty by construction
};

inline scan_report run_scan(std::span<const std::byte> buffer, const scan_config& config,
                            ThreadPool& pool, scan_observer& observer = null_observer()) {
    config.validate();

    scan_report report;
    report.primes_only = config.dump_primes;
    report.primes = find_primes(buffer, config, pool, observer);
    check_prime_count(report.primes.size(), config, observer);

    if (config.dump_primes) {
        return report;
    }

    const auto index = build_composite_index(report.primes, 2 * config.prime_size, pool, config.cancel, observer);
    report.matches = find_composites(buffer, index, config, pool, observer);
    return report;
}

// Uses the shared pool unless the config asks for a specific worker count.
inline scan_report run_scan(std::span<const std::byte> buffer, const scan_config& config,
                            scan_observer& observer = null_observer()) {
    if (config.threads == 0) {
        return run_scan(buffer, config, get_pool(), observer);
    }
    ThreadPool pool(config.threads);
    return run_scan(buffer, config, pool, observer);
}

} // namespace ps
