#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace ps {

enum class errc {
    configuration,  // bad option, raised before any scanning
    precondition,   // input cannot satisfy the scan, e.g. prime_size > buffer length
    resource,       // configured ceiling exceeded
    io,             // input file unreadable
    cancelled       // cancel token was set
};

inline std::string_view to_string(errc code) noexcept {
    switch (code) {
        case errc::configuration: return "configuration error";
        case errc::precondition:  return "precondition error";
        case errc::resource:      return "resource error";
        case errc::io:            return "I/O error";
        case errc::cancelled:     return "cancelled";
    }
    return "error";
}

class scan_error : public std::runtime_error {
public:
    scan_error(errc code, const std::string& what) : std::runtime_error(what), code_(code) {}

    errc code() const noexcept { return code_; }

private:
    errc code_;
};

} // namespace ps
