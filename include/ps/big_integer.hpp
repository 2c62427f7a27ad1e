#pragma once

#include <cstddef>
#include <span>
#include <string_view>
#include <vector>

#include <gmpxx.h>

namespace ps {

// Interpretation of a byte run as an integer.
enum class byte_order {
    msf,  // most significant byte first (big-endian)
    lsf   // least significant byte first (little-endian)
};

inline std::string_view to_string(byte_order order) noexcept {
    return order == byte_order::msf ? "msf" : "lsf";
}

namespace bigint {

    inline int gmp_order(byte_order order) noexcept {
        return order == byte_order::msf ? 1 : -1;
    }

    // Zero bytes on the insignificant end are ignored, so a window and its
    // trimmed form give the same value.
    inline mpz_class from_bytes(std::span<const std::byte> bytes, byte_order order) {
        mpz_class value;
        if (!bytes.empty()) {
            mpz_import(value.get_mpz_t(), bytes.size(), gmp_order(order), 1, 0, 0, bytes.data());
        }
        return value;
    }

    // Minimal encoding: no leading zero (msf) or trailing zero (lsf) bytes.
    // Zero encodes as an empty vector.
    inline std::vector<std::byte> to_bytes(const mpz_class& value, byte_order order) {
        if (sgn(value) == 0) {
            return {};
        }
        const size_t size = (mpz_sizeinbase(value.get_mpz_t(), 2) + 7) / 8;
        std::vector<std::byte> bytes(size);
        size_t written = 0;
        mpz_export(bytes.data(), &written, gmp_order(order), 1, 0, 0, value.get_mpz_t());
        bytes.resize(written);
        return bytes;
    }

    inline size_t byte_length(const mpz_class& value) {
        return sgn(value) == 0 ? 0 : (mpz_sizeinbase(value.get_mpz_t(), 2) + 7) / 8;
    }

    // GMP answers 2 (definitely prime), 1 (probably prime) or 0 (composite).
    inline bool is_probably_prime(const mpz_class& value, int rounds) {
        if (value < 2) {
            return false;
        }
        return mpz_probab_prime_p(value.get_mpz_t(), rounds) > 0;
    }

    // Trims a raw window the way to_bytes(from_bytes(w, order), order) would.
    inline std::span<const std::byte> trim(std::span<const std::byte> bytes, byte_order order) {
        if (order == byte_order::msf) {
            size_t skip = 0;
            while (skip < bytes.size() && bytes[skip] == std::byte{0}) ++skip;
            return bytes.subspan(skip);
        }
        size_t keep = bytes.size();
        while (keep > 0 && bytes[keep - 1] == std::byte{0}) --keep;
        return bytes.first(keep);
    }

} // namespace bigint

} // namespace ps
