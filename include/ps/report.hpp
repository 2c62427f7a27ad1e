#pragma once

#include <ostream>

#include "match.hpp"
#include "primality_filter.hpp"

namespace ps {

inline void print_primes(std::ostream& out, const prime_set& primes) {
    for (const auto& prime : primes) {
        out << prime << '\n';
    }
    out.flush();
}

inline void print_matches(std::ostream& out, const match_set& matches) {
    out << "Primes in file" << '\n';
    for (const auto& match : matches) {
        out << "P:" << match.p << " Q:" << match.q << " N:" << match.n << '\n';
    }
    out.flush();
}

} // namespace ps
