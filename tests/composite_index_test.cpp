#include <gtest/gtest.h>
#include "ps/composite_index.hpp"
#include "test_support.hpp"
#include <algorithm>
#include <set>
#include <vector>

namespace {

ps::prime_set make_primes(size_t count, size_t size) {
    ps::prime_set primes;
    for (unsigned long seed = 0; primes.size() < count; ++seed) {
        primes.insert(ps_test::make_prime(size, seed * 13));
    }
    return primes;
}

struct advisory_counter : ps::scan_observer {
    std::vector<ps::advisory> advisories;
    void on_advisory(const ps::advisory& adv) override { advisories.push_back(adv); }
};

} // namespace

TEST(CompositeIndexTest, MakeCompositeIsCanonical) {
    const auto a = ps_test::make_prime(8, 1);
    const auto b = ps_test::make_prime(8, 2);
    const auto forward = ps::make_composite(a, b);
    const auto backward = ps::make_composite(b, a);
    EXPECT_LE(forward.p, forward.q);
    EXPECT_EQ(forward.p, backward.p);
    EXPECT_EQ(forward.q, backward.q);
    EXPECT_EQ(forward.n, a * b);
    EXPECT_EQ(forward.lsf, ps::bigint::to_bytes(a * b, ps::byte_order::lsf));
    EXPECT_EQ(forward.msf, ps::bigint::to_bytes(a * b, ps::byte_order::msf));
}

TEST(CompositeIndexTest, PairCountIncludesSelfPairs) {
    const auto primes = make_primes(20, 8);
    ps::ThreadPool pool(4);
    const auto index = ps::build_composite_index(primes, 16, pool);
    EXPECT_EQ(index.size(), 20u * 21u / 2u);
    EXPECT_EQ(index.rejected_count(), 0u);

    std::set<std::pair<mpz_class, mpz_class>> pairs;
    size_t self_pairs = 0;
    for (const auto& candidate : index.candidates()) {
        EXPECT_LE(candidate.p, candidate.q);
        EXPECT_EQ(candidate.n, candidate.p * candidate.q);
        EXPECT_TRUE(pairs.emplace(candidate.p, candidate.q).second);
        if (candidate.p == candidate.q) ++self_pairs;
    }
    EXPECT_EQ(self_pairs, 20u);
}

TEST(CompositeIndexTest, BothEncodingsResolveToSamePair) {
    const auto primes = make_primes(6, 8);
    ps::ThreadPool pool(2);
    const auto index = ps::build_composite_index(primes, 16, pool);

    for (size_t i = 0; i < index.size(); ++i) {
        const auto& candidate = index.candidates()[i];
        for (const auto* key : {&candidate.lsf, &candidate.msf}) {
            std::vector<size_t> found;
            index.for_each_match(*key, [&](size_t id) { found.push_back(id); });
            ASSERT_EQ(found.size(), 1u);
            EXPECT_EQ(found[0], i);
            EXPECT_TRUE(index.contains(*key));
        }
    }
}

TEST(CompositeIndexTest, UnknownKeyMisses) {
    const auto primes = make_primes(4, 8);
    ps::ThreadPool pool(2);
    const auto index = ps::build_composite_index(primes, 16, pool);
    const std::vector<std::byte> junk(16, std::byte{0xCD});
    EXPECT_FALSE(index.contains(junk));
    size_t calls = 0;
    index.for_each_match(junk, [&](size_t) { ++calls; });
    EXPECT_EQ(calls, 0u);
}

TEST(CompositeIndexTest, KeyLengths) {
    const auto primes = make_primes(10, 8);
    ps::ThreadPool pool(2);
    const auto index = ps::build_composite_index(primes, 16, pool);
    // Both factors have their top bit set, so every product is 15 or 16 bytes.
    ASSERT_FALSE(index.key_lengths().empty());
    EXPECT_GE(index.shortest_key(), 15u);
    EXPECT_EQ(index.longest_key(), 16u);
    EXPECT_TRUE(std::is_sorted(index.key_lengths().begin(), index.key_lengths().end()));
}

TEST(CompositeIndexTest, ForEachKeyVisitsBothOrders) {
    const auto primes = make_primes(5, 8);
    ps::ThreadPool pool(2);
    const auto index = ps::build_composite_index(primes, 16, pool);
    size_t keys = 0;
    index.for_each_key([&](std::span<const std::byte> key) {
        EXPECT_TRUE(index.contains(key));
        ++keys;
    });
    EXPECT_EQ(keys, index.size() * 2);
}

TEST(CompositeIndexTest, PalindromicProductHasOneKey) {
    // 11 * 11 = 121 = 0x79, a single byte reads the same both ways.
    ps::prime_set primes{mpz_class(11)};
    ps::ThreadPool pool(1);
    const auto index = ps::build_composite_index(primes, 2, pool);
    ASSERT_EQ(index.size(), 1u);
    size_t keys = 0;
    index.for_each_key([&](std::span<const std::byte>) { ++keys; });
    EXPECT_EQ(keys, 1u);
    size_t hits = 0;
    index.for_each_match(ps_test::bytes({0x79}), [&](size_t) { ++hits; });
    EXPECT_EQ(hits, 1u);
}

TEST(CompositeIndexTest, WidthGuardRejectsWideProducts) {
    // Mixed widths: two 8-byte primes and one 12-byte prime with an 8-byte limit of 16.
    ps::prime_set primes{ps_test::make_prime(8, 1), ps_test::make_prime(8, 2), ps_test::make_prime(12, 3)};
    ps::ThreadPool pool(2);
    advisory_counter observer;
    const auto index = ps::build_composite_index(primes, 16, pool, {}, observer);

    // 8x8 pairs (3) fit; 8x12 (2) and 12x12 (1) are too wide.
    EXPECT_EQ(index.size(), 3u);
    EXPECT_EQ(index.rejected_count(), 3u);
    ASSERT_EQ(observer.advisories.size(), 1u);
    EXPECT_EQ(observer.advisories[0].kind, ps::advisory_kind::oversized_products);
    EXPECT_EQ(observer.advisories[0].count, 3u);
    EXPECT_LE(index.longest_key(), 16u);
}

TEST(CompositeIndexTest, EmptyPrimeSet) {
    ps::ThreadPool pool(2);
    const auto index = ps::build_composite_index({}, 16, pool);
    EXPECT_TRUE(index.empty());
    EXPECT_EQ(index.size(), 0u);
    EXPECT_EQ(index.shortest_key(), 0u);
}

TEST(CompositeIndexTest, SameIndexForAnyWorkerCount) {
    const auto primes = make_primes(30, 6);
    ps::ThreadPool single(1);
    ps::ThreadPool many(8);
    const auto a = ps::build_composite_index(primes, 12, single);
    const auto b = ps::build_composite_index(primes, 12, many);
    ASSERT_EQ(a.size(), b.size());
    for (size_t i = 0; i < a.size(); ++i) {
        EXPECT_EQ(a.candidates()[i].p, b.candidates()[i].p);
        EXPECT_EQ(a.candidates()[i].q, b.candidates()[i].q);
    }
}

TEST(CompositeIndexTest, MovePreservesLookups) {
    const auto primes = make_primes(5, 8);
    ps::ThreadPool pool(2);
    auto index = ps::build_composite_index(primes, 16, pool);
    const auto key = index.candidates()[3].msf;
    ps::composite_index moved = std::move(index);
    EXPECT_TRUE(moved.contains(key));
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
