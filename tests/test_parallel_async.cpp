#include <gtest/gtest.h>
#include <atomic>
#include <string>
#include <vector>

#include <chrange/alphabet/index_map.hpp>
#include <chrange/alphabet/prebuilt.hpp>
#include <chrange/search/parallel_async.hpp>

using namespace chrange::search;
using chrange::alphabet::CharacterInterval;
using chrange::alphabet::CharacterMap;
namespace prebuilt = chrange::alphabet::prebuilt;

namespace {

std::vector<std::u32string> sequential(const StringRange& range) {
    std::vector<std::u32string> out;
    for (const auto& s : range) out.push_back(s);
    return out;
}

}  // namespace

TEST(ParallelAsync, preserves_order_and_reports_progress) {
    const StringRange range(U"a", U"zz", prebuilt::ascii_lowercase<char32_t>());
    std::atomic<std::size_t> lastDone{0};
    std::atomic<std::size_t> lastTotal{0};

    auto out = materialize_parallel(range, 8, [&](std::size_t done, std::size_t total) {
        // done растёт монотонно, поэтому сохраняем максимум
        std::size_t seen = lastDone.load(std::memory_order_relaxed);
        while (done > seen && !lastDone.compare_exchange_weak(seen, done, std::memory_order_relaxed)) {
        }
        lastTotal.store(total, std::memory_order_relaxed);
    });

    ASSERT_EQ(out.size(), 702u);
    EXPECT_EQ(out.front(), U"a");
    EXPECT_EQ(out.back(), U"zz");
    EXPECT_EQ(out, sequential(range));

    EXPECT_EQ(lastDone.load(std::memory_order_relaxed), 702u);
    EXPECT_EQ(lastTotal.load(std::memory_order_relaxed), 702u);
}

TEST(ParallelAsync, shares_a_lazy_map_between_tasks) {
    const auto map = std::make_shared<const CharacterMap>(
        std::vector<CharacterInterval>{CharacterInterval(U'Ā', U'ǿ')},
        [](char32_t c) { return static_cast<std::size_t>(c) - 0x100; },
        [](std::size_t i) { return static_cast<char32_t>(i + 0x100); });
    const StringRange range(U"Ā", U"ĀĀ", map);

    const auto out = materialize_parallel(range, 16);

    ASSERT_EQ(out.size(), 257u);
    EXPECT_EQ(out, sequential(range));
}

TEST(ParallelAsync, more_threads_than_elements_and_empty_ranges) {
    const StringRange tiny(U"a", U"b", prebuilt::ascii_lowercase<char32_t>());
    EXPECT_EQ(materialize_parallel(tiny, 64), (std::vector<std::u32string>{U"a", U"b"}));
    EXPECT_EQ(materialize_parallel(tiny, 0).size(), 2u);

    const StringRange empty(U"a", U"b", prebuilt::ascii_lowercase<char32_t>(), Bounds::open);
    EXPECT_TRUE(materialize_parallel(empty).empty());
}

TEST(ParallelAsync, long_endpoints_split_unevenly) {
    // 20-значные концы: значения больше 2^64, элементов 12
    const StringRange range(U"99999999999999999990", U"000000000000000000001", prebuilt::ascii_digits<char32_t>());

    const auto out = materialize_parallel(range, 5);

    ASSERT_EQ(out.size(), 12u);
    EXPECT_EQ(out, sequential(range));
    EXPECT_EQ(out[10], std::u32string(21, U'0'));
}
