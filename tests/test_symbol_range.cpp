#include <gtest/gtest.h>

#include <algorithm>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include <chrange/alphabet/index_map.hpp>
#include <chrange/alphabet/prebuilt.hpp>
#include <chrange/core/errors.hpp>
#include <chrange/search/counter_rank.hpp>
#include <chrange/search/symbol_range.hpp>

using namespace chrange::search;
using chrange::alphabet::CharacterInterval;
using chrange::alphabet::CharacterMap;
namespace prebuilt = chrange::alphabet::prebuilt;
namespace core = chrange::core;

namespace {

std::vector<std::u32string> collect(const StringRange& range) {
    std::vector<std::u32string> out;
    for (const auto& s : range) out.push_back(s);
    return out;
}

std::vector<std::u32string> collect_reversed(const StringRange& range) {
    std::vector<std::u32string> out;
    for (auto it = range.rbegin(); it != range.rend(); ++it) out.push_back(*it);
    return out;
}

const std::shared_ptr<const CharacterMap>& lowercase() { return prebuilt::ascii_lowercase<char32_t>(); }
const std::shared_ptr<const CharacterMap>& digits() { return prebuilt::ascii_digits<char32_t>(); }

// Строка по сквозному номеру среди всех строк над map.
std::u32string spell(const CharacterMap& map, std::uint64_t rank) {
    const PositionalCounter c = counter_unrank(map.cardinality(), rank);
    std::u32string out;
    for (std::size_t i = 0; i < c.digit_count(); ++i) out.push_back(map.index_to_symbol(c[i]));
    return out;
}

}  // namespace

TEST(SymbolRange, single_width_range) {
    const StringRange range(U"a", U"c", lowercase());

    EXPECT_EQ(range.size(), 3u);
    EXPECT_EQ(collect(range), (std::vector<std::u32string>{U"a", U"b", U"c"}));
}

TEST(SymbolRange, crosses_widths_in_length_first_order) {
    const StringRange range(U"y", U"ab", lowercase());
    EXPECT_EQ(collect(range), (std::vector<std::u32string>{U"y", U"z", U"aa", U"ab"}));
    EXPECT_EQ(range.size(), 4u);
}

TEST(SymbolRange, digits_restart_from_zero_on_each_width) {
    const StringRange range(U"0", U"19", digits());
    const auto all = collect(range);

    ASSERT_EQ(all.size(), 30u);
    EXPECT_EQ(range.size(), 30u);
    EXPECT_EQ(all[9], U"9");
    EXPECT_EQ(all[10], U"00");
    EXPECT_EQ(all[29], U"19");
}

TEST(SymbolRange, closed_form_length_over_several_widths) {
    const StringRange range(U"y", U"aaab", lowercase());

    // y, z + все строки длины 2 и 3 + aaaa, aaab
    const std::uint64_t expected = 2 + 26 * 26 + 26 * 26 * 26 + 2;
    EXPECT_EQ(range.size(), expected);

    std::uint64_t counted = 0;
    for (const auto& s : range) {
        (void)s;
        ++counted;
    }
    EXPECT_EQ(counted, expected);
}

TEST(SymbolRange, single_element_range) {
    const StringRange range(U"q", U"q", lowercase());
    EXPECT_EQ(collect(range), (std::vector<std::u32string>{U"q"}));
    EXPECT_EQ(range.size(), 1u);
}

TEST(SymbolRange, size_matches_enumeration_for_every_pair) {
    const auto abc = std::make_shared<const CharacterMap>(std::vector<CharacterInterval>{CharacterInterval(U'a', U'c')});
    // все строки длины 1..3 над {a, b, c}
    const std::uint64_t universe = 3 + 9 + 27;

    for (const Bounds bounds : {Bounds::closed, Bounds::open, Bounds::left_open, Bounds::right_open}) {
        for (std::uint64_t i = 0; i < universe; ++i) {
            for (std::uint64_t j = i; j < universe; ++j) {
                const StringRange range(spell(*abc, i), spell(*abc, j), abc, bounds);

                std::uint64_t counted = 0;
                for (const auto& s : range) {
                    (void)s;
                    ++counted;
                }
                ASSERT_EQ(range.size(), counted) << "ranks " << i << ".." << j;
                ASSERT_EQ(range.empty(), counted == 0);
            }
        }
    }
}

TEST(SymbolRange, follows_map_order_not_codepoints) {
    const auto shuffled = std::make_shared<const CharacterMap>(
        std::vector<CharacterInterval>{CharacterInterval(U'x', U'z'), CharacterInterval(U'a', U'c')});

    const StringRange range(U"x", U"a", shuffled);
    EXPECT_EQ(collect(range), (std::vector<std::u32string>{U"x", U"y", U"z", U"a"}));

    EXPECT_THROW(StringRange(U"a", U"x", shuffled), core::InvalidDirection);
}

TEST(SymbolRange, rejects_reversed_endpoints) {
    EXPECT_THROW(StringRange(U"b", U"a", lowercase()), core::InvalidDirection);
    EXPECT_THROW(StringRange(U"aa", U"z", lowercase()), core::InvalidDirection);
}

TEST(SymbolRange, rejects_endpoints_outside_map) {
    EXPECT_THROW(StringRange(U"", U"a", lowercase()), core::InvalidEndpoints);
    EXPECT_THROW(StringRange(U"a", U"", lowercase()), core::InvalidEndpoints);
    EXPECT_THROW(StringRange(U"a", U"aB", lowercase()), core::InvalidEndpoints);
    EXPECT_THROW(StringRange(U"a", U"b", nullptr), core::ConfigurationConflict);
}

TEST(SymbolRange, bounds_exclude_endpoints) {
    EXPECT_EQ(collect(StringRange(U"a", U"c", lowercase(), Bounds::open)), (std::vector<std::u32string>{U"b"}));
    EXPECT_EQ(collect(StringRange(U"a", U"c", lowercase(), Bounds::left_open)),
              (std::vector<std::u32string>{U"b", U"c"}));
    EXPECT_EQ(collect(StringRange(U"a", U"c", lowercase(), Bounds::right_open)),
              (std::vector<std::u32string>{U"a", U"b"}));
    EXPECT_EQ(collect(StringRange(U"z", U"ab", lowercase(), Bounds::open)), (std::vector<std::u32string>{U"aa"}));
}

TEST(SymbolRange, bounds_can_leave_nothing) {
    const StringRange same(U"a", U"a", lowercase(), Bounds::open);
    EXPECT_TRUE(same.empty());
    EXPECT_EQ(same.size(), 0u);
    EXPECT_FALSE(same.first().has_value());
    EXPECT_TRUE(collect(same).empty());
    EXPECT_TRUE(collect_reversed(same).empty());

    const StringRange neighbours(U"z", U"aa", lowercase(), Bounds::open);
    EXPECT_TRUE(neighbours.empty());

    EXPECT_EQ(StringRange(U"a", U"a", lowercase(), Bounds::right_open).size(), 0u);
    EXPECT_EQ(StringRange(U"a", U"a", lowercase(), Bounds::left_open).size(), 0u);
}

TEST(SymbolRange, keeps_endpoints_and_bounds) {
    const StringRange range(U"a", U"c", lowercase(), Bounds::left_open);
    EXPECT_EQ(range.from(), U"a");
    EXPECT_EQ(range.to(), U"c");
    EXPECT_EQ(range.bounds(), Bounds::left_open);
    EXPECT_EQ(range.map().get(), lowercase().get());
    EXPECT_EQ(range.first(), U"b");
    EXPECT_EQ(range.last(), U"c");
}

TEST(SymbolRange, iteration_is_restartable) {
    const StringRange range(U"x", U"ac", lowercase());
    const auto once = collect(range);
    const auto twice = collect(range);

    EXPECT_EQ(once, twice);
    EXPECT_EQ(once.size(), range.size());
}

TEST(SymbolRange, reverse_iteration_mirrors_forward) {
    const StringRange range(U"y", U"ab", lowercase());
    EXPECT_EQ(collect_reversed(range), (std::vector<std::u32string>{U"ab", U"aa", U"z", U"y"}));

    const StringRange wide(U"7", U"12", digits(), Bounds::open);
    auto forward = collect(wide);
    const auto backward = collect_reversed(wide);
    std::reverse(forward.begin(), forward.end());
    EXPECT_EQ(forward, backward);
}

TEST(SymbolRange, at_jumps_without_enumerating) {
    const StringRange range(U"0", U"19", digits());
    EXPECT_EQ(range.at(0), U"0");
    EXPECT_EQ(range.at(10), U"00");
    EXPECT_EQ(range.at(29), U"19");
    EXPECT_THROW((void)range.at(30), core::IndexOutOfRange);

    const auto all = collect(range);
    for (std::size_t i = 0; i < all.size(); ++i) {
        EXPECT_EQ(range.at(i), all[i]);
    }
}

TEST(SymbolRange, position_of_is_inverse_of_at) {
    const StringRange range(U"x", U"bz", lowercase(), Bounds::left_open);

    EXPECT_EQ(range.position_of(U"y"), 0u);
    EXPECT_EQ(range.position_of(U"aa"), 2u);
    for (std::uint64_t n = 0; n < range.size(); ++n) {
        EXPECT_EQ(range.position_of(range.at(n)), n);
    }

    EXPECT_FALSE(range.contains(U"x"));
    EXPECT_FALSE(range.contains(U"ca"));
    EXPECT_FALSE(range.contains(U"A"));
    EXPECT_THROW((void)range.position_of(U"x"), core::InvalidEndpoints);
}

TEST(SymbolRange, works_over_lazy_maps) {
    const StringRange range(U"😀", U"😂", prebuilt::unicode());
    EXPECT_EQ(collect(range), (std::vector<std::u32string>{U"😀", U"😁", U"😂"}));

    // после последнего символа карты идут строки из двух символов, начиная с нулевого
    const std::u32string zero_zero(2, U'\0');
    const std::u32string zero_one{U'\0', U'\x01'};
    const StringRange wide(U"\U0010FFFF", zero_one, prebuilt::unicode());
    EXPECT_EQ(collect(wide), (std::vector<std::u32string>{U"\U0010FFFF", zero_zero, zero_one}));
}

TEST(SymbolRange, huge_lengths_report_overflow) {
    // 0x110000^4 уже не помещается в 64 бита
    const StringRange range(U"a", U"aaaaa", prebuilt::unicode());

    EXPECT_THROW((void)range.size(), core::LengthOverflow);
    EXPECT_EQ(range.first(), U"a");
    EXPECT_EQ(*range.begin(), U"a");

    const StringRange fits(U"a", U"aaa", prebuilt::unicode());
    EXPECT_NO_THROW((void)fits.size());
}

TEST(SymbolRange, long_endpoints_with_few_elements) {
    // значения концов больше 2^64, сам диапазон короткий
    const StringRange decimal(U"99999999999999999998", U"99999999999999999999", digits());
    EXPECT_EQ(decimal.size(), 2u);
    EXPECT_EQ(collect(decimal).size(), 2u);
    EXPECT_EQ(decimal.at(1), U"99999999999999999999");
    EXPECT_EQ(decimal.position_of(U"99999999999999999999"), 1u);

    const StringRange letters(U"zzzzzzzzzzzzzz", U"aaaaaaaaaaaaaab", lowercase());
    EXPECT_EQ(letters.size(), 3u);
    EXPECT_EQ(collect(letters),
              (std::vector<std::u32string>{U"zzzzzzzzzzzzzz", U"aaaaaaaaaaaaaaa", U"aaaaaaaaaaaaaab"}));
    EXPECT_EQ(letters.at(2), U"aaaaaaaaaaaaaab");
    EXPECT_EQ(letters.position_of(U"aaaaaaaaaaaaaaa"), 1u);
    EXPECT_THROW((void)letters.at(3), core::IndexOutOfRange);

    const StringRange codepoints(U"aaaa", U"aaab", prebuilt::unicode());
    EXPECT_EQ(codepoints.size(), 2u);
    EXPECT_EQ(codepoints.at(1), U"aaab");
}

TEST(SymbolRange, long_endpoints_across_widths) {
    const std::u32string nines(20, U'9');
    const std::u32string zeros(21, U'0');
    const StringRange range(nines, zeros, digits(), Bounds::closed);

    EXPECT_EQ(range.size(), 2u);
    EXPECT_EQ(range.at(1), zeros);
    EXPECT_EQ(collect_reversed(range), (std::vector<std::u32string>{zeros, nines}));

    std::u32string before_nines = nines;
    before_nines.back() = U'7';
    EXPECT_EQ(StringRange(before_nines, zeros, digits(), Bounds::open).size(), 2u);
}

TEST(SymbolRange, at_works_when_size_overflows) {
    const StringRange range(U"a", U"aaaaa", prebuilt::unicode());
    ASSERT_THROW((void)range.size(), core::LengthOverflow);

    EXPECT_EQ(range.at(1), U"b");
    // после U+10FFFF идёт первая строка длины 2
    const std::uint64_t to_width_two = 0x10FFFF - 0x61 + 1;
    EXPECT_EQ(range.at(to_width_two), std::u32string(2, U'\0'));
    EXPECT_EQ(range.position_of(std::u32string(2, U'\0')), to_width_two);
}
