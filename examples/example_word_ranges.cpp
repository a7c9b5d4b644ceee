#include <chrange/alphabet/index_map.hpp>
#include <chrange/alphabet/interval.hpp>
#include <chrange/alphabet/prebuilt.hpp>

#include <chrange/core/errors.hpp>
#include <chrange/core/log.hpp>

#include <chrange/search/character_range.hpp>

#include <cstddef>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>

namespace ex {

using chrange::alphabet::CharacterInterval;
using chrange::alphabet::CharacterMap;
using chrange::search::Bounds;
using chrange::search::StringRange;

// --- UTF-8 for std::cout ---
std::string utf8(const std::u32string& s) {
    std::string out;
    for (const char32_t c : s) {
        if (c < 0x80) {
            out += static_cast<char>(c);
        } else if (c < 0x800) {
            out += static_cast<char>(0xC0 | (c >> 6));
            out += static_cast<char>(0x80 | (c & 0x3F));
        } else if (c < 0x10000) {
            out += static_cast<char>(0xE0 | (c >> 12));
            out += static_cast<char>(0x80 | ((c >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (c & 0x3F));
        } else {
            out += static_cast<char>(0xF0 | (c >> 18));
            out += static_cast<char>(0x80 | ((c >> 12) & 0x3F));
            out += static_cast<char>(0x80 | ((c >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (c & 0x3F));
        }
    }
    return out;
}

void printHead(std::string_view title, const StringRange& range, std::size_t limit = 8) {
    std::cout << "  [" << title << "] size = " << range.size() << "\n    ";
    std::size_t shown = 0;
    for (const auto& s : range) {
        if (shown++ == limit) {
            std::cout << "...";
            break;
        }
        std::cout << utf8(s) << ' ';
    }
    std::cout << "\n";
}

}  // namespace ex

int main() {
    namespace prebuilt = chrange::alphabet::prebuilt;
    using chrange::search::character_range;
    using chrange::alphabet::CharacterInterval;
    using chrange::alphabet::CharacterMap;
    using chrange::search::Bounds;

    // SPDLOG_LEVEL=chrange=debug logs every error before it is thrown
    chrange::core::load_log_levels_from_env();

    std::cout << "Prebuilt maps:\n";
    const auto words = character_range(U"a", U"zz", prebuilt::ascii_lowercase<char32_t>());
    ex::printHead("a..zz", words);
    ex::printHead("0..19", character_range(U"0", U"19", prebuilt::ascii_digits<char32_t>()), 32);
    ex::printHead("ff..101 (hex, open)",
                  character_range(U"ff", U"101", prebuilt::lowercase_hex_digits<char32_t>(), Bounds::open));

    std::cout << "\nRandom access:\n";
    std::cout << "  words.at(26) = " << ex::utf8(words.at(26)) << "\n";
    std::cout << "  words.position_of(\"hi\") = " << words.position_of(U"hi") << "\n";

    std::cout << "\nReverse:\n    ";
    const auto tail = character_range(U"x", U"ab", prebuilt::ascii_lowercase<char32_t>());
    for (auto it = tail.rbegin(); it != tail.rend(); ++it) std::cout << ex::utf8(*it) << ' ';
    std::cout << "\n";

    // --- Custom maps ---
    std::cout << "\nCustom maps:\n";
    const auto vowels = std::make_shared<const CharacterMap>(CharacterMap{
        CharacterInterval(U'a'), CharacterInterval(U'e'), CharacterInterval(U'i'), CharacterInterval(U'o'),
        CharacterInterval(U'u')});
    ex::printHead("vowels a..uu", character_range(U"a", U"uu", vowels), 30);

    const auto greek = std::make_shared<const CharacterMap>(
        CharacterMap{CharacterInterval(U'α', U'ω')}.combine(CharacterInterval(U'Α', U'Ω')));
    ex::printHead("greek ω..αβ", character_range(U"ω", U"αβ", greek));

    ex::printHead("emoji (lazy unicode)", character_range(U"😀", U"😉", prebuilt::unicode()));

    // --- Errors ---
    std::cout << "\nErrors:\n";
    try {
        (void)character_range(U"b", U"a", prebuilt::ascii_lowercase<char32_t>());
    } catch (const chrange::core::Error& e) {
        std::cout << "  " << chrange::core::to_string(e.code()) << ": " << e.what() << "\n";
    }
    try {
        (void)character_range(U"a", U"Z", prebuilt::ascii_lowercase<char32_t>());
    } catch (const chrange::core::Error& e) {
        std::cout << "  " << chrange::core::to_string(e.code()) << ": " << e.what() << "\n";
    }
    try {
        (void)CharacterMap{CharacterInterval(U'a', U'z'), CharacterInterval(U'q')};
    } catch (const chrange::core::OverlappingIntervals& e) {
        std::cout << "  overlapping: " << e.what() << "\n";
    }

    return 0;
}
