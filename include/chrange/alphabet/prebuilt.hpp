#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string_view>
#include <vector>

#include <chrange/alphabet/index_map.hpp>
#include <chrange/alphabet/interval.hpp>
#include <chrange/core/errors.hpp>

namespace chrange::alphabet {

/**
 * @brief Готовые алфавиты.
 *
 * Каждая карта строится один раз при первом обращении (статическая
 * переменная функции, потокобезопасная инициализация) и дальше только
 * читается. Для ядра это обычные карты, построенные публичным конструктором.
 */
namespace prebuilt {

/// Функции поиска для больших алфавитов: O(1) арифметика по коду.
namespace lookup {

[[nodiscard]] inline std::size_t offset_index(std::uint32_t codepoint, std::uint32_t first) noexcept {
    // до first -> переполнение size_t, IndexMap отклонит такой индекс как InvalidIndex
    return static_cast<std::size_t>(codepoint) - first;
}

[[nodiscard]] inline std::size_t character_identity_index(char32_t c) { return offset_index(c, 0); }
[[nodiscard]] inline char32_t character_identity_symbol(std::size_t i) {
    return core::from_codepoint<char32_t>(i);
}

[[nodiscard]] inline std::size_t non_ascii_index(char32_t c) { return offset_index(c, 0x100); }
[[nodiscard]] inline char32_t non_ascii_symbol(std::size_t i) {
    return core::from_codepoint<char32_t>(static_cast<std::uint64_t>(i) + 0x100);
}

[[nodiscard]] inline std::size_t byte_identity_index(std::uint8_t b) { return b; }
[[nodiscard]] inline std::uint8_t byte_identity_symbol(std::size_t i) {
    return core::from_codepoint<std::uint8_t>(i);
}

}  // namespace lookup

namespace detail {

template <core::SymbolLike S>
[[nodiscard]] Interval<S> span(std::uint32_t first, std::uint32_t last) {
    return Interval<S>::from_codepoints(first, last);
}

template <core::SymbolLike S>
[[nodiscard]] std::vector<Interval<S>> join(std::vector<Interval<S>> a, const std::vector<Interval<S>>& b) {
    a.insert(a.end(), b.begin(), b.end());
    return a;
}

template <core::SymbolLike S> [[nodiscard]] std::vector<Interval<S>> lowercase() { return {span<S>('a', 'z')}; }
template <core::SymbolLike S> [[nodiscard]] std::vector<Interval<S>> uppercase() { return {span<S>('A', 'Z')}; }
template <core::SymbolLike S> [[nodiscard]] std::vector<Interval<S>> digits() { return {span<S>('0', '9')}; }

template <core::SymbolLike S>
[[nodiscard]] std::shared_ptr<const IndexMap<S>> make(std::vector<Interval<S>> intervals) {
    return std::make_shared<const IndexMap<S>>(std::move(intervals));
}

}  // namespace detail

// Общие для символов и байтов алфавиты.

template <core::SymbolLike S>
[[nodiscard]] const std::shared_ptr<const IndexMap<S>>& ascii_lowercase() {
    static const auto map = detail::make<S>(detail::lowercase<S>());
    return map;
}

template <core::SymbolLike S>
[[nodiscard]] const std::shared_ptr<const IndexMap<S>>& ascii_uppercase() {
    static const auto map = detail::make<S>(detail::uppercase<S>());
    return map;
}

template <core::SymbolLike S>
[[nodiscard]] const std::shared_ptr<const IndexMap<S>>& ascii_letters() {
    static const auto map = detail::make<S>(detail::join<S>(detail::lowercase<S>(), detail::uppercase<S>()));
    return map;
}

template <core::SymbolLike S>
[[nodiscard]] const std::shared_ptr<const IndexMap<S>>& ascii_digits() {
    static const auto map = detail::make<S>(detail::digits<S>());
    return map;
}

template <core::SymbolLike S>
[[nodiscard]] const std::shared_ptr<const IndexMap<S>>& lowercase_hex_digits() {
    static const auto map = detail::make<S>(detail::join<S>(detail::digits<S>(), {detail::span<S>('a', 'f')}));
    return map;
}

template <core::SymbolLike S>
[[nodiscard]] const std::shared_ptr<const IndexMap<S>>& uppercase_hex_digits() {
    static const auto map = detail::make<S>(detail::join<S>(detail::digits<S>(), {detail::span<S>('A', 'F')}));
    return map;
}

template <core::SymbolLike S>
[[nodiscard]] const std::shared_ptr<const IndexMap<S>>& lowercase_base_36() {
    static const auto map = detail::make<S>(detail::join<S>(detail::digits<S>(), detail::lowercase<S>()));
    return map;
}

template <core::SymbolLike S>
[[nodiscard]] const std::shared_ptr<const IndexMap<S>>& uppercase_base_36() {
    static const auto map = detail::make<S>(detail::join<S>(detail::digits<S>(), detail::uppercase<S>()));
    return map;
}

// Ленивые алфавиты.

[[nodiscard]] inline const std::shared_ptr<const CharacterMap>& character_ascii() {
    static const auto map = std::make_shared<const CharacterMap>(
        std::vector<CharacterInterval>{detail::span<char32_t>(0x00, 0xFF)}, &lookup::character_identity_index,
        &lookup::character_identity_symbol);
    return map;
}

[[nodiscard]] inline const std::shared_ptr<const CharacterMap>& non_ascii() {
    static const auto map = std::make_shared<const CharacterMap>(
        std::vector<CharacterInterval>{detail::span<char32_t>(0x100, 0x10FFFF)}, &lookup::non_ascii_index,
        &lookup::non_ascii_symbol);
    return map;
}

[[nodiscard]] inline const std::shared_ptr<const CharacterMap>& unicode() {
    static const auto map = std::make_shared<const CharacterMap>(
        std::vector<CharacterInterval>{detail::span<char32_t>(0x00, 0x10FFFF)}, &lookup::character_identity_index,
        &lookup::character_identity_symbol);
    return map;
}

[[nodiscard]] inline const std::shared_ptr<const ByteMap>& byte_ascii() {
    static const auto map = std::make_shared<const ByteMap>(
        std::vector<ByteInterval>{detail::span<std::uint8_t>(0x00, 0xFF)}, &lookup::byte_identity_index,
        &lookup::byte_identity_symbol);
    return map;
}

// Реестр по имени.

inline constexpr std::array<std::string_view, 11> character_map_names{
    "ascii_lowercase",      "ascii_uppercase",   "ascii_letters",     "ascii_digits",
    "lowercase_hex_digits", "uppercase_hex_digits", "lowercase_base_36", "uppercase_base_36",
    "ascii",                "non_ascii",         "unicode",
};

inline constexpr std::array<std::string_view, 9> byte_map_names{
    "ascii_lowercase",      "ascii_uppercase",      "ascii_letters",     "ascii_digits",
    "lowercase_hex_digits", "uppercase_hex_digits", "lowercase_base_36", "uppercase_base_36",
    "ascii",
};

namespace detail {

template <core::SymbolLike S>
[[nodiscard]] const std::shared_ptr<const IndexMap<S>>* common(std::string_view name) {
    if (name == "ascii_lowercase") return &ascii_lowercase<S>();
    if (name == "ascii_uppercase") return &ascii_uppercase<S>();
    if (name == "ascii_letters") return &ascii_letters<S>();
    if (name == "ascii_digits") return &ascii_digits<S>();
    if (name == "lowercase_hex_digits") return &lowercase_hex_digits<S>();
    if (name == "uppercase_hex_digits") return &uppercase_hex_digits<S>();
    if (name == "lowercase_base_36") return &lowercase_base_36<S>();
    if (name == "uppercase_base_36") return &uppercase_base_36<S>();
    return nullptr;
}

}  // namespace detail

/**
 * @brief Готовая символьная карта по имени.
 *
 * @throws NoSuchPrebuiltMap если имени нет в @ref character_map_names.
 */
[[nodiscard]] inline const std::shared_ptr<const CharacterMap>& character_map(std::string_view name) {
    if (const auto* found = detail::common<char32_t>(name)) return *found;
    if (name == "ascii") return character_ascii();
    if (name == "non_ascii") return non_ascii();
    if (name == "unicode") return unicode();
    core::raise<core::NoSuchPrebuiltMap>("no such prebuilt character map: '{}'", name);
}

/**
 * @brief Готовая байтовая карта по имени.
 *
 * @throws NoSuchPrebuiltMap если имени нет в @ref byte_map_names.
 */
[[nodiscard]] inline const std::shared_ptr<const ByteMap>& byte_map(std::string_view name) {
    if (const auto* found = detail::common<std::uint8_t>(name)) return *found;
    if (name == "ascii") return byte_ascii();
    core::raise<core::NoSuchPrebuiltMap>("no such prebuilt byte map: '{}'", name);
}

}  // namespace prebuilt

}  // namespace chrange::alphabet
