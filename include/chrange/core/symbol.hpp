#pragma once

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

#include <fmt/format.h>

#include <chrange/core/errors.hpp>

namespace chrange::core {

/// Вид символа алфавита.
enum class SymbolKind { character, byte };

/// Строка байтов (аналог std::u32string для символов-байтов).
using ByteString = std::vector<std::uint8_t>;

/**
 * @brief Свойства вида символа.
 *
 * Определены ровно две специализации:
 *  - `char32_t`: скалярное значение Unicode (0..0x10FFFF), строки `std::u32string`;
 *  - `std::uint8_t`: байт (0..0xFF), строки @ref ByteString.
 *
 * @tparam S Тип символа.
 */
template <typename S>
struct SymbolTraits;

template <>
struct SymbolTraits<char32_t> {
    using string_type = std::u32string;
    static constexpr SymbolKind kind = SymbolKind::character;
    static constexpr std::uint32_t max_codepoint = 0x10FFFF;
    static constexpr std::string_view name = "character";

    [[nodiscard]] static std::string describe(char32_t s) {
        return fmt::format("U+{:04X}", static_cast<std::uint32_t>(s));
    }
};

template <>
struct SymbolTraits<std::uint8_t> {
    using string_type = ByteString;
    static constexpr SymbolKind kind = SymbolKind::byte;
    static constexpr std::uint32_t max_codepoint = 0xFF;
    static constexpr std::string_view name = "byte";

    [[nodiscard]] static std::string describe(std::uint8_t s) {
        return fmt::format("0x{:02X}", static_cast<unsigned>(s));
    }
};

/**
 * @brief Концепт символа алфавита.
 *
 * Символом считается беззнаковое целое с определёнными SymbolTraits. Всё ядро
 * (Interval, IndexMap, SymbolRange) параметризовано этим концептом, поэтому
 * выбор между символами и байтами делается на этапе компиляции.
 */
template <typename S>
concept SymbolLike =
    std::is_unsigned_v<S> &&
    requires(S s) {
        typename SymbolTraits<S>::string_type;
        { SymbolTraits<S>::max_codepoint } -> std::convertible_to<std::uint32_t>;
        { SymbolTraits<S>::describe(s) } -> std::convertible_to<std::string>;
    };

static_assert(SymbolLike<char32_t>);
static_assert(SymbolLike<std::uint8_t>);

template <SymbolLike S>
using string_of = typename SymbolTraits<S>::string_type;

template <SymbolLike S>
[[nodiscard]] constexpr std::uint32_t to_codepoint(S s) noexcept {
    return static_cast<std::uint32_t>(s);
}

/// Является ли значение допустимым символом своего вида.
template <SymbolLike S>
[[nodiscard]] constexpr bool is_valid_symbol(S s) noexcept {
    return to_codepoint(s) <= SymbolTraits<S>::max_codepoint;
}

/**
 * @brief Символ по коду.
 *
 * @throws NotASymbol если код больше максимального для вида @p S.
 */
template <SymbolLike S>
[[nodiscard]] S from_codepoint(std::uint64_t codepoint) {
    if (codepoint > SymbolTraits<S>::max_codepoint) {
        raise<NotASymbol>("expected a {}, got codepoint 0x{:X}", SymbolTraits<S>::name, codepoint);
    }
    return static_cast<S>(codepoint);
}

/**
 * @brief Проверить, что строка состоит ровно из одного допустимого символа.
 *
 * @return Этот символ.
 * @throws NotASymbol иначе.
 */
template <SymbolLike S>
[[nodiscard]] S single_symbol(const string_of<S>& value) {
    if (value.size() != 1) {
        raise<NotASymbol>("expected a single {}, got a sequence of length {}", SymbolTraits<S>::name,
                          value.size());
    }
    if (!is_valid_symbol(value.front())) {
        raise<NotASymbol>("expected a {}, got {}", SymbolTraits<S>::name, SymbolTraits<S>::describe(value.front()));
    }
    return value.front();
}

/// Человекочитаемое описание строки символов для сообщений об ошибках.
template <SymbolLike S>
[[nodiscard]] std::string describe_string(const string_of<S>& value) {
    std::string out = "[";
    for (std::size_t i = 0; i < value.size(); ++i) {
        if (i != 0) out += ' ';
        out += SymbolTraits<S>::describe(value[i]);
    }
    out += ']';
    return out;
}

}  // namespace chrange::core
