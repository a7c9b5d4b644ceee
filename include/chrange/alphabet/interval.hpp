#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <iterator>

#include <chrange/core/errors.hpp>
#include <chrange/core/symbol.hpp>

namespace chrange::alphabet {

/**
 * @brief Непрерывный интервал символов [start, end] (оба конца включительно).
 *
 * Представляет набор символов:
 *   start, start + 1, ..., end
 * в порядке их кодов. Является строительным блоком алфавита (@ref IndexMap).
 *
 * Интервал неизменяем. Равенство и хеш определяются парой кодов концов.
 *
 * @tparam S Тип символа (char32_t или std::uint8_t).
 */
template <core::SymbolLike S>
class Interval {
   public:
    using value_type = S;

    /// Ленивый обход символов интервала (forward iterator по кодам).
    class iterator {
       public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = S;
        using difference_type = std::ptrdiff_t;
        using pointer = void;
        using reference = S;

        iterator() = default;
        explicit iterator(std::uint32_t codepoint) noexcept : current(codepoint) {}

        [[nodiscard]] S operator*() const noexcept { return static_cast<S>(current); }

        iterator& operator++() noexcept {
            ++current;
            return *this;
        }

        iterator operator++(int) noexcept {
            iterator copy = *this;
            ++current;
            return copy;
        }

        [[nodiscard]] bool operator==(const iterator&) const noexcept = default;

       private:
        // uint32_t, а не S: для байтового интервала ...-0xFF конец равен 0x100.
        std::uint32_t current{0};
    };

    /**
     * @brief Построить интервал по двум символам.
     *
     * @throws NotASymbol       если конец не является допустимым символом вида @p S.
     * @throws InvalidDirection если start > end.
     */
    constexpr Interval(S start, S end) : lo(start), hi(end) {
        if (!core::is_valid_symbol(start)) {
            core::raise<core::NotASymbol>("expected a {}, got {}", core::SymbolTraits<S>::name,
                                          core::SymbolTraits<S>::describe(start));
        }
        if (!core::is_valid_symbol(end)) {
            core::raise<core::NotASymbol>("expected a {}, got {}", core::SymbolTraits<S>::name,
                                          core::SymbolTraits<S>::describe(end));
        }
        if (start > end) {
            core::raise<core::InvalidDirection>("interval end must not precede its start, got {} > {}",
                                                core::SymbolTraits<S>::describe(start),
                                                core::SymbolTraits<S>::describe(end));
        }
    }

    /// Интервал из одного символа.
    explicit constexpr Interval(S only) : Interval(only, only) {}

    /**
     * @brief Построить интервал по двум строкам из одного символа каждая.
     *
     * @throws NotASymbol если строка не содержит ровно один символ.
     */
    [[nodiscard]] static Interval from_strings(const core::string_of<S>& start, const core::string_of<S>& end) {
        return Interval(core::single_symbol<S>(start), core::single_symbol<S>(end));
    }

    /**
     * @brief Построить интервал по кодам концов.
     *
     * @throws NotASymbol если код вне диапазона вида @p S.
     */
    [[nodiscard]] static Interval from_codepoints(std::uint64_t start, std::uint64_t end) {
        return Interval(core::from_codepoint<S>(start), core::from_codepoint<S>(end));
    }

    [[nodiscard]] constexpr S first() const noexcept { return lo; }
    [[nodiscard]] constexpr S last() const noexcept { return hi; }

    /// Количество символов: code(end) - code(start) + 1.
    [[nodiscard]] constexpr std::size_t size() const noexcept {
        return static_cast<std::size_t>(core::to_codepoint(hi) - core::to_codepoint(lo)) + 1;
    }

    [[nodiscard]] constexpr bool contains(S s) const noexcept { return lo <= s && s <= hi; }

    /**
     * @brief i-й символ интервала, O(1).
     *
     * @warning Не выполняет проверку границ; см. at().
     */
    [[nodiscard]] constexpr S operator[](std::size_t i) const noexcept {
        return static_cast<S>(core::to_codepoint(lo) + static_cast<std::uint32_t>(i));
    }

    /**
     * @brief i-й символ интервала с проверкой границ.
     *
     * @throws IndexOutOfRange если i >= size().
     */
    [[nodiscard]] S at(std::size_t i) const {
        if (i >= size()) {
            core::raise<core::IndexOutOfRange>("index {} is out of range for an interval of size {}", i, size());
        }
        return (*this)[i];
    }

    [[nodiscard]] iterator begin() const noexcept { return iterator(core::to_codepoint(lo)); }
    [[nodiscard]] iterator end() const noexcept { return iterator(core::to_codepoint(hi) + 1); }

    /// Пересекаются ли интервалы на оси кодов.
    [[nodiscard]] constexpr bool intersects(const Interval& other) const noexcept {
        return std::max(lo, other.lo) <= std::min(hi, other.hi);
    }

    [[nodiscard]] constexpr bool operator==(const Interval&) const noexcept = default;

   private:
    S lo;
    S hi;
};

using CharacterInterval = Interval<char32_t>;
using ByteInterval = Interval<std::uint8_t>;

}  // namespace chrange::alphabet

template <chrange::core::SymbolLike S>
struct std::hash<chrange::alphabet::Interval<S>> {
    [[nodiscard]] std::size_t operator()(const chrange::alphabet::Interval<S>& interval) const noexcept {
        const auto a = static_cast<std::size_t>(chrange::core::to_codepoint(interval.first()));
        const auto b = static_cast<std::size_t>(chrange::core::to_codepoint(interval.last()));
        return a * 0x110001u + b;
    }
};
