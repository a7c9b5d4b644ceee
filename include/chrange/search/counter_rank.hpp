#pragma once

#include <cstddef>
#include <limits>
#include <optional>
#include <vector>

#include <chrange/core/checked.hpp>
#include <chrange/search/positional_counter.hpp>

namespace chrange::search {

/**
 * @brief Число строк, короче width символов: base^1 + ... + base^(width-1).
 *
 * @throws LengthOverflow при переполнении 64 бит.
 */
[[nodiscard]] inline core::count_type count_shorter(std::size_t base, std::size_t width) {
    core::count_type total = 0;
    core::count_type block = 1;
    for (std::size_t w = 1; w < width; ++w) {
        block = core::checked_mul(block, base);
        total = core::checked_add(total, block);
    }
    return total;
}

/**
 * @brief Сквозной номер счётчика среди всех строк алфавита.
 *
 * Строки упорядочены сначала по длине, затем по значению:
 *   rank([0]) = 0, rank([base-1]) = base-1, rank([0, 0]) = base, ...
 *
 * @throws LengthOverflow при переполнении 64 бит.
 */
[[nodiscard]] inline core::count_type counter_rank(const PositionalCounter& counter) {
    return core::checked_add(count_shorter(counter.base(), counter.digit_count()), counter.to_integer());
}

/**
 * @brief Обратное к counter_rank: счётчик по сквозному номеру.
 *
 * Сначала определяется длина (вычитаются блоки base^1, base^2, ...),
 * затем остаток раскладывается по разрядам, младший меняется быстрее всего.
 *
 * @param base Основание (>= 1).
 * @param rank Сквозной номер.
 */
[[nodiscard]] inline PositionalCounter counter_unrank(std::size_t base, core::count_type rank) {
    if (base < 1) {
        core::raise<core::InvalidBase>("expected a positive base, got {}", base);
    }

    std::size_t width = 1;
    core::count_type block = base;

    while (rank >= block) {
        rank -= block;
        ++width;
        // следующий блок больше любого 64-битного остатка -> длина найдена
        if (block > std::numeric_limits<core::count_type>::max() / base) break;
        block *= base;
    }

    std::vector<std::size_t> digits(width, 0);
    for (std::size_t i = width; i-- > 0;) {
        digits[i] = static_cast<std::size_t>(rank % base);
        rank /= base;
    }
    return PositionalCounter(digits, base);
}

namespace detail {

// Арифметика без исключений: nullopt, если результат не помещается в 64 бита.

[[nodiscard]] inline std::optional<core::count_type> add(std::optional<core::count_type> a,
                                                         std::optional<core::count_type> b) noexcept {
    if (!a || !b || *a > std::numeric_limits<core::count_type>::max() - *b) return std::nullopt;
    return *a + *b;
}

[[nodiscard]] inline std::optional<core::count_type> power(std::size_t base, std::size_t exponent) noexcept {
    core::count_type out = 1;
    for (std::size_t i = 0; i < exponent; ++i) {
        if (out > std::numeric_limits<core::count_type>::max() / base) return std::nullopt;
        out *= base;
    }
    return out;
}

/// Значение разрядов (старший первым) в системе с основанием base.
[[nodiscard]] inline std::optional<core::count_type> value_of(const std::vector<std::size_t>& digits,
                                                              std::size_t base) noexcept {
    core::count_type total = 0;
    for (const std::size_t d : digits) {
        if (total > std::numeric_limits<core::count_type>::max() / base) return std::nullopt;
        total *= base;
        if (total > std::numeric_limits<core::count_type>::max() - d) return std::nullopt;
        total += d;
    }
    return total;
}

/// Число шагов до последнего счётчика той же длины: (base^w - 1) - value(counter).
[[nodiscard]] inline std::optional<core::count_type> steps_to_width_end(const PositionalCounter& counter) noexcept {
    std::vector<std::size_t> complement(counter.digit_count());
    for (std::size_t i = 0; i < complement.size(); ++i) complement[i] = counter.base() - 1 - counter[i];
    return value_of(complement, counter.base());
}

}  // namespace detail

/**
 * @brief Число шагов increment() от @p from до @p to, без исключений.
 *
 * Абсолютные значения счётчиков не вычисляются: при равной длине разряды
 * вычитаются с заёмом, при разной длине складываются хвост длины from,
 * полные промежуточные длины и начало длины to. Каждое слагаемое не
 * больше результата, поэтому переполнение слагаемого означает
 * переполнение результата.
 *
 * @pre from <= to, одинаковое основание.
 * @return nullopt, если расстояние не помещается в 64 бита.
 */
[[nodiscard]] inline std::optional<core::count_type> try_counter_distance(const PositionalCounter& from,
                                                                          const PositionalCounter& to) {
    const std::size_t base = from.base();
    const std::size_t ws = from.digit_count();
    const std::size_t we = to.digit_count();

    if (ws == we) {
        std::vector<std::size_t> diff(ws);
        std::size_t borrow = 0;
        for (std::size_t i = ws; i-- > 0;) {
            const std::size_t subtrahend = from[i] + borrow;
            if (to[i] >= subtrahend) {
                diff[i] = to[i] - subtrahend;
                borrow = 0;
            } else {
                diff[i] = to[i] + base - subtrahend;
                borrow = 1;
            }
        }
        return detail::value_of(diff, base);
    }

    // хвост длины ws после from + все строки длин ws+1..we-1 + строки длины we до to включительно
    std::optional<core::count_type> total = detail::steps_to_width_end(from);
    for (std::size_t w = ws + 1; w < we && total; ++w) total = detail::add(total, detail::power(base, w));
    total = detail::add(total, detail::value_of(to.digits(), base));
    return detail::add(total, 1);
}

/**
 * @brief Число шагов increment() от @p from до @p to.
 *
 * @throws LengthOverflow если расстояние не помещается в 64 бита.
 */
[[nodiscard]] inline core::count_type counter_distance(const PositionalCounter& from, const PositionalCounter& to) {
    const auto distance = try_counter_distance(from, to);
    if (!distance) {
        core::raise<core::LengthOverflow>(
            "distance between counters of widths {} and {} (base {}) does not fit into 64 bits", from.digit_count(),
            to.digit_count(), from.base());
    }
    return *distance;
}

/**
 * @brief Счётчик через @p steps шагов increment() после @p counter.
 *
 * Шаги прибавляются к разрядам с переносом; если перенос выходит за
 * старший разряд, остаток шагов переносится на следующую длину.
 */
[[nodiscard]] inline PositionalCounter counter_advance(const PositionalCounter& counter, core::count_type steps) {
    const std::size_t base = counter.base();
    if (base == 1) {
        // одна строка на каждую длину
        return PositionalCounter(std::vector<std::size_t>(counter.digit_count() + steps, 0), base);
    }

    std::vector<std::size_t> digits = counter.digits();
    while (true) {
        const auto room = detail::steps_to_width_end(PositionalCounter(digits, base));
        if (!room || steps <= *room) break;
        steps -= *room + 1;
        digits.assign(digits.size() + 1, 0);
    }

    core::count_type carry = steps;
    for (std::size_t i = digits.size(); i-- > 0 && carry != 0;) {
        const core::count_type sum = digits[i] + carry % base;
        carry = carry / base + sum / base;
        digits[i] = static_cast<std::size_t>(sum % base);
    }
    return PositionalCounter(digits, base);
}

}  // namespace chrange::search
