#pragma once

#include <algorithm>
#include <compare>
#include <cstddef>
#include <vector>

#include <chrange/core/checked.hpp>
#include <chrange/core/errors.hpp>

namespace chrange::search {

/**
 * @brief Счётчик переменной длины в системе счисления с основанием base ("одометр").
 *
 * Цифры счётчика являются индексами символов алфавита. В отличие от обычного числа, при
 * переполнении старшего разряда счётчик не обнуляется, а становится на
 * разряд длиннее (все нули):
 *
 *   base = 2:  [0, 0] -> [0, 1] -> [1, 0] -> [1, 1] -> [0, 0, 0]
 *
 * Так перечисляются строки алфавита: сначала все строки длины 1, затем
 * длины 2 и т.д. ("zz" -> "aaa" для base = 26).
 *
 * Порядок: счётчик с меньшим числом разрядов всегда меньше; при равном
 * числе разрядов сравниваются значения.
 */
class PositionalCounter {
   public:
    using digit_type = std::size_t;

    /**
     * @brief Построить счётчик.
     *
     * @param digits Разряды, старший первым (в порядке символов строки).
     * @param base   Основание (мощность алфавита).
     *
     * @throws EmptyDigitSequence если digits пуст.
     * @throws InvalidBase        если base < 1.
     * @throws IndexOutOfRange    если какой-то разряд >= base.
     */
    PositionalCounter(const std::vector<digit_type>& digits, std::size_t base) : radix(base) {
        if (digits.empty()) {
            core::raise<core::EmptyDigitSequence>("list of digits must not be empty");
        }
        if (base < 1) {
            core::raise<core::InvalidBase>("expected a positive base, got {}", base);
        }
        for (const digit_type d : digits) {
            if (d >= base) {
                core::raise<core::IndexOutOfRange>("digit {} is out of range for base {}", d, base);
            }
        }
        // хранится младший разряд первым
        inverted.assign(digits.rbegin(), digits.rend());
    }

    [[nodiscard]] std::size_t base() const noexcept { return radix; }

    [[nodiscard]] std::size_t digit_count() const noexcept { return inverted.size(); }

    /// Разряды, старший первым.
    [[nodiscard]] std::vector<digit_type> digits() const { return {inverted.rbegin(), inverted.rend()}; }

    /// Разряд по позиции (0 = старший).
    [[nodiscard]] digit_type operator[](std::size_t position) const noexcept {
        return inverted[inverted.size() - 1 - position];
    }

    /**
     * @brief Значение счётчика как числа в системе с основанием base().
     *
     * @throws LengthOverflow если значение не помещается в 64 бита.
     */
    [[nodiscard]] core::count_type to_integer() const {
        core::count_type total = 0;
        for (auto it = inverted.rbegin(); it != inverted.rend(); ++it) {
            total = core::checked_add(core::checked_mul(total, radix), *it);
        }
        return total;
    }

    /**
     * @brief Прибавить единицу (префиксная семантика: возвращает изменённый счётчик).
     *
     * Перенос идёт от младшего разряда к старшему; переполнение старшего
     * добавляет новый нулевой разряд.
     */
    PositionalCounter& increment() {
        for (auto& digit : inverted) {
            if (++digit < radix) return *this;
            digit = 0;  // перенос
        }
        inverted.push_back(0);
        return *this;
    }

    /**
     * @brief Вычесть единицу; точная обратная операция к increment().
     *
     * Счётчик из одних нулей длины w > 1 становится счётчиком длины w - 1
     * из одних (base - 1).
     *
     * @throws IndexOutOfRange для счётчика [0] (наименьшего значения).
     */
    PositionalCounter& decrement() {
        for (auto& digit : inverted) {
            if (digit > 0) {
                --digit;
                return *this;
            }
            digit = radix - 1;  // заём
        }

        if (inverted.size() == 1) {
            inverted.front() = 0;
            core::raise<core::IndexOutOfRange>("cannot decrement the smallest counter");
        }
        inverted.pop_back();
        return *this;
    }

    [[nodiscard]] bool operator==(const PositionalCounter& other) const noexcept {
        return radix == other.radix && inverted == other.inverted;
    }

    [[nodiscard]] std::strong_ordering operator<=>(const PositionalCounter& other) const noexcept {
        if (const auto by_width = inverted.size() <=> other.inverted.size(); by_width != 0) return by_width;
        // равная длина: лексикографически от старшего разряда
        return std::lexicographical_compare_three_way(inverted.rbegin(), inverted.rend(), other.inverted.rbegin(),
                                                      other.inverted.rend());
    }

   private:
    std::vector<digit_type> inverted;
    std::size_t radix;
};

}  // namespace chrange::search
