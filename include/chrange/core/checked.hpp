#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>

#include <chrange/core/errors.hpp>

namespace chrange::core {

/// Тип для количеств и позиций внутри диапазона.
using count_type = std::uint64_t;

// Арифметика счётчиков с контролем переполнения: длины диапазонов растут
// как base^width и легко выходят за 64 бита (например, для всего Unicode).

[[nodiscard]] inline count_type checked_add(count_type a, count_type b) {
    if (a > std::numeric_limits<count_type>::max() - b) {
        raise<LengthOverflow>("{} + {} does not fit into 64 bits", a, b);
    }
    return a + b;
}

[[nodiscard]] inline count_type checked_mul(count_type a, count_type b) {
    if (a != 0 && b > std::numeric_limits<count_type>::max() / a) {
        raise<LengthOverflow>("{} * {} does not fit into 64 bits", a, b);
    }
    return a * b;
}

[[nodiscard]] inline count_type checked_pow(count_type base, std::size_t exponent) {
    count_type out = 1;
    for (std::size_t i = 0; i < exponent; ++i) out = checked_mul(out, base);
    return out;
}

}  // namespace chrange::core
