#pragma once

#include <stdexcept>
#include <string>
#include <utility>

#include <fmt/format.h>

#include <chrange/core/log.hpp>

namespace chrange::core {

/// Вид ошибки библиотеки.
enum class Errc {
    not_a_symbol,
    invalid_direction,
    no_intervals,
    configuration_conflict,
    overlapping_intervals,
    index_out_of_range,
    invalid_index,
    invalid_symbol,
    invalid_endpoints,
    symbol_not_found,
    empty_digit_sequence,
    invalid_base,
    kind_mismatch,
    no_such_prebuilt_map,
    length_overflow,
};

[[nodiscard]] constexpr const char* to_string(Errc code) noexcept {
    switch (code) {
        case Errc::not_a_symbol:           return "not a symbol";
        case Errc::invalid_direction:      return "invalid direction";
        case Errc::no_intervals:           return "no intervals";
        case Errc::configuration_conflict: return "configuration conflict";
        case Errc::overlapping_intervals:  return "overlapping intervals";
        case Errc::index_out_of_range:     return "index out of range";
        case Errc::invalid_index:          return "invalid index";
        case Errc::invalid_symbol:         return "invalid symbol";
        case Errc::invalid_endpoints:      return "invalid endpoints";
        case Errc::symbol_not_found:       return "symbol not found";
        case Errc::empty_digit_sequence:   return "empty digit sequence";
        case Errc::invalid_base:           return "invalid base";
        case Errc::kind_mismatch:          return "kind mismatch";
        case Errc::no_such_prebuilt_map:   return "no such prebuilt map";
        case Errc::length_overflow:        return "length overflow";
    }
    return "unknown error";
}

/**
 * @brief Базовое исключение библиотеки.
 *
 * Все ошибки детерминированы и зависят только от входных данных:
 * повторять вызов бессмысленно, ошибку нужно обработать у вызывающего.
 */
class Error : public std::runtime_error {
   public:
    Error(Errc code, const std::string& detail) : std::runtime_error(detail), errc(code) {}

    [[nodiscard]] Errc code() const noexcept { return errc; }

   private:
    Errc errc;
};

/**
 * @brief Исключение конкретного вида.
 *
 * Отдельный тип на каждый Errc позволяет ловить ровно одну ошибку:
 * `catch (const OverlappingIntervals&)`.
 */
template <Errc Code>
class CodedError final : public Error {
   public:
    static constexpr Errc code_value = Code;

    explicit CodedError(const std::string& detail) : Error(Code, detail) {}
};

using NotASymbol            = CodedError<Errc::not_a_symbol>;
using InvalidDirection      = CodedError<Errc::invalid_direction>;
using NoIntervals           = CodedError<Errc::no_intervals>;
using ConfigurationConflict = CodedError<Errc::configuration_conflict>;
using OverlappingIntervals  = CodedError<Errc::overlapping_intervals>;
using IndexOutOfRange       = CodedError<Errc::index_out_of_range>;
using InvalidIndex          = CodedError<Errc::invalid_index>;
using InvalidSymbol         = CodedError<Errc::invalid_symbol>;
using InvalidEndpoints      = CodedError<Errc::invalid_endpoints>;
using SymbolNotFound        = CodedError<Errc::symbol_not_found>;
using EmptyDigitSequence    = CodedError<Errc::empty_digit_sequence>;
using InvalidBase           = CodedError<Errc::invalid_base>;
using KindMismatch          = CodedError<Errc::kind_mismatch>;
using NoSuchPrebuiltMap     = CodedError<Errc::no_such_prebuilt_map>;
using LengthOverflow        = CodedError<Errc::length_overflow>;

/**
 * @brief Сформировать сообщение, записать его в debug-лог и бросить исключение E.
 *
 * @tparam E Тип исключения (один из CodedError<...>).
 */
template <typename E, typename... Args>
[[noreturn]] void raise(fmt::format_string<Args...> format, Args&&... args) {
    E error(fmt::format(format, std::forward<Args>(args)...));
    SPDLOG_LOGGER_DEBUG(logger(), "{}: {}", to_string(E::code_value), error.what());
    throw error;
}

}  // namespace chrange::core
