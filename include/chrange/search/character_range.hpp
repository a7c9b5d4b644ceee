#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <variant>

#include <chrange/alphabet/index_map.hpp>
#include <chrange/core/errors.hpp>
#include <chrange/core/symbol.hpp>
#include <chrange/search/symbol_range.hpp>

namespace chrange::search {

/**
 * @brief Диапазон строк символов: аналог range() для строк.
 *
 * @code
 * for (const auto& s : character_range(U"a", U"zz", prebuilt::ascii_lowercase<char32_t>())) { ... }
 * @endcode
 *
 * @throws см. SymbolRange::SymbolRange.
 */
[[nodiscard]] inline StringRange character_range(std::u32string start, std::u32string end,
                                                 std::shared_ptr<const alphabet::CharacterMap> map,
                                                 Bounds bounds = Bounds::closed) {
    return StringRange(std::move(start), std::move(end), std::move(map), bounds);
}

/// Диапазон строк байтов.
[[nodiscard]] inline BytesRange character_range(core::ByteString start, core::ByteString end,
                                                std::shared_ptr<const alphabet::ByteMap> map,
                                                Bounds bounds = Bounds::closed) {
    return BytesRange(std::move(start), std::move(end), std::move(map), bounds);
}

/// Конец диапазона неизвестного на этапе компиляции вида.
using Endpoint = std::variant<std::u32string, core::ByteString>;

/// Карта неизвестного на этапе компиляции вида.
using AnyMap = std::variant<std::shared_ptr<const alphabet::CharacterMap>, std::shared_ptr<const alphabet::ByteMap>>;

using AnyRange = std::variant<StringRange, BytesRange>;

namespace detail {

[[nodiscard]] inline const char* kind_name(const Endpoint& e) noexcept {
    return std::holds_alternative<std::u32string>(e) ? "character" : "byte";
}

[[nodiscard]] inline const char* kind_name(const AnyMap& m) noexcept {
    return m.index() == 0 ? "character" : "byte";
}

}  // namespace detail

/**
 * @brief Диапазон, вид которого (символы или байты) известен только во время выполнения.
 *
 * @throws KindMismatch если start, end и map не одного вида.
 */
[[nodiscard]] inline AnyRange character_range(Endpoint start, Endpoint end, AnyMap map,
                                              Bounds bounds = Bounds::closed) {
    if (start.index() != end.index() || start.index() != map.index()) {
        core::raise<core::KindMismatch>("expected endpoints and map of the same kind, got {}, {} and a {} map",
                                        detail::kind_name(start), detail::kind_name(end), detail::kind_name(map));
    }

    if (auto* chars = std::get_if<std::u32string>(&start)) {
        return AnyRange(std::in_place_index<0>, std::move(*chars), std::get<std::u32string>(std::move(end)),
                        std::get<0>(std::move(map)), bounds);
    }
    return AnyRange(std::in_place_index<1>, std::get<core::ByteString>(std::move(start)),
                    std::get<core::ByteString>(std::move(end)), std::get<1>(std::move(map)), bounds);
}

}  // namespace chrange::search
