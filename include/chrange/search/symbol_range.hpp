#pragma once

#include <cstddef>
#include <iterator>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

#include <chrange/alphabet/index_map.hpp>
#include <chrange/core/checked.hpp>
#include <chrange/core/errors.hpp>
#include <chrange/core/symbol.hpp>
#include <chrange/search/counter_rank.hpp>
#include <chrange/search/positional_counter.hpp>

namespace chrange::search {

/**
 * @brief Какие концы диапазона включаются.
 *
 * | Bounds     | from | to  |
 * |------------|------|-----|
 * | closed     | да   | да  |
 * | open       | нет  | нет |
 * | left_open  | нет  | да  |
 * | right_open | да   | нет |
 */
enum class Bounds { closed, open, left_open, right_open };

/**
 * @brief Диапазон строк алфавита между двумя концами.
 *
 * Элементы диапазона: строки над алфавитом @p map, упорядоченные сначала по длине,
 * затем поразрядно по индексам карты (не по кодам символов):
 *
 *   ("a", "c", ascii_lowercase)  -> a, b, c
 *   ("0", "19", ascii_digits)    -> 0..9, 00..09, 10..19
 *
 * Перебор ленивый и перезапускаемый: каждый begin() создаёт новый курсор
 * со своим PositionalCounter. Длина считается по формуле, без перебора.
 *
 * Диапазон неизменяем; карта разделяется (std::shared_ptr<const IndexMap>).
 *
 * @tparam S Тип символа (char32_t или std::uint8_t).
 */
template <core::SymbolLike S>
class SymbolRange {
   public:
    using symbol_type = S;
    using value_type = core::string_of<S>;
    using map_type = alphabet::IndexMap<S>;

    /**
     * @brief Курсор перебора.
     *
     * @tparam Reverse false: от from() к to() через increment(),
     *                 true: от to() к from() через decrement().
     */
    template <bool Reverse>
    class basic_iterator {
       public:
        using iterator_concept = std::input_iterator_tag;
        using value_type = SymbolRange::value_type;
        using difference_type = std::ptrdiff_t;

        basic_iterator() = default;

        [[nodiscard]] const value_type& operator*() const noexcept { return current; }

        basic_iterator& operator++() {
            advance();
            return *this;
        }

        void operator++(int) { advance(); }

        [[nodiscard]] bool operator==(std::default_sentinel_t) const noexcept { return !cursor.has_value(); }

       private:
        friend class SymbolRange;

        const SymbolRange* owner{nullptr};
        std::optional<PositionalCounter> cursor;
        value_type current{};

        explicit basic_iterator(const SymbolRange& range) : owner(&range) {
            if (range.empty()) return;
            cursor = Reverse ? *range.back : *range.front;
            current = range.render(*cursor);
        }

        void advance() {
            if (!cursor) return;

            if constexpr (Reverse) {
                if (*cursor == *owner->front) {
                    cursor.reset();
                    return;
                }
                cursor->decrement();
            } else {
                cursor->increment();
                if (*cursor > *owner->back) {
                    cursor.reset();
                    return;
                }
            }
            current = owner->render(*cursor);
        }
    };

    using iterator = basic_iterator<false>;
    using reverse_iterator = basic_iterator<true>;

    /**
     * @brief Построить диапазон.
     *
     * @param from   Начальный конец (непустая строка символов карты).
     * @param to     Конечный конец.
     * @param map    Алфавит.
     * @param bounds Какие концы включать (по умолчанию оба).
     *
     * @throws ConfigurationConflict если map == nullptr.
     * @throws InvalidEndpoints      если конец пуст или содержит символ вне карты.
     * @throws InvalidDirection      если from идёт после to.
     */
    SymbolRange(value_type from, value_type to, std::shared_ptr<const map_type> map, Bounds bounds = Bounds::closed)
        : lower(std::move(from)), upper(std::move(to)), index_map(std::move(map)), bound_kind(bounds) {
        if (!index_map) {
            core::raise<core::ConfigurationConflict>("a range requires an index map");
        }
        if (!spelled_in_map(lower) || !spelled_in_map(upper)) {
            core::raise<core::InvalidEndpoints>("endpoints must be non-empty and spelled in the map, got {}, {}",
                                                core::describe_string<S>(lower), core::describe_string<S>(upper));
        }

        PositionalCounter start = make_counter(lower);
        PositionalCounter end = make_counter(upper);

        if (start > end) {
            core::raise<core::InvalidDirection>("start is greater than end ({} > {})", core::describe_string<S>(lower),
                                                core::describe_string<S>(upper));
        }

        const bool skip_front = bounds == Bounds::open || bounds == Bounds::left_open;
        const bool skip_back = bounds == Bounds::open || bounds == Bounds::right_open;

        if (skip_front) start.increment();
        if (skip_back) {
            if (end.digit_count() == 1 && end[0] == 0) return;  // до наименьшей строки ничего нет
            end.decrement();
        }
        if (start > end) return;

        front = std::move(start);
        back = std::move(end);
    }

    [[nodiscard]] const value_type& from() const noexcept { return lower; }
    [[nodiscard]] const value_type& to() const noexcept { return upper; }
    [[nodiscard]] const std::shared_ptr<const map_type>& map() const noexcept { return index_map; }
    [[nodiscard]] Bounds bounds() const noexcept { return bound_kind; }

    /// true, если исключение концов не оставило ни одного элемента.
    [[nodiscard]] bool empty() const noexcept { return !front.has_value(); }

    /**
     * @brief Число элементов, O(длина концов).
     *
     * Пусть ws, we: длины первого и последнего элемента, base: мощность карты.
     *   size = (base^ws - int(first)) + (base^(ws+1) + ... + base^(we-1)) + int(last) + 1
     * при ws < we и size = int(last) - int(first) + 1 при ws == we.
     * Первое слагаемое считается поразрядным дополнением first, а разность
     * при равной длине поразрядным вычитанием, так что в 64 бита должен
     * помещаться только сам результат, а не значения концов.
     *
     * @throws LengthOverflow если результат не помещается в 64 бита.
     */
    [[nodiscard]] core::count_type size() const {
        if (empty()) return 0;
        return core::checked_add(counter_distance(*front, *back), 1);
    }

    /**
     * @brief n-й элемент (с нуля) без перебора.
     *
     * Работает и для диапазонов, длина которых не помещается в 64 бита.
     *
     * @throws IndexOutOfRange если n >= size().
     */
    [[nodiscard]] value_type at(core::count_type n) const {
        if (empty()) {
            core::raise<core::IndexOutOfRange>("position {} is out of range for an empty range", n);
        }
        if (const auto last_position = try_counter_distance(*front, *back); last_position && n > *last_position) {
            core::raise<core::IndexOutOfRange>("position {} is out of range, the last position is {}", n,
                                               *last_position);
        }
        return render(counter_advance(*front, n));
    }

    /**
     * @brief Позиция элемента в диапазоне (обратное к at()).
     *
     * @throws InvalidEndpoints если value не записано символами карты или лежит вне диапазона.
     * @throws LengthOverflow   если позиция не помещается в 64 бита.
     */
    [[nodiscard]] core::count_type position_of(const value_type& value) const {
        if (!contains(value)) {
            core::raise<core::InvalidEndpoints>("{} is not an element of the range", core::describe_string<S>(value));
        }
        return counter_distance(*front, make_counter(value));
    }

    [[nodiscard]] bool contains(const value_type& value) const {
        if (empty() || !spelled_in_map(value)) return false;
        const PositionalCounter c = make_counter(value);
        return *front <= c && c <= *back;
    }

    [[nodiscard]] iterator begin() const { return iterator(*this); }
    [[nodiscard]] std::default_sentinel_t end() const noexcept { return {}; }

    [[nodiscard]] reverse_iterator rbegin() const { return reverse_iterator(*this); }
    [[nodiscard]] std::default_sentinel_t rend() const noexcept { return {}; }

    /// Первый элемент диапазона (с учётом bounds()), пока он не пуст.
    [[nodiscard]] std::optional<value_type> first() const {
        if (empty()) return std::nullopt;
        return render(*front);
    }

    /// Последний элемент диапазона (с учётом bounds()), пока он не пуст.
    [[nodiscard]] std::optional<value_type> last() const {
        if (empty()) return std::nullopt;
        return render(*back);
    }

   private:
    value_type lower;
    value_type upper;
    std::shared_ptr<const map_type> index_map;
    Bounds bound_kind;

    // Счётчики первого и последнего выдаваемых элементов; nullopt, если диапазон пуст.
    std::optional<PositionalCounter> front;
    std::optional<PositionalCounter> back;

    [[nodiscard]] bool spelled_in_map(const value_type& value) const {
        if (value.empty()) return false;
        for (const S symbol : value) {
            if (!index_map->contains(symbol)) return false;
        }
        return true;
    }

    [[nodiscard]] PositionalCounter make_counter(const value_type& value) const {
        std::vector<std::size_t> digits;
        digits.reserve(value.size());
        for (const S symbol : value) digits.push_back(index_map->symbol_to_index(symbol));
        return PositionalCounter(digits, index_map->cardinality());
    }

    [[nodiscard]] value_type render(const PositionalCounter& counter) const {
        value_type out;
        out.reserve(counter.digit_count());
        for (std::size_t i = 0; i < counter.digit_count(); ++i) {
            out.push_back(index_map->index_to_symbol(counter[i]));
        }
        return out;
    }
};

using StringRange = SymbolRange<char32_t>;
using BytesRange = SymbolRange<std::uint8_t>;

}  // namespace chrange::search
