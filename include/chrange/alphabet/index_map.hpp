#pragma once

#include <cstddef>
#include <functional>
#include <initializer_list>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <unordered_map>
#include <utility>
#include <vector>

#include <chrange/alphabet/interval.hpp>
#include <chrange/core/errors.hpp>
#include <chrange/core/log.hpp>
#include <chrange/core/symbol.hpp>

namespace chrange::alphabet {

/**
 * @brief Пара пользовательских функций поиска для ленивой карты.
 *
 * Функции должны быть согласованы с интервалами карты: symbol_to_index
 * возвращает индекс из [0, cardinality()), index_to_symbol возвращает символ из
 * интервалов карты. Если символ/индекс найти нельзя, функция бросает
 * исключение, и оно пробрасывается вызывающему без изменений.
 */
template <core::SymbolLike S>
struct LookupStrategy {
    std::function<std::size_t(S)> symbol_to_index;
    std::function<S(std::size_t)> index_to_symbol;
};

/**
 * @brief Двусторонняя карта "символ <-> индекс" алфавита.
 *
 * Алфавит задаётся упорядоченным списком непересекающихся интервалов;
 * индексы 0..cardinality()-1 назначаются подряд в порядке списка.
 *
 * Два режима:
 *  - eager (функции поиска не заданы): обе таблицы строятся полностью в
 *    конструкторе и дальше не меняются;
 *  - lazy (заданы обе функции): таблицы начинаются пустыми, промахи
 *    разрешаются функциями поиска, результат кэшируется.
 *
 * Кэш ленивой карты является единственным состоянием, меняющимся после
 * конструирования. Он защищён std::shared_mutex (функции поиска
 * вызываются вне блокировки, мьютекс держится только на время вставки),
 * поэтому одну карту можно разделять между потоками (например, через
 * std::shared_ptr<const IndexMap>). Таблицы eager-карты читаются без
 * блокировки.
 *
 * @tparam S Тип символа (char32_t или std::uint8_t).
 */
template <core::SymbolLike S>
class IndexMap {
   public:
    using symbol_type = S;
    using interval_type = Interval<S>;
    using SymbolToIndex = std::function<std::size_t(S)>;
    using IndexToSymbol = std::function<S(std::size_t)>;

    /**
     * @brief Построить карту из интервалов.
     *
     * @param intervals       Непустой список непересекающихся интервалов.
     * @param symbol_to_index Функция поиска индекса по символу (lazy-режим).
     * @param index_to_symbol Функция поиска символа по индексу (lazy-режим).
     *
     * @throws ConfigurationConflict если задана ровно одна функция поиска.
     * @throws NoIntervals           если список интервалов пуст.
     * @throws OverlappingIntervals  если интервалы пересекаются.
     */
    explicit IndexMap(std::vector<interval_type> intervals, SymbolToIndex symbol_to_index = {},
                      IndexToSymbol index_to_symbol = {})
        : interval_list(std::move(intervals)) {
        const bool has_forward = static_cast<bool>(symbol_to_index);
        const bool has_backward = static_cast<bool>(index_to_symbol);

        if (has_forward != has_backward) {
            core::raise<core::ConfigurationConflict>(
                "the two lookup functions must be either both given or both omitted");
        }

        if (has_forward) {
            strategy = std::make_shared<const LookupStrategy<S>>(
                LookupStrategy<S>{std::move(symbol_to_index), std::move(index_to_symbol)});
        }

        init();
    }

    IndexMap(std::initializer_list<interval_type> intervals)
        : IndexMap(std::vector<interval_type>(intervals)) {}

    IndexMap(IndexMap&&) noexcept = default;
    IndexMap& operator=(IndexMap&&) noexcept = default;

    IndexMap(const IndexMap&) = delete;
    IndexMap& operator=(const IndexMap&) = delete;

    /// Мощность алфавита (основание счётчика), O(1).
    [[nodiscard]] std::size_t cardinality() const noexcept { return total; }

    [[nodiscard]] const std::vector<interval_type>& intervals() const noexcept { return interval_list; }

    /// true, если карта использует функции поиска.
    [[nodiscard]] bool lazy() const noexcept { return static_cast<bool>(strategy); }

    /**
     * @brief Индекс символа.
     *
     * @throws NotASymbol     если значение не является допустимым символом.
     * @throws SymbolNotFound если символа нет в карте.
     * @throws InvalidIndex   если функция поиска вернула индекс вне [0, cardinality()).
     */
    [[nodiscard]] std::size_t symbol_to_index(S symbol) const {
        if (!core::is_valid_symbol(symbol)) {
            core::raise<core::NotASymbol>("expected a {}, got {}", core::SymbolTraits<S>::name,
                                          core::SymbolTraits<S>::describe(symbol));
        }

        if (!strategy) {
            const auto it = cache->forward.find(symbol);
            if (it == cache->forward.end()) {
                core::raise<core::SymbolNotFound>("{} is not in the map", core::SymbolTraits<S>::describe(symbol));
            }
            return it->second;
        }

        {
            std::shared_lock lock(cache->mutex);
            const auto it = cache->forward.find(symbol);
            if (it != cache->forward.end()) return it->second;
        }

        if (!covers(symbol)) {
            core::raise<core::SymbolNotFound>("{} is not in the map", core::SymbolTraits<S>::describe(symbol));
        }

        // функция поиска вызывается без блокировки: она может сама обращаться к карте
        const std::size_t index = strategy->symbol_to_index(symbol);
        if (index >= total) {
            core::raise<core::InvalidIndex>("expected the lookup function to return an index in [0, {}), got {}",
                                            total, index);
        }

        SPDLOG_LOGGER_TRACE(core::logger(), "lookup miss: {} -> {}", core::SymbolTraits<S>::describe(symbol), index);
        std::unique_lock lock(cache->mutex);
        // при гонке остаётся запись, вставленная первой
        return cache->forward.emplace(symbol, index).first->second;
    }

    /**
     * @brief Символ по индексу.
     *
     * @throws IndexOutOfRange если index >= cardinality().
     * @throws InvalidSymbol   если функция поиска вернула недопустимый символ
     *                         или символ вне интервалов карты.
     */
    [[nodiscard]] S index_to_symbol(std::size_t index) const {
        if (index >= total) {
            core::raise<core::IndexOutOfRange>("index {} is out of range [0, {})", index, total);
        }

        if (!strategy) return cache->backward_table[index];

        {
            std::shared_lock lock(cache->mutex);
            const auto it = cache->backward.find(index);
            if (it != cache->backward.end()) return it->second;
        }

        const S symbol = strategy->index_to_symbol(index);
        if (!core::is_valid_symbol(symbol) || !covers(symbol)) {
            core::raise<core::InvalidSymbol>("expected the lookup function to return a {} of the map, got {}",
                                             core::SymbolTraits<S>::name, core::SymbolTraits<S>::describe(symbol));
        }

        SPDLOG_LOGGER_TRACE(core::logger(), "lookup miss: {} -> {}", index, core::SymbolTraits<S>::describe(symbol));
        std::unique_lock lock(cache->mutex);
        return cache->backward.emplace(index, symbol).first->second;
    }

    /// Принадлежит ли символ карте (без исключений).
    [[nodiscard]] bool contains(S symbol) const {
        if (!core::is_valid_symbol(symbol)) return false;
        if (!strategy) return cache->forward.find(symbol) != cache->forward.end();
        return covers(symbol);
    }

    /**
     * @brief Новая карта из интервалов этой карты и карты @p other.
     *
     * @throws ConfigurationConflict если карты используют разные стратегии поиска.
     */
    [[nodiscard]] IndexMap combine(const IndexMap& other) const {
        if (!same_strategy(strategy, other.strategy)) {
            core::raise<core::ConfigurationConflict>("maps having different lookup functions cannot be combined");
        }

        std::vector<interval_type> merged = interval_list;
        merged.insert(merged.end(), other.interval_list.begin(), other.interval_list.end());
        return IndexMap(std::move(merged), strategy);
    }

    /// Новая карта: интервалы этой карты плюс @p interval, стратегия поиска сохраняется.
    [[nodiscard]] IndexMap combine(const interval_type& interval) const {
        std::vector<interval_type> merged = interval_list;
        merged.push_back(interval);
        return IndexMap(std::move(merged), strategy);
    }

    [[nodiscard]] bool operator==(const IndexMap& other) const noexcept {
        return interval_list == other.interval_list;
    }

   private:
    struct Cache {
        // eager: полностью заполнены и неизменяемы; lazy: пополняются под mutex.
        std::unordered_map<S, std::size_t> forward;
        std::unordered_map<std::size_t, S> backward;
        std::vector<S> backward_table;  // только eager
        mutable std::shared_mutex mutex;
    };

    std::vector<interval_type> interval_list;
    std::shared_ptr<const LookupStrategy<S>> strategy;
    std::size_t total{0};
    std::unique_ptr<Cache> cache;

    IndexMap(std::vector<interval_type> intervals, std::shared_ptr<const LookupStrategy<S>> shared)
        : interval_list(std::move(intervals)), strategy(std::move(shared)) {
        init();
    }

    void init() {
        if (interval_list.empty()) {
            core::raise<core::NoIntervals>("at least one interval expected");
        }

        cache = std::make_unique<Cache>();
        for (const auto& interval : interval_list) total += interval.size();

        if (strategy) {
            intervals_must_not_overlap();
        } else {
            populate();
        }

        SPDLOG_LOGGER_DEBUG(core::logger(), "{} map built: mode={}, intervals={}, cardinality={}",
                            core::SymbolTraits<S>::name, strategy ? "lazy" : "eager", interval_list.size(), total);
    }

    void intervals_must_not_overlap() const {
        for (std::size_t i = 0; i < interval_list.size(); ++i) {
            for (std::size_t j = 0; j < i; ++j) {
                if (interval_list[i].intersects(interval_list[j])) {
                    core::raise<core::OverlappingIntervals>("intervals #{} and #{} overlap", j, i);
                }
            }
        }
    }

    void populate() {
        cache->forward.reserve(total);
        cache->backward_table.reserve(total);

        std::size_t index = 0;
        for (const auto& interval : interval_list) {
            for (const S symbol : interval) {
                // повторная вставка = пересечение интервалов
                if (!cache->forward.emplace(symbol, index).second) {
                    core::raise<core::OverlappingIntervals>("{} belongs to more than one interval",
                                                            core::SymbolTraits<S>::describe(symbol));
                }
                cache->backward_table.push_back(symbol);
                ++index;
            }
        }
    }

    [[nodiscard]] bool covers(S symbol) const noexcept {
        for (const auto& interval : interval_list) {
            if (interval.contains(symbol)) return true;
        }
        return false;
    }

    template <typename R, typename A>
    [[nodiscard]] static bool same_target(const std::function<R(A)>& a, const std::function<R(A)>& b) noexcept {
        using Ptr = R (*)(A);
        const Ptr* pa = a.template target<Ptr>();
        const Ptr* pb = b.template target<Ptr>();
        return pa != nullptr && pb != nullptr && *pa == *pb;
    }

    // Одна и та же стратегия: общий объект (карты, полученные через combine)
    // либо обе обёртки указывают на одни и те же свободные функции.
    [[nodiscard]] static bool same_strategy(const std::shared_ptr<const LookupStrategy<S>>& a,
                                            const std::shared_ptr<const LookupStrategy<S>>& b) noexcept {
        if (a == b) return true;
        if (!a || !b) return false;
        return same_target(a->symbol_to_index, b->symbol_to_index) &&
               same_target(a->index_to_symbol, b->index_to_symbol);
    }
};

using CharacterMap = IndexMap<char32_t>;
using ByteMap = IndexMap<std::uint8_t>;

/// Карта из двух интервалов (eager).
template <core::SymbolLike S>
[[nodiscard]] IndexMap<S> combine(const Interval<S>& a, const Interval<S>& b) {
    return IndexMap<S>(std::vector<Interval<S>>{a, b});
}

}  // namespace chrange::alphabet
