#pragma once

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <future>
#include <limits>
#include <thread>
#include <type_traits>
#include <vector>

#include <chrange/core/checked.hpp>
#include <chrange/core/errors.hpp>
#include <chrange/search/symbol_range.hpp>

namespace chrange::search {

/**
 * @brief Параллельно построить все элементы диапазона с помощью std::async.
 *
 * Позиции [0, size()) делятся на почти равные непрерывные части, по одной
 * async-задаче на часть. Задача один раз переходит к началу своей части
 * через at() (прибавление номера к разрядам с переносом), а дальше идёт
 * по диапазону инкрементом своего счётчика. Карта разделяется между задачами: для
 * ленивой карты это упирается в её кэш, защищённый мьютексом.
 *
 * @tparam S           Тип символа.
 * @tparam OnProgress  Callable вида void(std::size_t done, std::size_t total).
 *
 * @param range        Диапазон.
 * @param threadCount  Число параллельных задач (по умолчанию hardware_concurrency()).
 * @param onProgress   Опциональный callback прогресса (можно передать nullptr).
 *
 * @return Элементы диапазона в исходном порядке.
 *
 * @throws LengthOverflow если size() не помещается в адресное пространство.
 * @note Если задача бросает исключение, оно пробросится при get() соответствующего future.
 */
template <core::SymbolLike S, typename OnProgress = std::nullptr_t>
auto materialize_parallel(const SymbolRange<S>& range,
                          std::size_t threadCount = std::thread::hardware_concurrency(),
                          OnProgress onProgress = nullptr) -> std::vector<typename SymbolRange<S>::value_type>
{
    const core::count_type count = range.size();
    if (count > std::numeric_limits<std::size_t>::max()) {
        core::raise<core::LengthOverflow>("a range of {} elements cannot be materialized", count);
    }

    const auto total = static_cast<std::size_t>(count);
    std::vector<typename SymbolRange<S>::value_type> results(total);
    if (total == 0) return results;

    const auto& map = *range.map();
    std::atomic<std::size_t> done{0};

    // Заполнить results[first, stop): первый элемент берётся через at(),
    // остальные получаются инкрементом собственного счётчика задачи.
    const auto fill = [&](std::size_t first, std::size_t stop) {
        const auto head = range.at(first);
        std::vector<std::size_t> digits;
        digits.reserve(head.size());
        for (const S symbol : head) digits.push_back(map.symbol_to_index(symbol));
        PositionalCounter cursor(digits, map.cardinality());

        for (std::size_t pos = first; pos < stop; ++pos, cursor.increment()) {
            auto& out = results[pos];
            out.reserve(cursor.digit_count());
            for (std::size_t i = 0; i < cursor.digit_count(); ++i) out.push_back(map.index_to_symbol(cursor[i]));

            const std::size_t finished = done.fetch_add(1, std::memory_order_relaxed) + 1;
            if constexpr (!std::is_same_v<OnProgress, std::nullptr_t>) {
                onProgress(finished, total);
            }
        }
    };

    // Первые total % tasks задач получают на один элемент больше.
    const std::size_t tasks = std::clamp<std::size_t>(threadCount, 1, total);
    const std::size_t share = total / tasks;
    const std::size_t extra = total % tasks;

    std::vector<std::future<void>> pending;
    pending.reserve(tasks);
    std::size_t first = 0;
    for (std::size_t t = 0; t < tasks; ++t) {
        const std::size_t stop = first + share + (t < extra ? 1 : 0);
        pending.push_back(std::async(std::launch::async, fill, first, stop));
        first = stop;
    }

    for (auto& task : pending) task.get();
    return results;
}

}  // namespace chrange::search
