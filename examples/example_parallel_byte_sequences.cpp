#include <chrange/alphabet/index_map.hpp>
#include <chrange/alphabet/interval.hpp>
#include <chrange/alphabet/prebuilt.hpp>

#include <chrange/core/log.hpp>
#include <chrange/core/symbol.hpp>

#include <chrange/search/character_range.hpp>
#include <chrange/search/parallel_async.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace ex {

using chrange::alphabet::ByteInterval;
using chrange::alphabet::ByteMap;
using chrange::core::ByteString;

// All bytes, ordered starting from 0xFE: FE, FF, 00, 01, ...
std::shared_ptr<const ByteMap> rotatedBytes() {
    return std::make_shared<const ByteMap>(
        std::vector<ByteInterval>{ByteInterval(0x00, 0xFF)},
        [](std::uint8_t b) { return static_cast<std::size_t>((b + 2) & 0xFF); },
        [](std::size_t i) { return static_cast<std::uint8_t>((i + 0xFE) & 0xFF); });
}

void printBytes(const ByteString& bytes) {
    std::cout << std::hex << std::setfill('0');
    for (const std::uint8_t b : bytes) std::cout << std::setw(2) << static_cast<unsigned>(b);
    std::cout << std::dec << std::setfill(' ');
}

}  // namespace ex

int main() {
    namespace prebuilt = chrange::alphabet::prebuilt;
    using chrange::search::character_range;
    using ex::ByteString;

    chrange::core::load_log_levels_from_env();

    // 0xFE..0x81 is rejected over byte_ascii, but wraps around over the rotated map
    const auto wrap = character_range(ByteString{0xFE}, ByteString{0x81}, ex::rotatedBytes());
    std::cout << "Rotated 0xFE..0x81: " << wrap.size() << " sequences, first ";
    ex::printBytes(*wrap.first());
    std::cout << ", last ";
    ex::printBytes(*wrap.last());
    std::cout << "\n";

    // Every 1..3 byte string over [0-9a-z]: 36 + 36^2 + 36^3
    const auto range =
        character_range(ByteString{'0'}, ByteString{'z', 'z', 'z'}, prebuilt::lowercase_base_36<std::uint8_t>());
    const std::size_t total = static_cast<std::size_t>(range.size());
    std::cout << "Materializing " << total << " byte sequences\n";

    std::mutex io;
    const std::size_t step = total / 20;

    auto t0 = std::chrono::steady_clock::now();
    const auto all = chrange::search::materialize_parallel(
        range, std::thread::hardware_concurrency(), [&](std::size_t now, std::size_t count) {
            if (now % step != 0) return;
            std::lock_guard<std::mutex> lock(io);
            std::cout << "\rProgress: " << (100 * now / count) << "% (" << now << "/" << count << ")" << std::flush;
        });
    auto t1 = std::chrono::steady_clock::now();
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(t1 - t0).count();

    std::cout << "\rProgress: 100% (" << total << "/" << total << ")\n";
    std::cout << "Elapsed (parallel): " << ms << " ms\n";

    std::cout << "Element 36: ";
    ex::printBytes(all[36]);
    std::cout << "\nLast: ";
    ex::printBytes(all.back());
    std::cout << "\n";

    return 0;
}
