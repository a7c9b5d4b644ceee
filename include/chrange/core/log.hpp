#pragma once

#include <memory>

#include <spdlog/spdlog.h>
#include <spdlog/cfg/env.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace chrange::core {

/// Имя логгера библиотеки в реестре spdlog.
inline constexpr const char* logger_name = "chrange";

/**
 * @brief Логгер библиотеки.
 *
 * Создаётся при первом обращении (stderr, уровень warn). Если логгер с таким
 * именем уже зарегистрирован приложением, используется он.
 */
[[nodiscard]] inline const std::shared_ptr<spdlog::logger>& logger() {
    static const std::shared_ptr<spdlog::logger> instance = [] {
        if (auto existing = spdlog::get(logger_name)) {
            return existing;
        }
        auto created = spdlog::stderr_color_mt(logger_name);
        created->set_level(spdlog::level::warn);
        return created;
    }();
    return instance;
}

inline void set_log_level(spdlog::level::level_enum level) { logger()->set_level(level); }

/**
 * @brief Прочитать уровни логирования из переменной окружения SPDLOG_LEVEL.
 *
 * Например, `SPDLOG_LEVEL=chrange=trace`.
 */
inline void load_log_levels_from_env() {
    (void)logger();  // логгер должен существовать до применения уровней
    spdlog::cfg::load_env_levels();
}

}  // namespace chrange::core
