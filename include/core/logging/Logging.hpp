#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <spdlog/spdlog.h>

namespace homebook {
namespace core {
namespace logging {

// Параметры логгеров компонентов кэша
struct LogConfig {
    std::string logPath;                  // Пусто = вывод в консоль
    size_t maxLogSize = 1024 * 1024 * 5;  // Размер файла до ротации
    size_t maxLogFiles = 3;               // Кол-во файлов ротации
    std::string level = "info";           // trace/debug/info/warn/error/off
    bool useStderr = false;               // Консольный вывод в stderr вместо stdout
};

/**
 * @brief Получить именованный логгер компонента или создать его.
 * @details Уже зарегистрированный логгер переиспользуется. При заданном logPath
 * создаётся rotating-логгер, иначе цветной stdout (или stderr). Ошибка создания не
 * пробрасывается: возвращается логгер по умолчанию.
 */
std::shared_ptr<spdlog::logger> getLogger(const std::string& name, const LogConfig& config = LogConfig{});

// Разбор уровня логирования из строки (неизвестное значение = info)
spdlog::level::level_enum parseLevel(const std::string& level);

} // namespace logging
} // namespace core
} // namespace homebook
