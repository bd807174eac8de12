#pragma once

#include <cstdlib>
#include <exception>
#include <iostream>
#include <optional>
#include <string>

namespace pricefetcher::settings {

/**
 * @brief Прочитать переменную окружения
 * @return nullopt если переменная не задана или пустая
 */
inline std::optional<std::string> readEnv(const char* name) {
    const char* value = std::getenv(name);
    if (value == nullptr || *value == '\0') {
        return std::nullopt;
    }
    return std::string(value);
}

/**
 * @brief Прочитать целое из окружения, при ошибке разбора вернуть fallback
 */
inline int readEnvInt(const char* name, int fallback) {
    auto value = readEnv(name);
    if (!value) {
        return fallback;
    }

    try {
        size_t parsed = 0;
        int result = std::stoi(*value, &parsed);
        if (parsed == value->size()) {
            return result;
        }
    } catch (const std::exception&) {
    }

    std::cerr << "[Settings] Invalid value for " << name << "='" << *value
              << "', using default " << fallback << std::endl;
    return fallback;
}

} // namespace pricefetcher::settings
