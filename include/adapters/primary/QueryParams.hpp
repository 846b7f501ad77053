#pragma once

#include <IRequest.hpp>
#include <nlohmann/json.hpp>
#include <chrono>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

namespace inventory::adapters::primary {

/**
 * @brief Целочисленный query-параметр; мусор -> std::invalid_argument (400)
 */
inline int intQueryParam(IRequest& req, const std::string& name, int defaultValue) {
    auto raw = req.getQueryParam(name);
    if (!raw || raw->empty()) {
        return defaultValue;
    }

    size_t pos = 0;
    int value = 0;
    try {
        value = std::stoi(*raw, &pos);
    } catch (const std::exception&) {
        throw std::invalid_argument("Invalid integer for '" + name + "': " + *raw);
    }
    if (pos != raw->size()) {
        throw std::invalid_argument("Invalid integer for '" + name + "': " + *raw);
    }
    return value;
}

inline std::optional<std::string> stringQueryParam(IRequest& req, const std::string& name) {
    auto raw = req.getQueryParam(name);
    if (!raw || raw->empty()) {
        return std::nullopt;
    }
    return raw;
}

/**
 * @brief Срок в секундах из поля тела запроса: целое в (0, max]
 *
 * Проверка до перевода в chrono, чтобы огромные значения не переполняли
 * миллисекунды. Нарушение -> std::invalid_argument (400).
 */
inline std::chrono::seconds secondsField(
    const nlohmann::json& body,
    const std::string& name,
    std::chrono::seconds max)
{
    const auto& value = body.at(name);
    if (!value.is_number_integer()) {
        throw std::invalid_argument(name + " must be an integer");
    }
    if (value.is_number_unsigned() &&
        value.get<uint64_t>() > static_cast<uint64_t>(max.count())) {
        throw std::invalid_argument(
            name + " must not exceed " + std::to_string(max.count()));
    }

    int64_t seconds = value.get<int64_t>();
    if (seconds <= 0) {
        throw std::invalid_argument(name + " must be positive");
    }
    if (seconds > max.count()) {
        throw std::invalid_argument(
            name + " must not exceed " + std::to_string(max.count()));
    }
    return std::chrono::seconds(seconds);
}

} // namespace inventory::adapters::primary
