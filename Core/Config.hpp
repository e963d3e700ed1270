#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <boost/json.hpp>

/**
 * @file Config.hpp
 * @brief Чтение полей JSON-конфига с проверкой типов.
 *
 * RequireString бросает std::runtime_error, если ключа нет или тип не тот.
 * Optional* возвращают значение по умолчанию при отсутствии ключа,
 * но тоже бросают при неверном типе.
 */

namespace Config
{
    std::string RequireString(const boost::json::object &o,
                              const char                *key);

    std::string OptionalString(const boost::json::object &o,
                               const char                *key,
                               const std::string         &def = std::string());

    std::int64_t OptionalInt(const boost::json::object &o,
                             const char                *key,
                             std::int64_t               def = 0);

    bool OptionalBool(const boost::json::object &o,
                      const char                *key,
                      bool                       def = false);

    std::vector<std::string> OptionalStringArray(const boost::json::object &o,
                                                 const char                *key);

    /**
     * @brief Вложенный объект или пустой, если ключа нет.
     */
    const boost::json::object &OptionalObject(const boost::json::object &o,
                                              const char                *key);
} // namespace Config
