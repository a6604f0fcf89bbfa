#pragma once

#include <cstdint>
#include <string>

#include <boost/json.hpp>

/**
 * @file Config.hpp
 * @brief Чтение полей JSON-конфигурации с проверкой типов.
 *
 * Optional* возвращают значение по умолчанию, если ключа нет или он null,
 * и бросают std::invalid_argument, если тип не тот.
 */

namespace Config
{
    std::string OptionalString(const boost::json::object &o,
                               const char                *key,
                               const std::string         &def);

    std::int64_t OptionalInt(const boost::json::object &o,
                             const char                *key,
                             std::int64_t               def);

    bool OptionalBool(const boost::json::object &o,
                      const char                *key,
                      bool                       def);

    /**
     * @brief Прочитать файл целиком и разобрать как JSON-объект.
     * @throws std::runtime_error если файл не читается.
     * @throws std::invalid_argument если содержимое не JSON-объект.
     */
    boost::json::object LoadObjectFile(const std::string &path);
} // namespace Config
