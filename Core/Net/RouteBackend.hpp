#pragma once

#include <string>

/**
 * @file RouteBackend.hpp
 * @brief Абстракция над таблицей маршрутов ядра.
 */

namespace Routes
{
    /**
     * @brief Итог операции над маршрутом, который не считается ошибкой.
     *
     * Прочие ошибки бэкенд сообщает исключением std::runtime_error.
     */
    enum class Outcome
    {
        Ok,            ///< Маршрут установлен или удалён.
        AlreadyExists, ///< Такой маршрут уже есть.
        NotFound,      ///< Удалять нечего.
        Unreachable    ///< Шлюз сейчас недостижим (ENETUNREACH).
    };

    /**
     * @brief Установка и удаление маршрутов вида "cidr via gateway".
     */
    class Backend
    {
    public:
        virtual ~Backend() = default;

        /**
         * @brief Установить маршрут к подсети через шлюз.
         * @throws std::runtime_error на ошибках, кроме перечисленных в Outcome.
         */
        virtual Outcome Add(const std::string &cidr,
                            const std::string &via) = 0;

        /**
         * @brief Удалить маршрут к подсети.
         * @throws std::runtime_error на ошибках, кроме перечисленных в Outcome.
         */
        virtual Outcome Delete(const std::string &cidr) = 0;
    };

    /**
     * @brief Бэкенд без побочных эффектов: все операции успешны.
     *
     * Используется там, где маршрутами управляет сам overlay-демон.
     */
    class NoopBackend final : public Backend
    {
    public:
        Outcome Add(const std::string &, const std::string &) override { return Outcome::Ok; }
        Outcome Delete(const std::string &) override { return Outcome::Ok; }
    };

    inline const char *ToString(Outcome o)
    {
        switch (o)
        {
            case Outcome::Ok:            return "ok";
            case Outcome::AlreadyExists: return "exists";
            case Outcome::NotFound:      return "not-found";
            case Outcome::Unreachable:   return "unreachable";
        }
        return "?";
    }
} // namespace Routes
