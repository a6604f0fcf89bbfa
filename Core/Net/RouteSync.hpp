#pragma once

#include "Core/Net/RouteBackend.hpp"

#include <map>
#include <mutex>
#include <string>

/**
 * @file RouteSync.hpp
 * @brief Сведение таблицы маршрутов к желаемому набору "cidr -> gateway".
 */

namespace Routes
{
    /**
     * @brief Синхронизатор маршрутов.
     *
     * Хранит набор маршрутов, которые сам установил (applied). Каждый вызов
     * EnsureRoutes() устанавливает недостающие и изменившиеся записи и
     * удаляет свои записи, которых больше нет в желаемом наборе. Маршрут
     * с недостижимым шлюзом пропускается и будет повторён в следующем цикле.
     * Вызовы сериализованы внутренним мьютексом.
     */
    class RouteSync
    {
    public:
        using RouteMap = std::map<std::string, std::string>; ///< cidr -> via

        explicit RouteSync(Backend &backend);

        /**
         * @brief Привести маршруты к набору desired.
         * @throws std::runtime_error при первой неустранимой ошибке бэкенда;
         *         уже выполненные изменения сохраняются в applied.
         */
        void EnsureRoutes(const RouteMap &desired);

        /// Копия текущего набора установленных маршрутов.
        RouteMap Applied() const;

    private:
        Backend           &backend_;
        mutable std::mutex mu_;
        RouteMap           applied_;
    };
} // namespace Routes
