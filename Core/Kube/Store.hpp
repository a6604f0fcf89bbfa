#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace Kube
{
    /**
     * @brief Потокобезопасный кэш объектов коллекции по Key().
     *
     * List() возвращает копию, упорядоченную по ключу.
     */
    template <typename T>
    class Store
    {
    public:
        /// @return Предыдущее значение, если было.
        std::optional<T> Upsert(const T &item)
        {
            std::lock_guard<std::mutex> lk(mu_);
            auto [it, inserted] = items_.try_emplace(item.Key(), item);
            if (inserted)
            {
                return std::nullopt;
            }
            std::optional<T> old = std::move(it->second);
            it->second = item;
            return old;
        }

        std::optional<T> Remove(const std::string &key)
        {
            std::lock_guard<std::mutex> lk(mu_);
            auto it = items_.find(key);
            if (it == items_.end())
            {
                return std::nullopt;
            }
            std::optional<T> old = std::move(it->second);
            items_.erase(it);
            return old;
        }

        /**
         * @brief Заменить содержимое целиком.
         * @return Прежнее содержимое.
         */
        std::map<std::string, T> Replace(std::map<std::string, T> items)
        {
            std::lock_guard<std::mutex> lk(mu_);
            items_.swap(items);
            return items;
        }

        std::optional<T> Get(const std::string &key) const
        {
            std::lock_guard<std::mutex> lk(mu_);
            auto it = items_.find(key);
            if (it == items_.end())
            {
                return std::nullopt;
            }
            return it->second;
        }

        std::vector<T> List() const
        {
            std::lock_guard<std::mutex> lk(mu_);
            std::vector<T> out;
            out.reserve(items_.size());
            for (const auto &kv : items_)
            {
                out.push_back(kv.second);
            }
            return out;
        }

        std::size_t Size() const
        {
            std::lock_guard<std::mutex> lk(mu_);
            return items_.size();
        }

    private:
        mutable std::mutex       mu_;
        std::map<std::string, T> items_;
    };
} // namespace Kube
