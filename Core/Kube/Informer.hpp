#pragma once

// Informer.hpp: list + watch одной коллекции Kubernetes с локальным кэшем,
// периодическим resync и последовательной доставкой событий обработчикам.

#include "Core/Kube/Api.hpp"
#include "Core/Kube/Store.hpp"
#include "Core/Logger.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <optional>
#include <mutex>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

namespace Kube
{
    template <typename T>
    class Informer
    {
    public:
        struct Handlers
        {
            std::function<void(const T &)>            on_add;
            std::function<void(const T &, const T &)> on_update; // (old, new)
            std::function<void(const T &)>            on_delete;
        };

        Informer(Api                 &api,
                 std::string          name,
                 std::string          path,
                 std::chrono::seconds resync,
                 std::chrono::seconds relist_delay = std::chrono::seconds(2))
            : api_(api)
            , name_(std::move(name))
            , path_(std::move(path))
            , resync_(resync)
            , relist_delay_(relist_delay)
        {
        }

        ~Informer() { Stop(); }

        Informer(const Informer&)            = delete;
        Informer& operator=(const Informer&) = delete;

        // Регистрировать до Start().
        void AddHandlers(Handlers h)
        {
            std::lock_guard<std::mutex> lk(dispatch_mu_);
            handlers_.push_back(std::move(h));
        }

        void Start()
        {
            LOGI("informer") << name_ << ": start path=" << path_ << " resync=" << resync_.count() << "s";
            watch_thread_ = std::jthread([this](std::stop_token st) { WatchLoop_(st); });
            if (resync_.count() > 0)
            {
                resync_thread_ = std::jthread([this](std::stop_token st) { ResyncLoop_(st); });
            }
        }

        void Stop()
        {
            watch_thread_.request_stop();
            resync_thread_.request_stop();
            if (watch_thread_.joinable())  watch_thread_.join();
            if (resync_thread_.joinable()) resync_thread_.join();
        }

        // Первый list завершён и применён к кэшу.
        bool HasSynced() const { return synced_.load(); }

        Store<T> &GetStore() { return store_; }

        const std::string &Name() const { return name_; }

    private:
        bool SleepFor_(std::stop_token st, std::chrono::seconds d)
        {
            std::unique_lock<std::mutex> lk(sleep_mu_);
            sleep_cv_.wait_for(lk, st, d, [] { return false; });
            return !st.stop_requested();
        }

        void WatchLoop_(std::stop_token st)
        {
            std::string rv;
            bool need_list = true;
            while (!st.stop_requested())
            {
                try
                {
                    if (need_list)
                    {
                        Relist_(rv);
                        need_list = false;
                    }
                    api_.Watch(path_, rv,
                               [this, &rv](const std::string &type, const boost::json::object &obj)
                               {
                                   ApplyEvent_(type, obj, rv);
                               },
                               st);
                }
                catch (const ApiError &e)
                {
                    LOGW("informer") << name_ << ": " << e.what() << " (status " << e.status()
                                     << "), relist in " << relist_delay_.count() << "s";
                    need_list = true;
                    SleepFor_(st, relist_delay_);
                }
                catch (const std::exception &e)
                {
                    LOGW("informer") << name_ << ": " << e.what()
                                     << ", relist in " << relist_delay_.count() << "s";
                    need_list = true;
                    SleepFor_(st, relist_delay_);
                }
            }
            LOGD("informer") << name_ << ": watch loop stopped";
        }

        void ResyncLoop_(std::stop_token st)
        {
            while (SleepFor_(st, resync_))
            {
                if (!synced_.load())
                {
                    continue;
                }
                std::lock_guard<std::mutex> lk(dispatch_mu_);
                const auto items = store_.List();
                LOGD("informer") << name_ << ": resync " << items.size() << " object(s)";
                for (const T &item : items)
                {
                    FireUpdate_(item, item);
                }
            }
        }

        void Relist_(std::string &rv)
        {
            boost::json::object list = api_.List(path_);

            rv.clear();
            if (const auto *md = list.if_contains("metadata"); md && md->is_object())
            {
                if (const auto *v = md->as_object().if_contains("resourceVersion"); v && v->is_string())
                {
                    rv.assign(v->as_string().data(), v->as_string().size());
                }
            }

            std::map<std::string, T> fresh;
            if (const auto *items = list.if_contains("items"); items && items->is_array())
            {
                for (const auto &iv : items->as_array())
                {
                    if (iv.is_object())
                    {
                        T t = T::FromJson(iv.as_object());
                        std::string key = t.Key();
                        fresh.emplace(std::move(key), std::move(t));
                    }
                }
            }

            std::lock_guard<std::mutex> lk(dispatch_mu_);
            const std::map<std::string, T> old = store_.Replace(fresh);
            for (const auto &[key, item] : fresh)
            {
                auto it = old.find(key);
                if (it == old.end()) FireAdd_(item);
                else                 FireUpdate_(it->second, item);
            }
            for (const auto &[key, item] : old)
            {
                if (fresh.find(key) == fresh.end())
                {
                    FireDelete_(item);
                }
            }

            if (!synced_.exchange(true))
            {
                LOGI("informer") << name_ << ": synced " << fresh.size() << " object(s) rv=" << rv;
            }
        }

        void ApplyEvent_(const std::string         &type,
                         const boost::json::object &obj,
                         std::string               &rv)
        {
            if (type == "ERROR")
            {
                unsigned code = 0;
                if (const auto *c = obj.if_contains("code"); c && c->is_int64())
                {
                    code = static_cast<unsigned>(c->as_int64());
                }
                throw ApiError(code, name_ + ": watch error event");
            }

            if (const auto *md = obj.if_contains("metadata"); md && md->is_object())
            {
                if (const auto *v = md->as_object().if_contains("resourceVersion"); v && v->is_string())
                {
                    rv.assign(v->as_string().data(), v->as_string().size());
                }
            }
            if (type == "BOOKMARK")
            {
                return;
            }

            T item = T::FromJson(obj);

            std::lock_guard<std::mutex> lk(dispatch_mu_);
            if (type == "ADDED" || type == "MODIFIED")
            {
                std::optional<T> old = store_.Upsert(item);
                if (old) FireUpdate_(*old, item);
                else     FireAdd_(item);
            }
            else if (type == "DELETED")
            {
                std::optional<T> old = store_.Remove(item.Key());
                FireDelete_(old ? *old : item);
            }
            else
            {
                LOGD("informer") << name_ << ": ignoring event type " << type;
            }
        }

        // Обработчики не должны ронять цикл watch.
        void FireAdd_(const T &item)
        {
            for (const auto &h : handlers_)
            {
                if (!h.on_add) continue;
                try { h.on_add(item); }
                catch (const std::exception &e) { LOGE("informer") << name_ << ": add handler: " << e.what(); }
            }
        }

        void FireUpdate_(const T &old_item, const T &new_item)
        {
            for (const auto &h : handlers_)
            {
                if (!h.on_update) continue;
                try { h.on_update(old_item, new_item); }
                catch (const std::exception &e) { LOGE("informer") << name_ << ": update handler: " << e.what(); }
            }
        }

        void FireDelete_(const T &item)
        {
            for (const auto &h : handlers_)
            {
                if (!h.on_delete) continue;
                try { h.on_delete(item); }
                catch (const std::exception &e) { LOGE("informer") << name_ << ": delete handler: " << e.what(); }
            }
        }

    private:
        Api                 &api_;
        std::string          name_;
        std::string          path_;
        std::chrono::seconds resync_;
        std::chrono::seconds relist_delay_;

        Store<T>              store_;
        std::vector<Handlers> handlers_;
        std::mutex            dispatch_mu_;
        std::atomic<bool>     synced_{false};

        std::mutex                  sleep_mu_;
        std::condition_variable_any sleep_cv_;

        std::jthread watch_thread_;
        std::jthread resync_thread_;
    };
} // namespace Kube
