#pragma once

#include "Core/Kube/Informer.hpp"
#include "Core/Kube/Types.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

/**
 * @file Controller.hpp
 * @brief Управляющий цикл агента: кэши Node/Service/EndpointSlice/Pod и запуск согласований.
 */

namespace Agent
{
    /**
     * @brief Контроллер узла.
     *
     * До синхронизации всех кэшей события только обновляют кэши. После синхронизации:
     * - событие своего Node с новой подсетью запускает apply_self;
     * - любое событие Node запускает sync_routes по полному списку узлов;
     * - любое событие Service или EndpointSlice запускает sync_services по полным снимкам.
     *
     * Ошибки согласований пишутся в лог и не прерывают работу.
     */
    class Controller
    {
    public:
        struct Hooks
        {
            /// (подсеть, прежняя применённая подсеть или пусто). Исключение: подсеть не применена.
            std::function<void(const std::string &, const std::string &)> apply_self;

            std::function<void(const std::vector<Kube::Node> &)> sync_routes;

            /// Пусто: Service и EndpointSlice не отслеживаются.
            std::function<void(const std::optional<Kube::Node> &,
                               const std::vector<Kube::Service> &,
                               const std::vector<Kube::EndpointSlice> &)> sync_services;
        };

        struct Settings
        {
            std::string          node_name;
            std::chrono::seconds resync{1800};
            bool                 watch_pods = false; ///< Кэш подов узла (для журнала metadata).
        };

        Controller(Kube::Api &api,
                   Settings   settings,
                   Hooks      hooks);

        ~Controller();

        Controller(const Controller&)            = delete;
        Controller& operator=(const Controller&) = delete;

        /// Запустить кэши; ожидание синхронизации идёт в фоне.
        void Start();

        void Stop();

        bool Synced() const { return synced_.load(); }

        /// nullptr, если кэш подов не ведётся.
        const Kube::Store<Kube::Pod> *PodStore() const;

        /**
         * @brief Согласовать свой узел: сравнить подсеть с последней применённой.
         */
        void ReconcileSelf(const Kube::Node &node);

        void ReconcileRoutes();

        void ReconcileServices();

        /// Последняя успешно применённая подсеть.
        std::string LastApplied() const;

    private:
        enum class EmptyState { None, NoSubnet, Lost };

        void WaitAndRun_(std::stop_token st);
        void OnSynced_();
        bool AllSynced_() const;

        void OnNode_(const Kube::Node &node);

        Settings settings_;
        Hooks    hooks_;

        std::unique_ptr<Kube::Informer<Kube::Node>>          nodes_;
        std::unique_ptr<Kube::Informer<Kube::Service>>       services_;
        std::unique_ptr<Kube::Informer<Kube::EndpointSlice>> slices_;
        std::unique_ptr<Kube::Informer<Kube::Pod>>           pods_;

        std::atomic<bool> synced_{false};

        mutable std::mutex self_mu_;
        std::string        last_applied_;
        EmptyState         empty_state_ = EmptyState::None;

        std::jthread sync_thread_;
    };
} // namespace Agent
