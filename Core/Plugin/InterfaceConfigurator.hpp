#pragma once

#include "Result.hpp"
#include "Core/Net/Links.hpp"

#include <string>

/**
 * @file InterfaceConfigurator.hpp
 * @brief MAC, адрес и маршруты интерфейса контейнера.
 *
 * Все методы работают в текущем namespace потока: вызывать из NetNS::Do.
 */

namespace Macvlan
{
    /**
     * @brief Добавить маршрут по умолчанию через шлюз IPAM.
     *
     * Без шлюза маршрут добавляется в области канала (gw не задан).
     * Меняет ip4 только при успехе.
     * @throws PluginError(GatewayConflict) если в маршрутах уже есть 0.0.0.0/0
     *         через шлюз, отличный от шлюза IPAM (в т.ч. когда его нет).
     */
    void InjectDefaultRoute(IPConfig &ip4);

    class InterfaceConfigurator
    {
    public:
        explicit InterfaceConfigurator(NetConfig::LinkOps &links);

        /**
         * @param result Результат IPAM; при is_default_gw в него добавляется маршрут.
         * @throws PluginError(MacAddressSetFailed | GatewayConflict | InterfaceConfigFailed)
         */
        void Configure(const std::string &if_name,
                       const std::string &mac,
                       Result            &result,
                       bool               is_default_gw);

    private:
        void Apply(const std::string &if_name,
                   const IPConfig    &ip4);

        NetConfig::LinkOps &links_;
    };
} // namespace Macvlan
