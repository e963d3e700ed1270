#pragma once

#include "Core/Net/Cidr.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <boost/json/fwd.hpp>

/**
 * @file Result.hpp
 * @brief Результат IPAM / ADD (формат протокола 0.1.0–0.2.0).
 *
 * {"cniVersion":"0.2.0",
 *  "ip4":{"ip":"10.0.0.5/24","gateway":"10.0.0.1",
 *         "routes":[{"dst":"0.0.0.0/0","gw":"10.0.0.1"}]},
 *  "dns":{"nameservers":[...],"domain":"...","search":[...],"options":[...]}}
 */

namespace Macvlan
{
    /// Версия протокола, которую пишем в ответах.
    constexpr const char *kCniVersion = "0.2.0";

    struct Route
    {
        NetConfig::CidrV4            dst;
        std::optional<std::uint32_t> gw_be; ///< нет: маршрут через интерфейс
    };

    struct IPConfig
    {
        NetConfig::CidrV4            ip;
        std::optional<std::uint32_t> gateway_be;
        std::vector<Route>           routes;
    };

    struct DNS
    {
        std::vector<std::string> nameservers;
        std::string              domain;
        std::vector<std::string> search;
        std::vector<std::string> options;
    };

    struct Result
    {
        std::string             cni_version = kCniVersion;
        std::optional<IPConfig> ip4;
        bool                    has_ip6 = false; ///< IPAM вернул ip6 (не применяется)
        DNS                     dns;
    };

    /**
     * @brief Разобрать ответ IPAM-плагина.
     * @throws std::runtime_error при невалидном JSON или адресах.
     */
    Result ParseResult(const std::string &json);

    std::string ResultToJson(const Result &r);

    /**
     * @brief Секция "dns" из объекта конфигурации или результата.
     * @throws std::runtime_error при неверных типах.
     */
    DNS ParseDns(const boost::json::object &o);
} // namespace Macvlan
