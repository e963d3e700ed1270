#pragma once

#include "NetConf.hpp"
#include "Core/Net/Links.hpp"
#include "Core/Net/NetNS.hpp"
#include "Core/Net/Sysctl.hpp"

#include <string>

/**
 * @file Provisioner.hpp
 * @brief Создание macvlan сразу в namespace контейнера.
 *
 * Линк создаётся под временным именем одним RTM_NEWLINK с IFLA_NET_NS_FD,
 * затем внутри namespace включается proxy_arp и линк переименовывается в
 * ifname. Если имя ifname уже занято в namespace хоста, создание с
 * конечным именем падает с EEXIST, хотя в целевом namespace оно свободно.
 */

namespace Macvlan
{
    class Provisioner
    {
    public:
        Provisioner(NetConfig::LinkOps &links,
                    NetConfig::Sysctl  &sysctl);

        /**
         * @brief Вызывать из namespace хоста (master ищется в текущем).
         *
         * При ошибке после создания линк удаляется; ошибки удаления
         * только логируются и не заменяют исходную.
         *
         * @throws PluginError(InvalidConfig | MasterNotFound | LinkCreationFailed
         *                     | ProxyArpSetupFailed | RenameFailed)
         */
        void Provision(const NetConf     &conf,
                       const std::string &if_name,
                       NetConfig::NetNS  &netns);

    private:
        std::string PickTemporaryName();

        void RollbackDelete(const std::string &name) noexcept;

        NetConfig::LinkOps &links_;
        NetConfig::Sysctl  &sysctl_;
    };
} // namespace Macvlan
