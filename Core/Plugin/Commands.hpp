#pragma once

#include "Ipam.hpp"
#include "MacLookup.hpp"
#include "NetConf.hpp"
#include "Result.hpp"
#include "Core/Net/Links.hpp"
#include "Core/Net/NetNS.hpp"
#include "Core/Net/Sysctl.hpp"

#include <string>
#include <vector>

/**
 * @file Commands.hpp
 * @brief Команды ADD и DEL.
 *
 * ADD: конфиг -> namespace -> интерфейс (создать или переиспользовать)
 *      -> IPAM -> MAC -> адрес/маршруты -> результат с DNS из конфига.
 * DEL: конфиг -> IPAM DEL -> удалить интерфейс (отсутствие: не ошибка).
 *
 * Вызывать из CommandThread: NetNS::Do не работает в других потоках.
 */

namespace Macvlan
{
    /**
     * @brief Параметры одного вызова (переменные окружения + stdin).
     */
    struct CmdArgs
    {
        std::string container_id;
        std::string netns;
        std::string if_name;
        std::string args;       ///< CNI_ARGS
        std::string path;       ///< CNI_PATH
        std::string stdin_data; ///< Конфигурация сети как есть.
    };

    /**
     * @brief Внешние зависимости команд.
     */
    struct Collaborators
    {
        NetConfig::NetNSOpener &netns;
        NetConfig::LinkOps     &links;
        NetConfig::Sysctl      &sysctl;
        IpamExecutor           &ipam;
        MacLookup              &mac_lookup;
    };

    /**
     * @brief Чем уже существующий интерфейс отличается от того, что создал бы ADD.
     *
     * Родителя сравнить нельзя: IFLA_LINK указывает на ifindex в namespace хоста.
     * Проверяется только, что он есть.
     */
    std::vector<std::string> ReuseWarnings(const NetConfig::LinkInfo &existing,
                                           const NetConf             &conf);

    /**
     * @throws PluginError
     */
    Result CmdAdd(const CmdArgs &args,
                  Collaborators &c);

    /**
     * @throws PluginError
     */
    void CmdDel(const CmdArgs &args,
                Collaborators &c);
} // namespace Macvlan
