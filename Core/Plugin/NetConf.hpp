#pragma once

#include "Result.hpp"
#include "Core/Net/Links.hpp"

#include <string>

/**
 * @file NetConf.hpp
 * @brief Конфигурация сети (stdin) и аргументы вызова (CNI_ARGS).
 */

namespace Macvlan
{
    /// Адрес сервиса метаданных по умолчанию.
    constexpr const char *kDefaultMetadataUrl = "http://rancher-metadata/2015-12-19";

    /**
     * @brief Разобранная конфигурация сети. Неизменна в течение вызова.
     */
    struct NetConf
    {
        std::string cni_version;
        std::string name;
        std::string type;

        std::string master;            ///< Интерфейс хоста (обязателен).
        std::string mode = "bridge";   ///< bridge | private | vepa | passthru
        int         mtu  = 0;          ///< 0: унаследовать
        bool        is_default_gw = false;

        std::string ipam_type;         ///< Бинарник IPAM-плагина из ipam.type.
        DNS         dns;

        std::string metadata_url = kDefaultMetadataUrl;
    };

    /**
     * @brief Аргументы вызова, распознаваемые плагином.
     */
    struct NetArgs
    {
        bool        ignore_unknown = false;
        std::string rancher_container_uuid; ///< Устаревшая подсказка для поиска MAC.
        std::string link_mtu_overhead;      ///< Принимается, но не используется.
        std::string mac_address;            ///< Явный MAC, отменяет поиск.
    };

    /**
     * @throws PluginError(InvalidConfig)
     */
    NetConf LoadConf(const std::string &bytes);

    /**
     * @brief Разобрать "K1=V1;K2=V2".
     * @throws PluginError(InvalidConfig)
     */
    NetArgs LoadNetArgs(const std::string &args);

    /**
     * @brief "" и "bridge": Bridge.
     * @throws PluginError(InvalidConfig) для неизвестного режима.
     */
    NetConfig::MacvlanMode ModeFromString(const std::string &s);
} // namespace Macvlan
