#pragma once

#include "Cidr.hpp"

#include <cstdint>
#include <optional>
#include <string>

/**
 * @file Links.hpp
 * @brief Операции над сетевыми интерфейсами (libnl-route).
 *
 * Каждая операция открывает свой NETLINK_ROUTE сокет, а сокет
 * привязывается к namespace потока в момент создания. Поэтому все вызовы
 * относятся к namespace, в котором поток находится сейчас.
 *
 * Ошибки ядра/libnl: std::runtime_error с текстом nl_geterror().
 */

namespace NetConfig
{
    enum class MacvlanMode
    {
        Bridge,
        Private,
        Vepa,
        Passthru
    };

    const char *ToString(MacvlanMode mode);

    struct LinkInfo
    {
        std::string  name;
        int          index        = 0;
        int          parent_index = 0; ///< IFLA_LINK (0: нет)
        std::string  kind;             ///< "macvlan", "veth", ... или пусто
        unsigned int mtu          = 0;
        bool         up           = false;
    };

    /**
     * @brief Параметры нового macvlan.
     */
    struct MacvlanSpec
    {
        std::string name;
        int         mtu          = 0;  ///< 0: унаследовать от master
        int         parent_index = 0;
        MacvlanMode mode         = MacvlanMode::Bridge;
        int         netns_fd     = -1; ///< куда сразу переместить; -1: оставить здесь
    };

    class LinkOps
    {
    public:
        virtual ~LinkOps() = default;

        /// std::nullopt: интерфейса нет.
        virtual std::optional<LinkInfo> FindByName(const std::string &name) = 0;

        /**
         * @brief Создать macvlan одним запросом RTM_NEWLINK (вместе с IFLA_NET_NS_FD).
         */
        virtual void CreateMacvlan(const MacvlanSpec &spec) = 0;

        virtual void Rename(const std::string &current,
                            const std::string &next) = 0;

        /// false: интерфейса уже нет.
        virtual bool Delete(const std::string &name) = 0;

        virtual void SetUp(const std::string &name) = 0;
        virtual void SetDown(const std::string &name) = 0;

        /**
         * @param mac "aa:bb:cc:dd:ee:ff"
         */
        virtual void SetHardwareAddr(const std::string &name,
                                     const std::string &mac) = 0;

        /// Уже существующий адрес: не ошибка.
        virtual void AddAddress(const std::string &name,
                                const CidrV4      &local) = 0;

        /**
         * @brief Маршрут через интерфейс; без gw: scope link.
         * Уже существующий маршрут: не ошибка.
         */
        virtual void AddRoute(const std::string                  &name,
                              const CidrV4                       &dst,
                              const std::optional<std::uint32_t> &gw_be) = 0;
    };

    class NetlinkLinks : public LinkOps
    {
    public:
        std::optional<LinkInfo> FindByName(const std::string &name) override;
        void CreateMacvlan(const MacvlanSpec &spec) override;
        void Rename(const std::string &current,
                    const std::string &next) override;
        bool Delete(const std::string &name) override;
        void SetUp(const std::string &name) override;
        void SetDown(const std::string &name) override;
        void SetHardwareAddr(const std::string &name,
                             const std::string &mac) override;
        void AddAddress(const std::string &name,
                        const CidrV4      &local) override;
        void AddRoute(const std::string                  &name,
                      const CidrV4                       &dst,
                      const std::optional<std::uint32_t> &gw_be) override;
    };

    /**
     * @brief Случайное имя вида "vethXXXXXXXX" (4 случайных байта в hex).
     */
    std::string RandomLinkName();
} // namespace NetConfig
