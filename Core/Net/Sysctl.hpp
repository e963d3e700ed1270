#pragma once

#include <string>

/**
 * @file Sysctl.hpp
 * @brief Запись sysctl по dotted-имени ("net.ipv4.conf.eth0.proxy_arp").
 *
 * Значения /proc/sys/net относятся к сетевому namespace вызывающего
 * потока, поэтому вызывать внутри NetNS::Do для ключей контейнера.
 */

namespace NetConfig
{
    class Sysctl
    {
    public:
        virtual ~Sysctl() = default;

        /**
         * @brief Записать значение.
         * @throws std::runtime_error если ключ не открылся или запись неполная.
         */
        virtual void Set(const std::string &dotted,
                         const std::string &value) = 0;
    };

    /**
     * @brief Реализация через /proc/sys.
     */
    class ProcSysctl : public Sysctl
    {
    public:
        void Set(const std::string &dotted,
                 const std::string &value) override;

        /**
         * @brief "net.ipv4.ip_forward" -> "/proc/sys/net/ipv4/ip_forward".
         */
        static std::string ToProcSysPath(const std::string &dotted);
    };
} // namespace NetConfig
