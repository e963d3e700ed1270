#pragma once

#include <cstdint>
#include <string>

/**
 * @file Cidr.hpp
 * @brief Адреса и CIDR-блоки IPv4.
 */

namespace NetConfig
{
    /**
     * @brief CIDR-блок IPv4.
     */
    struct CidrV4
    {
        std::uint32_t addr_be = 0; ///< Адрес в big-endian (network byte order).
        std::uint8_t  prefix  = 0; ///< Длина префикса (0–32).
    };

    bool operator==(const CidrV4 &a,
                    const CidrV4 &b);

    /**
     * @brief Разобрать строку IPv4 CIDR.
     * @param s Строка "A.B.C.D/len"; без "/len": ошибка.
     * @param out Результат (хостовые биты сохраняются).
     * @return true при успехе.
     */
    bool parse_cidr4(const std::string &s,
                     CidrV4            &out);

    /**
     * @brief Разобрать адрес IPv4 без префикса.
     */
    bool parse_ip4(const std::string &s,
                   std::uint32_t     &out_be);

    /// "A.B.C.D"
    std::string format_ip4(std::uint32_t addr_be);

    /// "A.B.C.D/p" без нормализации
    std::string format_cidr4(const CidrV4 &c);

    /**
     * @brief Нормализовать к сети "A.B.C.D/p" (обнулить хостовые биты).
     */
    CidrV4 to_network(const CidrV4 &c);

    std::string to_network_cidr(const CidrV4 &c);

    /// 0.0.0.0/0
    CidrV4 default_route_v4();
} // namespace NetConfig
