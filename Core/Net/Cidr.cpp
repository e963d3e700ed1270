#include "Cidr.hpp"
#include "Core/Logger.hpp"

#include <arpa/inet.h>

#include <cctype>
#include <cstring>

namespace NetConfig
{
    bool operator==(const CidrV4 &a,
                    const CidrV4 &b)
    {
        return a.addr_be == b.addr_be && a.prefix == b.prefix;
    }

    bool parse_ip4(const std::string &s,
                   std::uint32_t     &out_be)
    {
        in_addr ia{};
        if (inet_pton(AF_INET, s.c_str(), &ia) != 1)
        {
            LOGT("net") << "parse_ip4: inet_pton failed ip=" << s;
            return false;
        }
        std::memcpy(&out_be, &ia.s_addr, sizeof(out_be));
        return true;
    }

    bool parse_cidr4(const std::string &s,
                     CidrV4            &out)
    {
        LOGT("net") << "parse_cidr4: s=" << s;
        const auto pos = s.find('/');
        if (pos == std::string::npos)
        {
            LOGD("net") << "parse_cidr4: missing prefix s=" << s;
            return false;
        }

        const std::string ip   = s.substr(0, pos);
        const std::string pref = s.substr(pos + 1);
        if (pref.empty() || pref.size() > 2)
        {
            return false;
        }
        for (char c : pref)
        {
            if (!std::isdigit(static_cast<unsigned char>(c)))
            {
                return false;
            }
        }

        const int p = std::stoi(pref);
        if (p < 0 || p > 32)
        {
            LOGD("net") << "parse_cidr4: prefix out of range pref=" << p;
            return false;
        }

        std::uint32_t be = 0;
        if (!parse_ip4(ip, be))
        {
            return false;
        }
        out.addr_be = be;
        out.prefix  = static_cast<std::uint8_t>(p);
        return true;
    }

    std::string format_ip4(std::uint32_t addr_be)
    {
        in_addr ia{};
        std::memcpy(&ia.s_addr, &addr_be, sizeof(addr_be));

        char buf[INET_ADDRSTRLEN]{};
        inet_ntop(AF_INET, &ia, buf, sizeof(buf));
        return buf;
    }

    std::string format_cidr4(const CidrV4 &c)
    {
        return format_ip4(c.addr_be) + "/" + std::to_string(static_cast<int>(c.prefix));
    }

    CidrV4 to_network(const CidrV4 &c)
    {
        std::uint32_t host = 0;
        if (c.prefix == 0)
        {
            host = 0xFFFFFFFFu;
        }
        else if (c.prefix < 32)
        {
            host = 0xFFFFFFFFu >> c.prefix;
        }
        CidrV4 n;
        n.addr_be = c.addr_be & ~htonl(host);
        n.prefix  = c.prefix;
        return n;
    }

    std::string to_network_cidr(const CidrV4 &c)
    {
        return format_cidr4(to_network(c));
    }

    CidrV4 default_route_v4()
    {
        return CidrV4{ 0, 0 };
    }
} // namespace NetConfig
