#include "Result.hpp"
#include "Core/Config.hpp"
#include "Core/Logger.hpp"

#include <stdexcept>
#include <utility>

#include <boost/json.hpp>

namespace
{
    NetConfig::CidrV4 RequireCidr(const boost::json::object &o,
                                  const char                *key)
    {
        const std::string s = Config::RequireString(o, key);
        NetConfig::CidrV4 c;
        if (!NetConfig::parse_cidr4(s, c))
        {
            throw std::runtime_error(std::string("invalid CIDR in \"") + key + "\": " + s);
        }
        return c;
    }

    std::optional<std::uint32_t> OptionalIp(const boost::json::object &o,
                                            const char                *key)
    {
        const std::string s = Config::OptionalString(o, key);
        if (s.empty())
        {
            return std::nullopt;
        }
        std::uint32_t be = 0;
        if (!NetConfig::parse_ip4(s, be))
        {
            throw std::runtime_error(std::string("invalid IPv4 address in \"") + key + "\": " + s);
        }
        return be;
    }

    Macvlan::IPConfig ParseIp4(const boost::json::object &o)
    {
        Macvlan::IPConfig c;
        c.ip         = RequireCidr(o, "ip");
        c.gateway_be = OptionalIp(o, "gateway");

        const boost::json::value *routes = o.if_contains("routes");
        if (routes && !routes->is_null())
        {
            if (!routes->is_array())
            {
                throw std::runtime_error("\"routes\" must be an array");
            }
            for (const boost::json::value &rv : routes->as_array())
            {
                if (!rv.is_object())
                {
                    throw std::runtime_error("route entry must be an object");
                }
                Macvlan::Route r;
                r.dst   = RequireCidr(rv.as_object(), "dst");
                r.gw_be = OptionalIp(rv.as_object(), "gw");
                c.routes.push_back(r);
            }
        }
        return c;
    }

    boost::json::array ToArray(const std::vector<std::string> &v)
    {
        boost::json::array a;
        for (const std::string &s : v)
        {
            a.emplace_back(s);
        }
        return a;
    }
}

namespace Macvlan
{
    DNS ParseDns(const boost::json::object &o)
    {
        DNS d;
        d.nameservers = Config::OptionalStringArray(o, "nameservers");
        d.domain      = Config::OptionalString(o, "domain");
        d.search      = Config::OptionalStringArray(o, "search");
        d.options     = Config::OptionalStringArray(o, "options");
        return d;
    }

    Result ParseResult(const std::string &json)
    {
        boost::json::error_code ec;
        boost::json::value      jv = boost::json::parse(json, ec);
        if (ec)
        {
            throw std::runtime_error("failed to parse IPAM result: " + ec.message());
        }
        if (!jv.is_object())
        {
            throw std::runtime_error("IPAM result must be a JSON object");
        }
        const boost::json::object &o = jv.as_object();

        Result r;
        r.cni_version = Config::OptionalString(o, "cniVersion", kCniVersion);

        const boost::json::object &ip4 = Config::OptionalObject(o, "ip4");
        if (!ip4.empty())
        {
            r.ip4 = ParseIp4(ip4);
        }

        const boost::json::value *ip6 = o.if_contains("ip6");
        r.has_ip6 = ip6 && !ip6->is_null();

        r.dns = ParseDns(Config::OptionalObject(o, "dns"));

        LOGD("result") << "ParseResult: ip4=" << (r.ip4 ? NetConfig::format_cidr4(r.ip4->ip) : std::string("<none>"))
                       << " routes=" << (r.ip4 ? r.ip4->routes.size() : 0)
                       << " ip6=" << (r.has_ip6 ? "yes" : "no");
        return r;
    }

    std::string ResultToJson(const Result &r)
    {
        boost::json::object o;
        o["cniVersion"] = r.cni_version;

        if (r.ip4)
        {
            boost::json::object ip4;
            ip4["ip"] = NetConfig::format_cidr4(r.ip4->ip);
            if (r.ip4->gateway_be)
            {
                ip4["gateway"] = NetConfig::format_ip4(*r.ip4->gateway_be);
            }

            boost::json::array routes;
            for (const Route &rt : r.ip4->routes)
            {
                boost::json::object ro;
                ro["dst"] = NetConfig::format_cidr4(rt.dst);
                if (rt.gw_be)
                {
                    ro["gw"] = NetConfig::format_ip4(*rt.gw_be);
                }
                routes.emplace_back(std::move(ro));
            }
            if (!routes.empty())
            {
                ip4["routes"] = std::move(routes);
            }
            o["ip4"] = std::move(ip4);
        }

        boost::json::object dns;
        if (!r.dns.nameservers.empty()) dns["nameservers"] = ToArray(r.dns.nameservers);
        if (!r.dns.domain.empty())      dns["domain"]      = r.dns.domain;
        if (!r.dns.search.empty())      dns["search"]      = ToArray(r.dns.search);
        if (!r.dns.options.empty())     dns["options"]     = ToArray(r.dns.options);
        o["dns"] = std::move(dns);

        return boost::json::serialize(o);
    }
} // namespace Macvlan
