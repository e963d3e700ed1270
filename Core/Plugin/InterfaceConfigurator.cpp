#include "InterfaceConfigurator.hpp"
#include "Errors.hpp"
#include "Core/Logger.hpp"

#include <string>
#include <utility>

namespace Macvlan
{
    void InjectDefaultRoute(IPConfig &ip4)
    {
        const NetConfig::CidrV4 def = NetConfig::default_route_v4();

        bool found = false;
        for (const Route &r : ip4.routes)
        {
            if (!(r.dst == def))
            {
                continue;
            }
            if (r.gw_be && r.gw_be != ip4.gateway_be)
            {
                throw PluginError(ErrorCode::GatewayConflict,
                                  "isDefaultGateway ineffective because IPAM sets default route via "
                                  + NetConfig::format_ip4(*r.gw_be));
            }
            found = true;
        }

        const std::string via = ip4.gateway_be ? NetConfig::format_ip4(*ip4.gateway_be)
                                               : std::string("link scope");
        if (found)
        {
            LOGD("configure") << "InjectDefaultRoute: default route (" << via << ") already present";
        }
        else
        {
            LOGD("configure") << "InjectDefaultRoute: adding default route (" << via << ")";
        }

        ip4.routes.push_back(Route { def, ip4.gateway_be });
    }

    InterfaceConfigurator::InterfaceConfigurator(NetConfig::LinkOps &links)
        : links_(links)
    {
    }

    void InterfaceConfigurator::Configure(const std::string &if_name,
                                          const std::string &mac,
                                          Result            &result,
                                          bool               is_default_gw)
    {
        try
        {
            links_.SetHardwareAddr(if_name, mac);
        }
        catch (const std::exception &e)
        {
            throw PluginError(ErrorCode::MacAddressSetFailed,
                              "failed to set MAC " + mac + " on " + if_name + ": " + e.what());
        }
        LOGD("configure") << "Configure: " << if_name << " mac=" << mac;

        if (!result.ip4)
        {
            throw PluginError(ErrorCode::MissingIPv4Config, "IPAM plugin returned missing IPv4 config");
        }

        if (is_default_gw)
        {
            InjectDefaultRoute(*result.ip4);
        }

        Apply(if_name, *result.ip4);
    }

    void InterfaceConfigurator::Apply(const std::string &if_name,
                                      const IPConfig    &ip4)
    {
        try
        {
            links_.SetUp(if_name);
            links_.AddAddress(if_name, ip4.ip);

            for (const Route &r : ip4.routes)
            {
                const std::optional<std::uint32_t> gw = r.gw_be ? r.gw_be : ip4.gateway_be;
                links_.AddRoute(if_name, r.dst, gw);
            }
        }
        catch (const std::exception &e)
        {
            throw PluginError(ErrorCode::InterfaceConfigFailed,
                              "failed to configure " + if_name + ": " + e.what());
        }

        LOGI("configure") << "Apply: " << if_name << " " << NetConfig::format_cidr4(ip4.ip)
                          << " routes=" << ip4.routes.size();
    }
} // namespace Macvlan
