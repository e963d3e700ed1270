#include "NetConf.hpp"
#include "Errors.hpp"
#include "Core/Config.hpp"
#include "Core/Logger.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>
#include <utility>
#include <vector>

#include <boost/json.hpp>

namespace
{
    std::string ToLower(std::string s)
    {
        std::transform(s.begin(),
                       s.end(),
                       s.begin(),
                       [](unsigned char c)
                       {
                           return static_cast<char>(std::tolower(c));
                       });
        return s;
    }

    bool ParseArgBool(const std::string &key,
                      const std::string &value)
    {
        const std::string v = ToLower(value);
        if (v == "1" || v == "true")
        {
            return true;
        }
        if (v == "0" || v == "false")
        {
            return false;
        }
        throw Macvlan::PluginError(Macvlan::ErrorCode::InvalidConfig,
                                   "failed to parse args: boolean argument " + key + " has invalid value \"" + value + "\"");
    }
}

namespace Macvlan
{
    NetConf LoadConf(const std::string &bytes)
    {
        NetConf n;
        try
        {
            boost::json::value jv = boost::json::parse(bytes);
            if (!jv.is_object())
            {
                throw std::runtime_error("config root must be an object");
            }
            const boost::json::object &o = jv.as_object();

            n.cni_version   = Config::OptionalString(o, "cniVersion");
            n.name          = Config::OptionalString(o, "name");
            n.type          = Config::OptionalString(o, "type");
            n.master        = Config::OptionalString(o, "master");
            n.mode          = Config::OptionalString(o, "mode", "bridge");
            n.is_default_gw = Config::OptionalBool(o, "isDefaultGateway", false);
            n.metadata_url  = Config::OptionalString(o, "metadataUrl", kDefaultMetadataUrl);

            const std::int64_t mtu = Config::OptionalInt(o, "mtu", 0);
            if (mtu < 0 || mtu > 65535)
            {
                throw std::runtime_error("\"mtu\" must be between 0 and 65535, got " + std::to_string(mtu));
            }
            n.mtu = static_cast<int>(mtu);

            n.ipam_type = Config::OptionalString(Config::OptionalObject(o, "ipam"), "type");
            n.dns       = ParseDns(Config::OptionalObject(o, "dns"));
        }
        catch (const std::exception &e)
        {
            LOGE("netconf") << "LoadConf: " << e.what();
            throw PluginError(ErrorCode::InvalidConfig, std::string("failed to load netconf: ") + e.what());
        }

        if (n.master.empty())
        {
            throw PluginError(ErrorCode::InvalidConfig,
                              "\"master\" field is required. It specifies the host interface name to virtualize");
        }

        LOGD("netconf") << "LoadConf: name=" << n.name
                        << " master=" << n.master
                        << " mode=" << n.mode
                        << " mtu=" << n.mtu
                        << " isDefaultGateway=" << (n.is_default_gw ? "true" : "false")
                        << " ipam=" << n.ipam_type;
        return n;
    }

    NetArgs LoadNetArgs(const std::string &args)
    {
        NetArgs out;
        if (args.empty())
        {
            return out;
        }

        std::vector<std::pair<std::string, std::string>> unknown;

        std::stringstream ss(args);
        std::string       pair;
        while (std::getline(ss, pair, ';'))
        {
            const auto eq = pair.find('=');
            if (eq == std::string::npos || pair.find('=', eq + 1) != std::string::npos)
            {
                throw PluginError(ErrorCode::InvalidConfig,
                                  "failed to parse args " + args + ": invalid pair \"" + pair + "\"");
            }
            const std::string key   = pair.substr(0, eq);
            const std::string value = pair.substr(eq + 1);

            if (key == "IgnoreUnknown")
            {
                out.ignore_unknown = ParseArgBool(key, value);
            }
            else if (key == "RancherContainerUUID")
            {
                out.rancher_container_uuid = value;
            }
            else if (key == "LinkMTUOverhead")
            {
                out.link_mtu_overhead = value;
            }
            else if (key == "MACAddress")
            {
                out.mac_address = value;
            }
            else
            {
                unknown.emplace_back(key, value);
            }
        }

        if (!unknown.empty())
        {
            if (!out.ignore_unknown)
            {
                throw PluginError(ErrorCode::InvalidConfig,
                                  "failed to parse args " + args + ": unknown args [\"" + unknown.front().first + "\"]");
            }
            for (const auto &kv : unknown)
            {
                LOGD("netconf") << "LoadNetArgs: ignoring unknown arg " << kv.first;
            }
        }
        return out;
    }

    NetConfig::MacvlanMode ModeFromString(const std::string &s)
    {
        if (s.empty() || s == "bridge")
        {
            return NetConfig::MacvlanMode::Bridge;
        }
        if (s == "private")
        {
            return NetConfig::MacvlanMode::Private;
        }
        if (s == "vepa")
        {
            return NetConfig::MacvlanMode::Vepa;
        }
        if (s == "passthru")
        {
            return NetConfig::MacvlanMode::Passthru;
        }
        throw PluginError(ErrorCode::InvalidConfig, "unknown macvlan mode: \"" + s + "\"");
    }
} // namespace Macvlan
