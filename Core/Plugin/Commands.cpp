#include "Commands.hpp"
#include "AddressResolver.hpp"
#include "Errors.hpp"
#include "InterfaceConfigurator.hpp"
#include "NetConf.hpp"
#include "Provisioner.hpp"
#include "Core/Logger.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace
{
    std::unique_ptr<NetConfig::NetNS> OpenNetNS(NetConfig::NetNSOpener &opener,
                                                const std::string      &path)
    {
        try
        {
            return opener.Open(path);
        }
        catch (const NetConfig::NetNSOpenError &e)
        {
            LOGD("cmd") << "OpenNetNS: " << path << " errno=" << e.Errno();
            if (e.Missing())
            {
                throw Macvlan::NetNSMissing(e.what());
            }
            throw Macvlan::PluginError(Macvlan::ErrorCode::NamespaceNotFound,
                                       e.what());
        }
    }
}

namespace Macvlan
{
    std::vector<std::string> ReuseWarnings(const NetConfig::LinkInfo &existing,
                                           const NetConf             &conf)
    {
        std::vector<std::string> out;
        if (existing.kind != "macvlan")
        {
            out.push_back("kind \"" + existing.kind + "\", expected macvlan");
        }
        if (existing.parent_index == 0)
        {
            out.push_back("no parent link, expected " + conf.master);
        }
        if (conf.mtu != 0 && existing.mtu != static_cast<unsigned int>(conf.mtu))
        {
            out.push_back("mtu " + std::to_string(existing.mtu) + ", expected " + std::to_string(conf.mtu));
        }
        return out;
    }

    Result CmdAdd(const CmdArgs &args,
                  Collaborators &c)
    {
        const NetConf conf = LoadConf(args.stdin_data);
        const NetArgs na   = LoadNetArgs(args.args);

        LOGI("cmd") << "ADD: container=" << args.container_id
                    << " netns=" << args.netns
                    << " ifname=" << args.if_name
                    << " master=" << conf.master;

        std::unique_ptr<NetConfig::NetNS> netns = OpenNetNS(c.netns, args.netns);

        std::optional<NetConfig::LinkInfo> existing;
        netns->Do([&](NetConfig::NetNS &)
        {
            try
            {
                existing = c.links.FindByName(args.if_name);
            }
            catch (const std::exception &e)
            {
                throw PluginError(ErrorCode::InterfaceConfigFailed,
                                  "failed to lookup " + args.if_name + " in " + args.netns + ": " + e.what());
            }
            if (!existing)
            {
                return;
            }

            for (const std::string &w : ReuseWarnings(*existing, conf))
            {
                LOGW("cmd") << "ADD: reusing " << args.if_name << ": " << w;
            }
            try
            {
                c.links.SetDown(args.if_name);
            }
            catch (const std::exception &e)
            {
                LOGW("cmd") << "ADD: failed to set " << args.if_name << " down: " << e.what();
            }
        });

        if (existing)
        {
            LOGI("cmd") << "ADD: " << args.if_name << " already exists, reusing";
        }
        else
        {
            Provisioner(c.links, c.sysctl).Provision(conf, args.if_name, *netns);
        }

        Result result = c.ipam.ExecAdd(conf.ipam_type, args.stdin_data);
        if (!result.ip4)
        {
            throw PluginError(ErrorCode::MissingIPv4Config, "IPAM plugin returned missing IPv4 config");
        }
        if (result.has_ip6)
        {
            LOGW("cmd") << "ADD: IPAM returned ip6 config, ignored";
        }

        const std::string mac = AddressResolver(c.mac_lookup, conf.metadata_url)
                                    .Resolve(args.container_id, na.mac_address, na.rancher_container_uuid);

        netns->Do([&](NetConfig::NetNS &)
        {
            InterfaceConfigurator(c.links).Configure(args.if_name, mac, result, conf.is_default_gw);
        });

        result.cni_version = kCniVersion;
        result.has_ip6     = false;
        result.dns         = conf.dns;

        LOGI("cmd") << "ADD: done " << args.if_name << " " << NetConfig::format_cidr4(result.ip4->ip)
                    << " mac=" << mac;
        return result;
    }

    void CmdDel(const CmdArgs &args,
                Collaborators &c)
    {
        const NetConf conf = LoadConf(args.stdin_data);

        LOGI("cmd") << "DEL: container=" << args.container_id
                    << " netns=" << args.netns
                    << " ifname=" << args.if_name;

        c.ipam.ExecDel(conf.ipam_type, args.stdin_data);

        if (args.netns.empty())
        {
            LOGI("cmd") << "DEL: no netns, nothing to remove";
            return;
        }

        std::unique_ptr<NetConfig::NetNS> netns;
        try
        {
            netns = OpenNetNS(c.netns, args.netns);
        }
        catch (const NetNSMissing &e)
        {
            LOGI("cmd") << "DEL: " << e.what() << ", treating as removed";
            return;
        }

        netns->Do([&](NetConfig::NetNS &)
        {
            bool removed = false;
            try
            {
                removed = c.links.Delete(args.if_name);
            }
            catch (const std::exception &e)
            {
                throw PluginError(ErrorCode::InterfaceConfigFailed,
                                  "failed to delete " + args.if_name + ": " + e.what());
            }
            if (removed)
            {
                LOGI("cmd") << "DEL: removed " << args.if_name;
            }
            else
            {
                LOGI("cmd") << "DEL: " << args.if_name << " already absent";
            }
        });
    }
} // namespace Macvlan
