#include "Provisioner.hpp"
#include "Errors.hpp"
#include "Core/Logger.hpp"

#include <optional>
#include <stdexcept>

namespace
{
    constexpr int kTempNameAttempts = 16;
}

namespace Macvlan
{
    Provisioner::Provisioner(NetConfig::LinkOps &links,
                             NetConfig::Sysctl  &sysctl)
        : links_(links), sysctl_(sysctl)
    {
    }

    std::string Provisioner::PickTemporaryName()
    {
        for (int i = 0; i < kTempNameAttempts; ++i)
        {
            std::string name = NetConfig::RandomLinkName();
            if (!links_.FindByName(name))
            {
                return name;
            }
            LOGD("provisioner") << "PickTemporaryName: " << name << " is taken";
        }
        throw std::runtime_error("no free temporary interface name");
    }

    void Provisioner::RollbackDelete(const std::string &name) noexcept
    {
        try
        {
            if (!links_.Delete(name))
            {
                LOGD("provisioner") << "RollbackDelete: " << name << " already gone";
            }
            else
            {
                LOGI("provisioner") << "RollbackDelete: removed " << name;
            }
        }
        catch (const std::exception &e)
        {
            LOGW("provisioner") << "RollbackDelete: " << name << ": " << e.what();
        }
    }

    void Provisioner::Provision(const NetConf     &conf,
                                const std::string &if_name,
                                NetConfig::NetNS  &netns)
    {
        const NetConfig::MacvlanMode mode = ModeFromString(conf.mode);

        std::optional<NetConfig::LinkInfo> master;
        try
        {
            master = links_.FindByName(conf.master);
        }
        catch (const std::exception &e)
        {
            throw PluginError(ErrorCode::MasterNotFound,
                              "failed to lookup master \"" + conf.master + "\": " + e.what());
        }
        if (!master)
        {
            throw PluginError(ErrorCode::MasterNotFound,
                              "failed to lookup master \"" + conf.master + "\": link not found");
        }

        NetConfig::MacvlanSpec spec;
        spec.mtu          = conf.mtu;
        spec.parent_index = master->index;
        spec.mode         = mode;
        spec.netns_fd     = netns.Fd();

        try
        {
            spec.name = PickTemporaryName();
            links_.CreateMacvlan(spec);
        }
        catch (const std::exception &e)
        {
            throw PluginError(ErrorCode::LinkCreationFailed,
                              std::string("failed to create macvlan: ") + e.what());
        }

        LOGI("provisioner") << "Provision: created " << spec.name
                            << " on " << conf.master
                            << " mode=" << NetConfig::ToString(mode)
                            << " mtu=" << spec.mtu
                            << " in " << netns.Path();

        const std::string tmp = spec.name;
        netns.Do([&](NetConfig::NetNS &)
        {
            const std::string key = "net.ipv4.conf." + tmp + ".proxy_arp";
            try
            {
                sysctl_.Set(key, "1");
            }
            catch (const std::exception &e)
            {
                RollbackDelete(tmp);
                throw PluginError(ErrorCode::ProxyArpSetupFailed,
                                  "failed to set proxy_arp on newly added interface " + tmp + ": " + e.what());
            }

            try
            {
                links_.Rename(tmp, if_name);
            }
            catch (const std::exception &e)
            {
                RollbackDelete(tmp);
                throw PluginError(ErrorCode::RenameFailed,
                                  "failed to rename macvlan " + tmp + " to \"" + if_name + "\": " + e.what());
            }
        });

        LOGI("provisioner") << "Provision: " << tmp << " renamed to " << if_name;
    }
} // namespace Macvlan
