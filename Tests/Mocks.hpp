#pragma once

#include "Core/Net/Links.hpp"
#include "Core/Net/NetNS.hpp"
#include "Core/Net/Sysctl.hpp"
#include "Core/Plugin/Ipam.hpp"
#include "Core/Plugin/MacLookup.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <gmock/gmock.h>

// Моки и фейки для тестов без root: ядро моделируется таблицей линков
// на каждый namespace.

namespace Testing
{
    class MockSysctl : public NetConfig::Sysctl
    {
    public:
        MOCK_METHOD(void, Set, (const std::string &, const std::string &), (override));
    };

    class MockIpam : public Macvlan::IpamExecutor
    {
    public:
        MOCK_METHOD(Macvlan::Result, ExecAdd, (const std::string &, const std::string &), (override));
        MOCK_METHOD(void, ExecDel, (const std::string &, const std::string &), (override));
    };

    class MockMacLookup : public Macvlan::MacLookup
    {
    public:
        MOCK_METHOD(std::string, Find, (const std::string &, const std::string &, const std::string &), (override));
    };

    class MockNetNSOpener : public NetConfig::NetNSOpener
    {
    public:
        MOCK_METHOD(std::unique_ptr<NetConfig::NetNS>, Open, (const std::string &), (override));
    };

    class MockLinks : public NetConfig::LinkOps
    {
    public:
        MOCK_METHOD(std::optional<NetConfig::LinkInfo>, FindByName, (const std::string &), (override));
        MOCK_METHOD(void, CreateMacvlan, (const NetConfig::MacvlanSpec &), (override));
        MOCK_METHOD(void, Rename, (const std::string &, const std::string &), (override));
        MOCK_METHOD(bool, Delete, (const std::string &), (override));
        MOCK_METHOD(void, SetUp, (const std::string &), (override));
        MOCK_METHOD(void, SetDown, (const std::string &), (override));
        MOCK_METHOD(void, SetHardwareAddr, (const std::string &, const std::string &), (override));
        MOCK_METHOD(void, AddAddress, (const std::string &, const NetConfig::CidrV4 &), (override));
        MOCK_METHOD(void,
                    AddRoute,
                    (const std::string &, const NetConfig::CidrV4 &, const std::optional<std::uint32_t> &),
                    (override));
    };

    /**
     * @brief Линки по namespace; id 0: namespace хоста.
     */
    class FakeKernel : public NetConfig::LinkOps
    {
    public:
        struct AppliedRoute
        {
            NetConfig::CidrV4            dst;
            std::optional<std::uint32_t> gw_be;
        };

        struct Link
        {
            NetConfig::LinkInfo              info;
            std::string                      mac;
            std::vector<NetConfig::CidrV4>   addrs;
            std::vector<AppliedRoute>        routes;
        };

        int current = 0;
        int next_index = 100;

        std::map<int, std::map<std::string, Link>> ns;

        bool fail_create = false;
        bool fail_rename = false;
        bool fail_delete = false;

        void AddHostLink(const std::string &name)
        {
            Link l;
            l.info.name  = name;
            l.info.index = next_index++;
            l.info.kind  = "";
            ns[0][name]  = l;
        }

        std::map<std::string, Link> &In(int id) { return ns[id]; }

        std::optional<NetConfig::LinkInfo> FindByName(const std::string &name) override
        {
            auto &m  = ns[current];
            auto  it = m.find(name);
            if (it == m.end())
            {
                return std::nullopt;
            }
            return it->second.info;
        }

        void CreateMacvlan(const NetConfig::MacvlanSpec &spec) override
        {
            if (fail_create)
            {
                throw std::runtime_error("rtnl_link_add: Object exists");
            }
            const int target = spec.netns_fd >= 0 ? spec.netns_fd : current;
            if (ns[target].count(spec.name))
            {
                throw std::runtime_error("rtnl_link_add: Object exists");
            }
            Link l;
            l.info.name         = spec.name;
            l.info.index        = next_index++;
            l.info.parent_index = spec.parent_index;
            l.info.kind         = "macvlan";
            l.info.mtu          = static_cast<unsigned int>(spec.mtu);
            ns[target][spec.name] = l;
            created.push_back(spec);
        }

        void Rename(const std::string &cur,
                    const std::string &next) override
        {
            auto &m = ns[current];
            if (fail_rename || !m.count(cur) || m.count(next))
            {
                throw std::runtime_error("rtnl_link_change: Object exists");
            }
            Link l      = m[cur];
            l.info.name = next;
            m.erase(cur);
            m[next] = l;
        }

        bool Delete(const std::string &name) override
        {
            if (fail_delete)
            {
                throw std::runtime_error("rtnl_link_delete: Operation not permitted");
            }
            return ns[current].erase(name) > 0;
        }

        void SetUp(const std::string &name) override
        {
            Get(name).info.up = true;
        }

        void SetDown(const std::string &name) override
        {
            Get(name).info.up = false;
        }

        void SetHardwareAddr(const std::string &name,
                             const std::string &mac) override
        {
            Get(name).mac = mac;
        }

        void AddAddress(const std::string       &name,
                        const NetConfig::CidrV4 &local) override
        {
            Get(name).addrs.push_back(local);
        }

        void AddRoute(const std::string                  &name,
                      const NetConfig::CidrV4            &dst,
                      const std::optional<std::uint32_t> &gw_be) override
        {
            Get(name).routes.push_back(AppliedRoute { dst, gw_be });
        }

        std::vector<NetConfig::MacvlanSpec> created;

    private:
        Link &Get(const std::string &name)
        {
            auto &m  = ns[current];
            auto  it = m.find(name);
            if (it == m.end())
            {
                throw std::runtime_error("rtnl_link_get_kernel: Object not found");
            }
            return it->second;
        }
    };

    /**
     * @brief Namespace с id; Do переключает FakeKernel::current.
     */
    class FakeNetNS : public NetConfig::NetNS
    {
    public:
        FakeNetNS(FakeKernel &kernel,
                  int         id,
                  std::string path)
            : kernel_(kernel), id_(id), path_(std::move(path))
        {
        }

        const std::string &Path() const override { return path_; }
        int Fd() const override { return id_; }

        void Do(const std::function<void(NetConfig::NetNS &)> &fn) override
        {
            if (inside_)
            {
                throw std::logic_error("NetNS::Do is not reentrant");
            }
            struct Back
            {
                FakeKernel &k;
                int         prev;
                bool       &inside;
                ~Back()
                {
                    k.current = prev;
                    inside    = false;
                }
            } back { kernel_, kernel_.current, inside_ };

            inside_         = true;
            kernel_.current = id_;
            ++entered;
            fn(*this);
        }

        int entered = 0;

    private:
        FakeKernel &kernel_;
        int         id_;
        std::string path_;
        bool        inside_ = false;
    };
} // namespace Testing
