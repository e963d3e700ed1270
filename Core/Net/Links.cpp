#include "Links.hpp"
#include "Core/Logger.hpp"

#include <linux/if_link.h>
#include <linux/rtnetlink.h>
#include <net/if.h>
#include <sys/socket.h>

#include <netlink/netlink.h>
#include <netlink/errno.h>
#include <netlink/addr.h>
#include <netlink/route/addr.h>
#include <netlink/route/link.h>
#include <netlink/route/link/macvlan.h>
#include <netlink/route/nexthop.h>
#include <netlink/route/route.h>

#include <cstdio>
#include <random>
#include <stdexcept>

namespace
{
    // -------- RAII for libnl socket --------
    struct NlSock
    {
        nl_sock *sk {nullptr};

        NlSock()
        {
            sk = nl_socket_alloc();
            if (!sk)
            {
                throw std::runtime_error("nl_socket_alloc failed");
            }
            int err = nl_connect(sk, NETLINK_ROUTE);
            if (err < 0)
            {
                std::string msg = std::string("nl_connect: ") + nl_geterror(err);
                nl_socket_free(sk);
                sk = nullptr;
                throw std::runtime_error(msg);
            }
        }

        ~NlSock()
        {
            if (sk) nl_socket_free(sk);
        }

        NlSock(const NlSock&) = delete;
        NlSock& operator=(const NlSock&) = delete;
    };

    struct LinkRef
    {
        rtnl_link *link {nullptr};

        LinkRef() = default;
        explicit LinkRef(rtnl_link *l) : link(l) {}
        ~LinkRef()
        {
            if (link) rtnl_link_put(link);
        }

        LinkRef(const LinkRef&) = delete;
        LinkRef& operator=(const LinkRef&) = delete;
    };

    struct AddrRef
    {
        nl_addr *addr {nullptr};

        ~AddrRef()
        {
            if (addr) nl_addr_put(addr);
        }
    };

    bool IsNotFound(int err)
    {
        return err == -NLE_OBJ_NOTFOUND || err == -NLE_NODEV;
    }

    std::string NlError(const std::string &what,
                        int                err)
    {
        return what + ": " + nl_geterror(err);
    }

    std::uint32_t KernelMode(NetConfig::MacvlanMode mode)
    {
        switch (mode)
        {
            case NetConfig::MacvlanMode::Bridge:   return MACVLAN_MODE_BRIDGE;
            case NetConfig::MacvlanMode::Private:  return MACVLAN_MODE_PRIVATE;
            case NetConfig::MacvlanMode::Vepa:     return MACVLAN_MODE_VEPA;
            case NetConfig::MacvlanMode::Passthru: return MACVLAN_MODE_PASSTHRU;
        }
        return MACVLAN_MODE_BRIDGE;
    }

    // Возвращает false, если интерфейса нет; прочие ошибки: исключение.
    bool GetLink(nl_sock           *sk,
                 const std::string &name,
                 LinkRef           &out)
    {
        rtnl_link *link = nullptr;
        const int  err  = rtnl_link_get_kernel(sk, 0, name.c_str(), &link);
        if (err < 0)
        {
            if (IsNotFound(err))
            {
                return false;
            }
            throw std::runtime_error(NlError("rtnl_link_get_kernel(" + name + ")", err));
        }
        out.link = link;
        return true;
    }

    void RequireLink(nl_sock           *sk,
                     const std::string &name,
                     LinkRef           &out)
    {
        if (!GetLink(sk, name, out))
        {
            throw std::runtime_error("link " + name + " not found");
        }
    }

    void ChangeLink(nl_sock           *sk,
                    const std::string &name,
                    rtnl_link         *changes,
                    const char        *what)
    {
        LinkRef current;
        RequireLink(sk, name, current);

        const int err = rtnl_link_change(sk, current.link, changes, 0);
        if (err < 0)
        {
            throw std::runtime_error(NlError(std::string(what) + "(" + name + ")", err));
        }
    }
}

namespace NetConfig
{
    const char *ToString(MacvlanMode mode)
    {
        switch (mode)
        {
            case MacvlanMode::Bridge:   return "bridge";
            case MacvlanMode::Private:  return "private";
            case MacvlanMode::Vepa:     return "vepa";
            case MacvlanMode::Passthru: return "passthru";
        }
        return "unknown";
    }

    std::optional<LinkInfo> NetlinkLinks::FindByName(const std::string &name)
    {
        LOGT("links") << "FindByName: " << name;
        NlSock  nl;
        LinkRef ref;
        if (!GetLink(nl.sk, name, ref))
        {
            LOGT("links") << "FindByName: " << name << " absent";
            return std::nullopt;
        }

        LinkInfo info;
        info.name         = name;
        info.index        = rtnl_link_get_ifindex(ref.link);
        info.parent_index = rtnl_link_get_link(ref.link);
        info.mtu          = rtnl_link_get_mtu(ref.link);
        info.up           = (rtnl_link_get_flags(ref.link) & IFF_UP) != 0;
        if (const char *kind = rtnl_link_get_type(ref.link))
        {
            info.kind = kind;
        }
        return info;
    }

    void NetlinkLinks::CreateMacvlan(const MacvlanSpec &spec)
    {
        LOGD("links") << "CreateMacvlan: name=" << spec.name
                      << " parent=" << spec.parent_index
                      << " mode=" << ToString(spec.mode)
                      << " mtu=" << spec.mtu
                      << " netns_fd=" << spec.netns_fd;
        NlSock  nl;
        LinkRef link(rtnl_link_macvlan_alloc());
        if (!link.link)
        {
            throw std::runtime_error("rtnl_link_macvlan_alloc failed");
        }

        rtnl_link_set_name(link.link, spec.name.c_str());
        rtnl_link_set_link(link.link, spec.parent_index);
        if (spec.mtu > 0)
        {
            rtnl_link_set_mtu(link.link, static_cast<unsigned int>(spec.mtu));
        }

        int err = rtnl_link_macvlan_set_mode(link.link, KernelMode(spec.mode));
        if (err < 0)
        {
            throw std::runtime_error(NlError("rtnl_link_macvlan_set_mode", err));
        }
        if (spec.netns_fd >= 0)
        {
            rtnl_link_set_ns_fd(link.link, spec.netns_fd);
        }

        err = rtnl_link_add(nl.sk, link.link, NLM_F_CREATE | NLM_F_EXCL);
        if (err < 0)
        {
            LOGE("links") << "CreateMacvlan: rtnl_link_add rc=" << err;
            throw std::runtime_error(NlError("rtnl_link_add(" + spec.name + ")", err));
        }
        LOGI("links") << "CreateMacvlan: created " << spec.name;
    }

    void NetlinkLinks::Rename(const std::string &current,
                              const std::string &next)
    {
        LOGD("links") << "Rename: " << current << " -> " << next;
        NlSock  nl;
        LinkRef changes(rtnl_link_alloc());
        if (!changes.link)
        {
            throw std::runtime_error("rtnl_link_alloc failed");
        }
        rtnl_link_set_name(changes.link, next.c_str());
        ChangeLink(nl.sk, current, changes.link, "rename");
    }

    bool NetlinkLinks::Delete(const std::string &name)
    {
        LOGD("links") << "Delete: " << name;
        NlSock  nl;
        LinkRef ref;
        if (!GetLink(nl.sk, name, ref))
        {
            LOGD("links") << "Delete: " << name << " already absent";
            return false;
        }

        const int err = rtnl_link_delete(nl.sk, ref.link);
        if (err < 0)
        {
            if (IsNotFound(err))
            {
                return false;
            }
            throw std::runtime_error(NlError("rtnl_link_delete(" + name + ")", err));
        }
        LOGI("links") << "Delete: removed " << name;
        return true;
    }

    void NetlinkLinks::SetUp(const std::string &name)
    {
        LOGD("links") << "SetUp: " << name;
        NlSock  nl;
        LinkRef changes(rtnl_link_alloc());
        if (!changes.link)
        {
            throw std::runtime_error("rtnl_link_alloc failed");
        }
        rtnl_link_set_flags(changes.link, IFF_UP);
        ChangeLink(nl.sk, name, changes.link, "set up");
    }

    void NetlinkLinks::SetDown(const std::string &name)
    {
        LOGD("links") << "SetDown: " << name;
        NlSock  nl;
        LinkRef changes(rtnl_link_alloc());
        if (!changes.link)
        {
            throw std::runtime_error("rtnl_link_alloc failed");
        }
        rtnl_link_unset_flags(changes.link, IFF_UP);
        ChangeLink(nl.sk, name, changes.link, "set down");
    }

    void NetlinkLinks::SetHardwareAddr(const std::string &name,
                                       const std::string &mac)
    {
        LOGD("links") << "SetHardwareAddr: " << name << " mac=" << mac;
        AddrRef hw;
        int     err = nl_addr_parse(mac.c_str(), AF_LLC, &hw.addr);
        if (err < 0)
        {
            throw std::runtime_error(NlError("invalid MAC address \"" + mac + "\"", err));
        }
        if (nl_addr_get_len(hw.addr) != 6)
        {
            throw std::runtime_error("invalid MAC address \"" + mac + "\": expected 6 bytes");
        }

        NlSock  nl;
        LinkRef changes(rtnl_link_alloc());
        if (!changes.link)
        {
            throw std::runtime_error("rtnl_link_alloc failed");
        }
        rtnl_link_set_addr(changes.link, hw.addr);
        ChangeLink(nl.sk, name, changes.link, "set address");
        LOGI("links") << "SetHardwareAddr: " << name << " -> " << mac;
    }

    void NetlinkLinks::AddAddress(const std::string &name,
                                  const CidrV4      &local)
    {
        LOGD("links") << "AddAddress: " << name << " " << format_cidr4(local);
        NlSock  nl;
        LinkRef link;
        RequireLink(nl.sk, name, link);

        rtnl_addr *a = rtnl_addr_alloc();
        if (!a)
        {
            throw std::runtime_error("rtnl_addr_alloc failed");
        }
        rtnl_addr_set_ifindex(a, rtnl_link_get_ifindex(link.link));
        rtnl_addr_set_family(a, AF_INET);

        nl_addr *l = nl_addr_build(AF_INET, &local.addr_be, sizeof(local.addr_be));
        if (!l)
        {
            rtnl_addr_put(a);
            throw std::runtime_error("nl_addr_build(local) failed");
        }
        rtnl_addr_set_local(a, l);
        rtnl_addr_set_prefixlen(a, local.prefix);

        const int err = rtnl_addr_add(nl.sk, a, 0);

        nl_addr_put(l);
        rtnl_addr_put(a);
        if (err < 0 && err != -NLE_EXIST)
        {
            LOGE("links") << "AddAddress: rtnl_addr_add rc=" << err;
            throw std::runtime_error(NlError("rtnl_addr_add(" + format_cidr4(local) + ")", err));
        }
        if (err == -NLE_EXIST)
        {
            LOGD("links") << "AddAddress: already present (idempotent)";
        }
    }

    void NetlinkLinks::AddRoute(const std::string                  &name,
                                const CidrV4                       &dst,
                                const std::optional<std::uint32_t> &gw_be)
    {
        const CidrV4 net = to_network(dst);
        LOGD("links") << "AddRoute: " << format_cidr4(net)
                      << " via " << (gw_be ? format_ip4(*gw_be) : std::string("<link>"))
                      << " dev " << name;
        NlSock  nl;
        LinkRef link;
        RequireLink(nl.sk, name, link);

        AddrRef d;
        d.addr = nl_addr_build(AF_INET, &net.addr_be, sizeof(net.addr_be));
        if (!d.addr)
        {
            throw std::runtime_error("nl_addr_build(dst) failed");
        }
        nl_addr_set_prefixlen(d.addr, net.prefix);

        AddrRef g;
        if (gw_be)
        {
            g.addr = nl_addr_build(AF_INET, &*gw_be, sizeof(*gw_be));
            if (!g.addr)
            {
                throw std::runtime_error("nl_addr_build(gw) failed");
            }
        }

        rtnl_route *route = rtnl_route_alloc();
        if (!route)
        {
            throw std::runtime_error("rtnl_route_alloc failed");
        }
        rtnl_route_set_family(route, AF_INET);
        rtnl_route_set_table(route, RT_TABLE_MAIN);
        rtnl_route_set_dst(route, d.addr);
        rtnl_route_set_type(route, RTN_UNICAST);
        rtnl_route_set_protocol(route, RTPROT_BOOT);
        rtnl_route_set_scope(route, gw_be ? RT_SCOPE_UNIVERSE : RT_SCOPE_LINK);

        rtnl_nexthop *nh = rtnl_route_nh_alloc();
        if (!nh)
        {
            rtnl_route_put(route);
            throw std::runtime_error("rtnl_route_nh_alloc failed");
        }
        rtnl_route_nh_set_ifindex(nh, rtnl_link_get_ifindex(link.link));
        if (g.addr)
        {
            rtnl_route_nh_set_gateway(nh, g.addr);
        }
        rtnl_route_add_nexthop(route, nh);

        const int err = rtnl_route_add(nl.sk, route, 0);
        rtnl_route_put(route);
        if (err < 0 && err != -NLE_EXIST)
        {
            LOGE("links") << "AddRoute: rtnl_route_add rc=" << err;
            throw std::runtime_error(NlError("rtnl_route_add(" + format_cidr4(net) + ")", err));
        }
        if (err == -NLE_EXIST)
        {
            LOGD("links") << "AddRoute: already present (idempotent)";
        }
    }

    std::string RandomLinkName()
    {
        std::random_device rd;
        std::uniform_int_distribution<std::uint32_t> dist;

        char buf[IFNAMSIZ]{};
        std::snprintf(buf, sizeof(buf), "veth%08x", dist(rd));
        return buf;
    }
} // namespace NetConfig
