#include "Core/Plugin/Errors.hpp"
#include "Core/Plugin/NetConf.hpp"

#include <string>

#include <gtest/gtest.h>

namespace
{
    Macvlan::ErrorCode LoadError(const std::string &json)
    {
        try
        {
            Macvlan::LoadConf(json);
        }
        catch (const Macvlan::PluginError &e)
        {
            return e.Code();
        }
        ADD_FAILURE() << "LoadConf accepted " << json;
        return Macvlan::ErrorCode::IpamFailed;
    }
}

TEST(LoadConf, Defaults)
{
    const Macvlan::NetConf n = Macvlan::LoadConf(R"({"master":"eth0"})");
    EXPECT_EQ(n.master, "eth0");
    EXPECT_EQ(n.mode, "bridge");
    EXPECT_EQ(n.mtu, 0);
    EXPECT_FALSE(n.is_default_gw);
    EXPECT_EQ(n.metadata_url, Macvlan::kDefaultMetadataUrl);
    EXPECT_TRUE(n.ipam_type.empty());
}

TEST(LoadConf, AllFields)
{
    const Macvlan::NetConf n = Macvlan::LoadConf(R"({
        "cniVersion": "0.1.0",
        "name": "net1",
        "type": "macvlan",
        "master": "ens3",
        "mode": "private",
        "mtu": 1450,
        "isDefaultGateway": true,
        "metadataUrl": "http://127.0.0.1:8080/latest",
        "ipam": { "type": "host-local", "subnet": "10.1.0.0/16" },
        "dns": { "nameservers": ["10.1.0.1"], "domain": "corp", "options": ["ndots:2"] },
        "someFutureField": [1, 2, 3]
    })");

    EXPECT_EQ(n.cni_version, "0.1.0");
    EXPECT_EQ(n.name, "net1");
    EXPECT_EQ(n.master, "ens3");
    EXPECT_EQ(n.mode, "private");
    EXPECT_EQ(n.mtu, 1450);
    EXPECT_TRUE(n.is_default_gw);
    EXPECT_EQ(n.metadata_url, "http://127.0.0.1:8080/latest");
    EXPECT_EQ(n.ipam_type, "host-local");
    ASSERT_EQ(n.dns.nameservers.size(), 1u);
    EXPECT_EQ(n.dns.domain, "corp");
    ASSERT_EQ(n.dns.options.size(), 1u);
}

TEST(LoadConf, Rejects)
{
    EXPECT_EQ(LoadError("{"), Macvlan::ErrorCode::InvalidConfig);
    EXPECT_EQ(LoadError("[]"), Macvlan::ErrorCode::InvalidConfig);
    EXPECT_EQ(LoadError(R"({})"), Macvlan::ErrorCode::InvalidConfig);
    EXPECT_EQ(LoadError(R"({"master":""})"), Macvlan::ErrorCode::InvalidConfig);
    EXPECT_EQ(LoadError(R"({"master":"eth0","mtu":-1})"), Macvlan::ErrorCode::InvalidConfig);
    EXPECT_EQ(LoadError(R"({"master":"eth0","mtu":"1500"})"), Macvlan::ErrorCode::InvalidConfig);
    EXPECT_EQ(LoadError(R"({"master":"eth0","isDefaultGateway":"yes"})"), Macvlan::ErrorCode::InvalidConfig);
}

TEST(LoadConf, UnknownModeIsLeftToProvisioning)
{
    const Macvlan::NetConf n = Macvlan::LoadConf(R"({"master":"eth0","mode":"l2"})");
    EXPECT_EQ(n.mode, "l2");
}

TEST(ModeFromString, KnownModes)
{
    EXPECT_EQ(Macvlan::ModeFromString(""), NetConfig::MacvlanMode::Bridge);
    EXPECT_EQ(Macvlan::ModeFromString("bridge"), NetConfig::MacvlanMode::Bridge);
    EXPECT_EQ(Macvlan::ModeFromString("private"), NetConfig::MacvlanMode::Private);
    EXPECT_EQ(Macvlan::ModeFromString("vepa"), NetConfig::MacvlanMode::Vepa);
    EXPECT_EQ(Macvlan::ModeFromString("passthru"), NetConfig::MacvlanMode::Passthru);
    EXPECT_THROW(Macvlan::ModeFromString("Bridge"), Macvlan::PluginError);
}

TEST(LoadNetArgs, Empty)
{
    const Macvlan::NetArgs a = Macvlan::LoadNetArgs("");
    EXPECT_FALSE(a.ignore_unknown);
    EXPECT_TRUE(a.mac_address.empty());
}

TEST(LoadNetArgs, RecognizedKeys)
{
    const Macvlan::NetArgs a =
        Macvlan::LoadNetArgs("RancherContainerUUID=abc-1;LinkMTUOverhead=50;MACAddress=02:00:00:00:00:01");
    EXPECT_EQ(a.rancher_container_uuid, "abc-1");
    EXPECT_EQ(a.link_mtu_overhead, "50");
    EXPECT_EQ(a.mac_address, "02:00:00:00:00:01");
}

TEST(LoadNetArgs, UnknownKeys)
{
    EXPECT_THROW(Macvlan::LoadNetArgs("K8S_POD_NAME=web"), Macvlan::PluginError);

    const Macvlan::NetArgs a = Macvlan::LoadNetArgs("K8S_POD_NAME=web;IgnoreUnknown=TRUE");
    EXPECT_TRUE(a.ignore_unknown);
}

TEST(LoadNetArgs, MalformedPairs)
{
    EXPECT_THROW(Macvlan::LoadNetArgs("MACAddress"), Macvlan::PluginError);
    EXPECT_THROW(Macvlan::LoadNetArgs("IgnoreUnknown=maybe"), Macvlan::PluginError);
}

TEST(LoadNetArgs, RejectsPairWithExtraEquals)
{
    try
    {
        Macvlan::LoadNetArgs("IgnoreUnknown=1;RancherContainerUUID=a=b");
        FAIL() << "expected InvalidConfig";
    }
    catch (const Macvlan::PluginError &e)
    {
        EXPECT_EQ(e.Code(), Macvlan::ErrorCode::InvalidConfig);
        EXPECT_NE(std::string(e.what()).find("invalid pair \"RancherContainerUUID=a=b\""), std::string::npos);
    }
}
