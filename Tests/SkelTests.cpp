#include "Mocks.hpp"

#include "Core/Plugin/Errors.hpp"
#include "Core/Plugin/Skel.hpp"

#include <map>
#include <sstream>

#include <boost/json.hpp>
#include <gtest/gtest.h>

using ::testing::_;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::Throw;

namespace
{
    class SkelTest : public ::testing::Test
    {
    protected:
        SkelTest()
            : c { opener, links, sysctl, ipam, mac_lookup }
        {
        }

        int Run(const std::string &stdin_data = std::string())
        {
            std::istringstream in(stdin_data);
            out.str(std::string());
            return Macvlan::PluginMain(
                [this](const std::string &name) -> std::optional<std::string>
                {
                    auto it = env.find(name);
                    if (it == env.end())
                    {
                        return std::nullopt;
                    }
                    return it->second;
                },
                in,
                out,
                c);
        }

        boost::json::object Output() const
        {
            return boost::json::parse(out.str()).as_object();
        }

        std::map<std::string, std::string> env;
        std::ostringstream                 out;

        NiceMock<Testing::MockNetNSOpener> opener;
        NiceMock<Testing::MockLinks>       links;
        NiceMock<Testing::MockSysctl>      sysctl;
        NiceMock<Testing::MockIpam>        ipam;
        NiceMock<Testing::MockMacLookup>   mac_lookup;
        Macvlan::Collaborators             c;
    };
}

TEST_F(SkelTest, Version)
{
    env["CNI_COMMAND"] = "VERSION";
    EXPECT_EQ(Run(), 0);

    const boost::json::object o = Output();
    EXPECT_EQ(o.at("cniVersion").as_string(), "0.2.0");
    const boost::json::array &v = o.at("supportedVersions").as_array();
    ASSERT_EQ(v.size(), 2u);
    EXPECT_EQ(v[0].as_string(), "0.1.0");
    EXPECT_EQ(v[1].as_string(), "0.2.0");
}

TEST_F(SkelTest, MissingCommand)
{
    EXPECT_EQ(Run(), 1);
    EXPECT_EQ(Output().at("code").as_int64(), 100);
}

TEST_F(SkelTest, UnknownCommand)
{
    env["CNI_COMMAND"] = "CHECK";
    EXPECT_EQ(Run(), 1);
    EXPECT_EQ(Output().at("details").as_string(), "InvalidConfig");
}

TEST_F(SkelTest, AddListsMissingVariables)
{
    env["CNI_COMMAND"] = "ADD";
    env["CNI_IFNAME"]  = "eth1";
    EXPECT_EQ(Run(), 1);

    const std::string msg(Output().at("msg").as_string().c_str());
    EXPECT_NE(msg.find("CNI_CONTAINERID"), std::string::npos);
    EXPECT_NE(msg.find("CNI_NETNS"), std::string::npos);
    EXPECT_NE(msg.find("CNI_PATH"), std::string::npos);
    EXPECT_EQ(msg.find("CNI_IFNAME"), std::string::npos);
}

TEST_F(SkelTest, DelWithoutNetnsSucceeds)
{
    env["CNI_COMMAND"]     = "DEL";
    env["CNI_CONTAINERID"] = "abc";
    env["CNI_IFNAME"]      = "eth1";
    env["CNI_PATH"]        = "/opt/cni/bin";

    EXPECT_CALL(ipam, ExecDel("host-local", _));
    EXPECT_CALL(links, Delete(_)).Times(0);

    EXPECT_EQ(Run(R"({"master":"eth0","ipam":{"type":"host-local"}})"), 0);
    EXPECT_TRUE(out.str().empty());
}

TEST_F(SkelTest, IpamErrorCodeIsPassedThrough)
{
    env["CNI_COMMAND"]     = "DEL";
    env["CNI_CONTAINERID"] = "abc";
    env["CNI_IFNAME"]      = "eth1";
    env["CNI_PATH"]        = "/opt/cni/bin";

    EXPECT_CALL(ipam, ExecDel(_, _))
        .WillOnce(Throw(Macvlan::PluginError(Macvlan::ErrorCode::IpamFailed, "no lease", 7, "store locked")));

    EXPECT_EQ(Run(R"({"master":"eth0","ipam":{"type":"host-local"}})"), 1);
    const boost::json::object o = Output();
    EXPECT_EQ(o.at("code").as_int64(), 7);
    EXPECT_EQ(o.at("msg").as_string(), "no lease");
    EXPECT_EQ(o.at("details").as_string(), "store locked");
}

TEST_F(SkelTest, InvalidConfigOnStdin)
{
    env["CNI_COMMAND"]     = "ADD";
    env["CNI_CONTAINERID"] = "abc";
    env["CNI_NETNS"]       = "/proc/1/ns/net";
    env["CNI_IFNAME"]      = "eth1";
    env["CNI_PATH"]        = "/opt/cni/bin";

    EXPECT_CALL(opener, Open(_)).Times(0);
    EXPECT_EQ(Run("{not json"), 1);
    EXPECT_EQ(Output().at("details").as_string(), "InvalidConfig");
}
