#include "Core/Plugin/Errors.hpp"
#include "Core/Plugin/Ipam.hpp"

#include <string>

#include <gtest/gtest.h>

TEST(IpamErrorFromOutput, ErrorDocument)
{
    const Macvlan::PluginError e = Macvlan::IpamErrorFromOutput(
        "host-local", 1, R"({"cniVersion":"0.2.0","code":11,"msg":"no IP addresses available","details":"range 10.0.0.0/24"})",
        "");
    EXPECT_EQ(e.Code(), Macvlan::ErrorCode::IpamFailed);
    EXPECT_EQ(e.ProtocolCode(), 11);
    EXPECT_STREQ(e.what(), "no IP addresses available");
    EXPECT_EQ(e.Details(), "range 10.0.0.0/24");
}

TEST(IpamErrorFromOutput, FallsBackToStderr)
{
    const Macvlan::PluginError e = Macvlan::IpamErrorFromOutput("host-local", 2, "", "panic: runtime error\n");
    EXPECT_EQ(e.ProtocolCode(), Macvlan::kGenericProtocolCode);
    EXPECT_EQ(std::string(e.what()), "IPAM plugin host-local failed with exit status 2: panic: runtime error");
}

TEST(IpamErrorFromOutput, DocumentWithoutMessage)
{
    const Macvlan::PluginError e = Macvlan::IpamErrorFromOutput("dhcp", 1, R"({"code":"x"})", "");
    EXPECT_EQ(e.ProtocolCode(), Macvlan::kGenericProtocolCode);
    EXPECT_NE(std::string(e.what()).find("dhcp"), std::string::npos);
}

TEST(PluginIpam, MissingBinary)
{
    Macvlan::PluginIpam ipam("/nonexistent/cni/bin");
    try
    {
        ipam.ExecAdd("host-local", "{}");
        FAIL() << "expected IpamFailed";
    }
    catch (const Macvlan::PluginError &e)
    {
        EXPECT_EQ(e.Code(), Macvlan::ErrorCode::IpamFailed);
    }
}

TEST(PluginIpam, EmptyType)
{
    Macvlan::PluginIpam ipam("/usr/bin");
    EXPECT_THROW(ipam.ExecDel("", "{}"), Macvlan::PluginError);
}
