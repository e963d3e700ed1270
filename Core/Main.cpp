// Main.cpp: точка входа плагина macvlan.
// stdout занят протоколом; логи идут в stderr и (опционально) в файл.

#include "Core/Logger.hpp"
#include "Core/Net/Links.hpp"
#include "Core/Net/NetNS.hpp"
#include "Core/Net/Sysctl.hpp"
#include "Core/Plugin/Errors.hpp"
#include "Core/Plugin/Ipam.hpp"
#include "Core/Plugin/MacLookup.hpp"
#include "Core/Plugin/Result.hpp"
#include "Core/Plugin/Skel.hpp"

#include <exception>
#include <iostream>
#include <string>

#include <curl/curl.h>

int main()
{
    Logger::Options log_opts;
    log_opts.app_name             = "macvlan";
    log_opts.base_filename        = "macvlan";
    log_opts.directory            = Macvlan::ProcessEnv("MACVLAN_CNI_LOG_DIR").value_or(std::string());
    log_opts.file_min_severity    = boost::log::trivial::debug;
    log_opts.console_min_severity = Logger::ParseSeverity(
        Macvlan::ProcessEnv("MACVLAN_CNI_LOG_LEVEL").value_or(std::string()),
        boost::log::trivial::info);

    Logger::Guard lg(log_opts);

    curl_global_init(CURL_GLOBAL_ALL);
    struct CurlCleanup
    {
        ~CurlCleanup() { curl_global_cleanup(); }
    } curl_cleanup;

    NetConfig::LinuxNetNSOpener opener;
    NetConfig::NetlinkLinks     links;
    NetConfig::ProcSysctl       sysctl;
    Macvlan::PluginIpam         ipam(Macvlan::ProcessEnv("CNI_PATH").value_or(std::string()));
    Macvlan::MetadataMacLookup  mac_lookup;

    Macvlan::Collaborators c { opener, links, sysctl, ipam, mac_lookup };

    try
    {
        return NetConfig::CommandThread::Run([&]()
        {
            return Macvlan::PluginMain(Macvlan::ProcessEnv, std::cin, std::cout, c);
        });
    }
    catch (const std::exception &e)
    {
        LOGE("main") << "Fatal: " << e.what();
        std::cout << Macvlan::ErrorToJson(Macvlan::kCniVersion, Macvlan::kGenericProtocolCode, e.what(), std::string())
                  << std::endl;
        return 1;
    }
}
