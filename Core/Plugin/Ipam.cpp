#include "Ipam.hpp"
#include "Errors.hpp"
#include "Core/Config.hpp"
#include "Core/Logger.hpp"

#include <cstdint>
#include <future>
#include <sstream>
#include <stdexcept>
#include <utility>
#include <vector>

#include <boost/asio/buffer.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/filesystem/path.hpp>
#include <boost/json.hpp>
#include <boost/process.hpp>

namespace bp = boost::process;

namespace
{
    std::vector<boost::filesystem::path> SplitPath(const std::string &cni_path)
    {
        std::vector<boost::filesystem::path> dirs;
        std::stringstream ss(cni_path);
        std::string       dir;
        while (std::getline(ss, dir, ':'))
        {
            if (!dir.empty())
            {
                dirs.emplace_back(dir);
            }
        }
        return dirs;
    }

    std::string Trim(const std::string &s)
    {
        const auto b = s.find_first_not_of(" \t\r\n");
        if (b == std::string::npos)
        {
            return std::string();
        }
        const auto e = s.find_last_not_of(" \t\r\n");
        return s.substr(b, e - b + 1);
    }
}

namespace Macvlan
{
    PluginError IpamErrorFromOutput(const std::string &type,
                                    int                exit_code,
                                    const std::string &out,
                                    const std::string &err)
    {
        boost::json::error_code ec;
        boost::json::value      jv = boost::json::parse(out, ec);
        if (!ec && jv.is_object())
        {
            const boost::json::object &o = jv.as_object();
            try
            {
                const std::int64_t code    = Config::OptionalInt(o, "code", kGenericProtocolCode);
                const std::string  msg     = Config::OptionalString(o, "msg");
                const std::string  details = Config::OptionalString(o, "details");
                if (!msg.empty())
                {
                    return PluginError(ErrorCode::IpamFailed,
                                       msg,
                                       static_cast<int>(code),
                                       details.empty() ? ToString(ErrorCode::IpamFailed) : details);
                }
            }
            catch (const std::exception &e)
            {
                LOGW("ipam") << "IpamErrorFromOutput: malformed error document: " << e.what();
            }
        }

        std::string text = Trim(err);
        if (text.empty())
        {
            text = Trim(out);
        }
        return PluginError(ErrorCode::IpamFailed,
                           "IPAM plugin " + type + " failed with exit status " + std::to_string(exit_code)
                           + (text.empty() ? std::string() : ": " + text));
    }

    PluginIpam::PluginIpam(std::string cni_path)
        : cni_path_(std::move(cni_path))
    {
    }

    PluginIpam::Output PluginIpam::Exec(const std::string &command,
                                        const std::string &type,
                                        const std::string &stdin_data)
    {
        if (type.empty())
        {
            throw PluginError(ErrorCode::IpamFailed, "IPAM plugin type is not set (ipam.type)");
        }

        const boost::filesystem::path exe = bp::search_path(type, SplitPath(cni_path_));
        if (exe.empty())
        {
            throw PluginError(ErrorCode::IpamFailed,
                              "failed to find IPAM plugin \"" + type + "\" in path " + cni_path_);
        }

        LOGD("ipam") << "Exec: " << command << " " << exe.string();

        Output res;
        try
        {
            bp::environment env = boost::this_process::environment();
            env["CNI_COMMAND"]  = command;

            boost::asio::io_context  ios;
            std::future<std::string> out;
            std::future<std::string> err;

            bp::child c(exe,
                        env,
                        bp::std_in < boost::asio::buffer(stdin_data),
                        bp::std_out > out,
                        bp::std_err > err,
                        ios);
            ios.run();
            c.wait();

            res.exit_code = c.exit_code();
            res.out       = out.get();
            res.err       = err.get();
        }
        catch (const std::exception &e)
        {
            throw PluginError(ErrorCode::IpamFailed,
                              "failed to run IPAM plugin " + type + ": " + e.what());
        }

        if (!res.err.empty())
        {
            LOGD("ipam") << "Exec: " << type << " stderr: " << Trim(res.err);
        }
        if (res.exit_code != 0)
        {
            PluginError e = IpamErrorFromOutput(type, res.exit_code, res.out, res.err);
            LOGE("ipam") << "Exec: " << command << " " << type << ": " << e.what();
            throw e;
        }
        return res;
    }

    Result PluginIpam::ExecAdd(const std::string &type,
                               const std::string &stdin_data)
    {
        const Output o = Exec("ADD", type, stdin_data);
        try
        {
            return ParseResult(o.out);
        }
        catch (const std::exception &e)
        {
            throw PluginError(ErrorCode::IpamFailed,
                              "failed to parse IPAM plugin " + type + " result: " + e.what());
        }
    }

    void PluginIpam::ExecDel(const std::string &type,
                             const std::string &stdin_data)
    {
        Exec("DEL", type, stdin_data);
    }
} // namespace Macvlan
