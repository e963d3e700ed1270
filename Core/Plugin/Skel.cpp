#include "Skel.hpp"
#include "Errors.hpp"
#include "Result.hpp"
#include "Core/Logger.hpp"

#include <cstdlib>
#include <istream>
#include <iterator>
#include <ostream>

#include <boost/json.hpp>

namespace
{
    std::string Get(const Macvlan::EnvLookup &env,
                    const std::string        &name)
    {
        return env(name).value_or(std::string());
    }

    Macvlan::CmdArgs ReadArgs(const Macvlan::EnvLookup &env,
                              const std::string        &command,
                              std::istream             &in)
    {
        Macvlan::CmdArgs a;
        a.container_id = Get(env, "CNI_CONTAINERID");
        a.netns        = Get(env, "CNI_NETNS");
        a.if_name      = Get(env, "CNI_IFNAME");
        a.args         = Get(env, "CNI_ARGS");
        a.path         = Get(env, "CNI_PATH");

        struct Required
        {
            const char        *name;
            const std::string &value;
            bool               for_del;
        };
        const Required vars[] = {
            { "CNI_CONTAINERID", a.container_id, true  },
            { "CNI_NETNS",       a.netns,        false },
            { "CNI_IFNAME",      a.if_name,      true  },
            { "CNI_PATH",        a.path,         true  },
        };

        std::string missing;
        for (const Required &r : vars)
        {
            if (command == "DEL" && !r.for_del)
            {
                continue;
            }
            if (r.value.empty())
            {
                missing += (missing.empty() ? "" : ",");
                missing += r.name;
            }
        }
        if (!missing.empty())
        {
            throw Macvlan::PluginError(Macvlan::ErrorCode::InvalidConfig,
                                       "required env variables missing: " + missing);
        }

        a.stdin_data.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
        if (in.bad())
        {
            throw Macvlan::PluginError(Macvlan::ErrorCode::InvalidConfig,
                                       "error reading from stdin");
        }
        return a;
    }
}

namespace Macvlan
{
    std::optional<std::string> ProcessEnv(const std::string &name)
    {
        const char *v = std::getenv(name.c_str());
        if (!v)
        {
            return std::nullopt;
        }
        return std::string(v);
    }

    std::string VersionInfoJson()
    {
        boost::json::object o;
        o["cniVersion"]        = kCniVersion;
        o["supportedVersions"] = boost::json::array { "0.1.0", "0.2.0" };
        return boost::json::serialize(o);
    }

    int PluginMain(const EnvLookup &env,
                   std::istream    &in,
                   std::ostream    &out,
                   Collaborators   &c)
    {
        const std::string command = Get(env, "CNI_COMMAND");
        try
        {
            if (command.empty())
            {
                throw PluginError(ErrorCode::InvalidConfig, "required env variables missing: CNI_COMMAND");
            }
            if (command == "VERSION")
            {
                out << VersionInfoJson() << std::endl;
                return 0;
            }
            if (command != "ADD" && command != "DEL")
            {
                throw PluginError(ErrorCode::InvalidConfig, "unknown CNI_COMMAND: " + command);
            }

            const CmdArgs args = ReadArgs(env, command, in);
            if (command == "ADD")
            {
                const Result r = CmdAdd(args, c);
                out << ResultToJson(r) << std::endl;
            }
            else
            {
                CmdDel(args, c);
            }
            return 0;
        }
        catch (const PluginError &e)
        {
            LOGE("skel") << command << ": " << ToString(e.Code()) << ": " << e.what();
            out << ErrorToJson(kCniVersion, e.ProtocolCode(), e.what(), e.Details()) << std::endl;
        }
        catch (const std::exception &e)
        {
            LOGE("skel") << command << ": " << e.what();
            out << ErrorToJson(kCniVersion, kGenericProtocolCode, e.what(), std::string()) << std::endl;
        }
        return 1;
    }
} // namespace Macvlan
