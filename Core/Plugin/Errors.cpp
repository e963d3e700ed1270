#include "Errors.hpp"

#include <utility>

#include <boost/json.hpp>

namespace Macvlan
{
    const char *ToString(ErrorCode code)
    {
        switch (code)
        {
            case ErrorCode::InvalidConfig:          return "InvalidConfig";
            case ErrorCode::MasterNotFound:         return "MasterNotFound";
            case ErrorCode::LinkCreationFailed:     return "LinkCreationFailed";
            case ErrorCode::ProxyArpSetupFailed:    return "ProxyArpSetupFailed";
            case ErrorCode::RenameFailed:           return "RenameFailed";
            case ErrorCode::NamespaceNotFound:      return "NamespaceNotFound";
            case ErrorCode::MissingIPv4Config:      return "MissingIPv4Config";
            case ErrorCode::MacAddressLookupFailed: return "MacAddressLookupFailed";
            case ErrorCode::MacAddressSetFailed:    return "MacAddressSetFailed";
            case ErrorCode::GatewayConflict:        return "GatewayConflict";
            case ErrorCode::InterfaceConfigFailed:  return "InterfaceConfigFailed";
            case ErrorCode::IpamFailed:             return "IpamFailed";
        }
        return "Unknown";
    }

    PluginError::PluginError(ErrorCode          code,
                             const std::string &msg)
        : std::runtime_error(msg),
          code_(code),
          protocol_code_(kGenericProtocolCode),
          details_(ToString(code))
    {
    }

    PluginError::PluginError(ErrorCode          code,
                             const std::string &msg,
                             int                protocol_code,
                             std::string        details)
        : std::runtime_error(msg),
          code_(code),
          protocol_code_(protocol_code),
          details_(std::move(details))
    {
    }

    std::string ErrorToJson(const std::string &cni_version,
                            int                code,
                            const std::string &msg,
                            const std::string &details)
    {
        boost::json::object o;
        o["cniVersion"] = cni_version;
        o["code"]       = code;
        o["msg"]        = msg;
        if (!details.empty())
        {
            o["details"] = details;
        }
        return boost::json::serialize(o);
    }
} // namespace Macvlan
