#pragma once

#include <stdexcept>
#include <string>

/**
 * @file Errors.hpp
 * @brief Ошибки плагина: код категории + код протокола для JSON-ответа.
 */

namespace Macvlan
{
    enum class ErrorCode
    {
        InvalidConfig,
        MasterNotFound,
        LinkCreationFailed,
        ProxyArpSetupFailed,
        RenameFailed,
        NamespaceNotFound,
        MissingIPv4Config,
        MacAddressLookupFailed,
        MacAddressSetFailed,
        GatewayConflict,
        InterfaceConfigFailed,
        IpamFailed
    };

    const char *ToString(ErrorCode code);

    /// Код протокола для ошибок, не пришедших от IPAM-плагина.
    constexpr int kGenericProtocolCode = 100;

    class PluginError : public std::runtime_error
    {
    public:
        PluginError(ErrorCode          code,
                    const std::string &msg);

        /**
         * @brief Ошибка с кодом и details из ответа другого плагина.
         */
        PluginError(ErrorCode          code,
                    const std::string &msg,
                    int                protocol_code,
                    std::string        details);

        ErrorCode Code() const { return code_; }
        int ProtocolCode() const { return protocol_code_; }
        const std::string &Details() const { return details_; }

    private:
        ErrorCode   code_;
        int         protocol_code_;
        std::string details_;
    };

    /**
     * @brief Путь namespace не существует (контейнер уже удалён).
     */
    class NetNSMissing : public PluginError
    {
    public:
        explicit NetNSMissing(const std::string &msg)
            : PluginError(ErrorCode::NamespaceNotFound, msg)
        {
        }
    };

    /**
     * @brief Документ ошибки протокола: {"cniVersion","code","msg","details"}.
     */
    std::string ErrorToJson(const std::string &cni_version,
                            int                code,
                            const std::string &msg,
                            const std::string &details);
} // namespace Macvlan
