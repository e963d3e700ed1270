#pragma once

#include "Errors.hpp"
#include "Result.hpp"

#include <string>

/**
 * @file Ipam.hpp
 * @brief Вызов внешнего IPAM-плагина (отдельный процесс).
 */

namespace Macvlan
{
    class IpamExecutor
    {
    public:
        virtual ~IpamExecutor() = default;

        /**
         * @brief Запустить плагин с CNI_COMMAND=ADD и разобрать результат.
         * @param type      Имя бинарника (ipam.type).
         * @param stdin_data Исходная конфигурация сети без изменений.
         * @throws PluginError(IpamFailed)
         */
        virtual Result ExecAdd(const std::string &type,
                               const std::string &stdin_data) = 0;

        /**
         * @throws PluginError(IpamFailed)
         */
        virtual void ExecDel(const std::string &type,
                             const std::string &stdin_data) = 0;
    };

    /**
     * @brief Реализация через Boost.Process: бинарник ищется в CNI_PATH.
     */
    class PluginIpam : public IpamExecutor
    {
    public:
        /**
         * @param cni_path Каталоги через ':'.
         */
        explicit PluginIpam(std::string cni_path);

        Result ExecAdd(const std::string &type,
                       const std::string &stdin_data) override;
        void ExecDel(const std::string &type,
                     const std::string &stdin_data) override;

    private:
        struct Output
        {
            int         exit_code = 0;
            std::string out;
            std::string err;
        };

        Output Exec(const std::string &command,
                    const std::string &type,
                    const std::string &stdin_data);

        std::string cni_path_;
    };

    /**
     * @brief Превратить вывод упавшего плагина в PluginError(IpamFailed).
     *
     * stdout: документ ошибки протокола; если это не он, берётся stderr.
     */
    PluginError IpamErrorFromOutput(const std::string &type,
                                    int                exit_code,
                                    const std::string &out,
                                    const std::string &err);
} // namespace Macvlan
