#pragma once

#include "Commands.hpp"

#include <functional>
#include <iosfwd>
#include <optional>
#include <string>

/**
 * @file Skel.hpp
 * @brief Разбор окружения CNI_*, диспетчеризация команды, вывод ответа.
 */

namespace Macvlan
{
    /// Значение переменной окружения; std::nullopt: не задана.
    using EnvLookup = std::function<std::optional<std::string>(const std::string &)>;

    /**
     * @brief getenv() процесса.
     */
    std::optional<std::string> ProcessEnv(const std::string &name);

    /// {"cniVersion":"0.2.0","supportedVersions":["0.1.0","0.2.0"]}
    std::string VersionInfoJson();

    /**
     * @brief Выполнить одну команду.
     *
     * Результат или документ ошибки пишется в out. Исключения наружу не
     * выходят.
     * @return 0 при успехе, 1 при ошибке.
     */
    int PluginMain(const EnvLookup &env,
                   std::istream    &in,
                   std::ostream    &out,
                   Collaborators   &c);
} // namespace Macvlan
