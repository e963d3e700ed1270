#pragma once

#include "MacLookup.hpp"

#include <string>

namespace Macvlan
{
    /**
     * @brief Выбор MAC: явный MACAddress из CNI_ARGS или сервис метаданных.
     */
    class AddressResolver
    {
    public:
        AddressResolver(MacLookup   &lookup,
                        std::string  base_url);

        /**
         * @throws PluginError(MacAddressLookupFailed) от MacLookup без изменений.
         */
        std::string Resolve(const std::string &container_id,
                            const std::string &explicit_override,
                            const std::string &uuid_hint);

    private:
        MacLookup  &lookup_;
        std::string base_url_;
    };
} // namespace Macvlan
