#include "AddressResolver.hpp"
#include "Core/Logger.hpp"

#include <utility>

namespace Macvlan
{
    AddressResolver::AddressResolver(MacLookup   &lookup,
                                     std::string  base_url)
        : lookup_(lookup), base_url_(std::move(base_url))
    {
    }

    std::string AddressResolver::Resolve(const std::string &container_id,
                                         const std::string &explicit_override,
                                         const std::string &uuid_hint)
    {
        if (!explicit_override.empty())
        {
            LOGD("resolver") << "Resolve: using MACAddress override " << explicit_override;
            return explicit_override;
        }
        return lookup_.Find(base_url_, container_id, uuid_hint);
    }
} // namespace Macvlan
