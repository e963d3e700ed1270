#pragma once

#include <string>

/**
 * @file MacLookup.hpp
 * @brief Поиск заранее назначенного MAC контейнера во внешнем сервисе.
 */

namespace Macvlan
{
    class MacLookup
    {
    public:
        virtual ~MacLookup() = default;

        /**
         * @param base_url     Адрес сервиса (metadataUrl из конфигурации).
         * @param container_id CNI_CONTAINERID.
         * @param uuid_hint    RancherContainerUUID из CNI_ARGS (может быть пустым).
         * @return MAC вида "aa:bb:cc:dd:ee:ff".
         * @throws PluginError(MacAddressLookupFailed)
         */
        virtual std::string Find(const std::string &base_url,
                                 const std::string &container_id,
                                 const std::string &uuid_hint) = 0;
    };

    /**
     * @brief "<base_url>/containers" без двойного '/'.
     */
    std::string ContainersUrl(const std::string &base_url);

    /**
     * @brief Найти MAC в JSON-массиве записей контейнеров.
     *
     * Запись подходит, если external_id == container_id либо
     * uuid == uuid_hint (когда подсказка задана).
     * @throws std::runtime_error если записи нет или MAC пуст.
     */
    std::string FindMacInContainers(const std::string &body,
                                    const std::string &container_id,
                                    const std::string &uuid_hint);

    /**
     * @brief GET <base_url>/containers через libcurl.
     */
    class MetadataMacLookup : public MacLookup
    {
    public:
        std::string Find(const std::string &base_url,
                         const std::string &container_id,
                         const std::string &uuid_hint) override;
    };
} // namespace Macvlan
