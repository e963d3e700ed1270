#include "MacLookup.hpp"
#include "Errors.hpp"
#include "Core/Config.hpp"
#include "Core/Logger.hpp"

#include <stdexcept>

#include <curl/curl.h>
#include <boost/json.hpp>

namespace
{
    constexpr long kTimeoutSec = 30;

    size_t AppendBody(char   *data,
                      size_t  size,
                      size_t  nmemb,
                      void   *userp)
    {
        static_cast<std::string *>(userp)->append(data, size * nmemb);
        return size * nmemb;
    }

    // RAII для CURL / curl_slist.
    struct Easy
    {
        CURL       *curl    {nullptr};
        curl_slist *headers {nullptr};

        Easy()
        {
            curl = curl_easy_init();
            if (!curl)
            {
                throw std::runtime_error("failed to initialize libcurl");
            }
        }

        ~Easy()
        {
            if (headers) curl_slist_free_all(headers);
            if (curl) curl_easy_cleanup(curl);
        }

        Easy(const Easy&) = delete;
        Easy& operator=(const Easy&) = delete;
    };

    std::string HttpGet(const std::string &url)
    {
        Easy        e;
        std::string body;

        e.headers = curl_slist_append(e.headers, "Accept: application/json");

        curl_easy_setopt(e.curl, CURLOPT_URL, url.c_str());
        curl_easy_setopt(e.curl, CURLOPT_HTTPHEADER, e.headers);
        curl_easy_setopt(e.curl, CURLOPT_WRITEFUNCTION, &AppendBody);
        curl_easy_setopt(e.curl, CURLOPT_WRITEDATA, &body);
        curl_easy_setopt(e.curl, CURLOPT_TIMEOUT, kTimeoutSec);
        curl_easy_setopt(e.curl, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(e.curl, CURLOPT_PROTOCOLS, CURLPROTO_HTTP | CURLPROTO_HTTPS);

        const CURLcode rc = curl_easy_perform(e.curl);
        if (rc != CURLE_OK)
        {
            throw std::runtime_error(std::string("GET ") + url + ": " + curl_easy_strerror(rc));
        }

        long code = 0;
        curl_easy_getinfo(e.curl, CURLINFO_RESPONSE_CODE, &code);
        if (code != 200)
        {
            throw std::runtime_error("GET " + url + ": HTTP " + std::to_string(code));
        }
        return body;
    }
}

namespace Macvlan
{
    std::string ContainersUrl(const std::string &base_url)
    {
        std::string u = base_url;
        while (!u.empty() && u.back() == '/')
        {
            u.pop_back();
        }
        return u + "/containers";
    }

    std::string FindMacInContainers(const std::string &body,
                                    const std::string &container_id,
                                    const std::string &uuid_hint)
    {
        boost::json::error_code ec;
        boost::json::value      jv = boost::json::parse(body, ec);
        if (ec)
        {
            throw std::runtime_error("malformed containers document: " + ec.message());
        }
        if (!jv.is_array())
        {
            throw std::runtime_error("containers document must be an array");
        }

        for (const boost::json::value &v : jv.as_array())
        {
            if (!v.is_object())
            {
                continue;
            }
            const boost::json::object &o = v.as_object();

            const bool by_id   = Config::OptionalString(o, "external_id") == container_id;
            const bool by_uuid = !uuid_hint.empty() && Config::OptionalString(o, "uuid") == uuid_hint;
            if (!by_id && !by_uuid)
            {
                continue;
            }

            const std::string mac = Config::OptionalString(o, "primary_mac_address");
            if (mac.empty())
            {
                throw std::runtime_error("container " + container_id + " has no primary_mac_address");
            }
            return mac;
        }
        throw std::runtime_error("container " + container_id + " not found in metadata");
    }

    std::string MetadataMacLookup::Find(const std::string &base_url,
                                        const std::string &container_id,
                                        const std::string &uuid_hint)
    {
        const std::string url = ContainersUrl(base_url);
        LOGD("maclookup") << "Find: id=" << container_id << " uuid=" << uuid_hint << " url=" << url;
        try
        {
            const std::string mac = FindMacInContainers(HttpGet(url), container_id, uuid_hint);
            LOGI("maclookup") << "Find: " << container_id << " -> " << mac;
            return mac;
        }
        catch (const std::exception &e)
        {
            LOGE("maclookup") << "Find: " << e.what();
            throw PluginError(ErrorCode::MacAddressLookupFailed,
                              "failed to get MAC address for container " + container_id + ": " + e.what());
        }
    }
} // namespace Macvlan
