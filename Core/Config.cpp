#include "Config.hpp"

#include <stdexcept>

namespace
{
    const boost::json::value &Require(const boost::json::object &o,
                                      const char                *key)
    {
        const boost::json::value *v = o.if_contains(key);
        if (!v)
        {
            throw std::runtime_error(std::string("missing required key \"") + key + "\"");
        }
        return *v;
    }

    [[noreturn]] void TypeMismatch(const char *key,
                                   const char *expected)
    {
        throw std::runtime_error(std::string("key \"") + key + "\" must be " + expected);
    }

    std::string AsString(const boost::json::value &v,
                         const char               *key)
    {
        if (!v.is_string())
        {
            TypeMismatch(key, "a string");
        }
        return std::string(v.as_string().c_str());
    }

    std::int64_t AsInt(const boost::json::value &v,
                       const char               *key)
    {
        if (v.is_int64())
        {
            return v.as_int64();
        }
        if (v.is_uint64())
        {
            return static_cast<std::int64_t>(v.as_uint64());
        }
        // 1500.0 из некоторых генераторов конфигов
        if (v.is_double())
        {
            const double d = v.as_double();
            const auto   i = static_cast<std::int64_t>(d);
            if (static_cast<double>(i) == d)
            {
                return i;
            }
        }
        TypeMismatch(key, "an integer");
    }

    bool AsBool(const boost::json::value &v,
                const char               *key)
    {
        if (!v.is_bool())
        {
            TypeMismatch(key, "a boolean");
        }
        return v.as_bool();
    }
}

namespace Config
{
    std::string RequireString(const boost::json::object &o,
                              const char                *key)
    {
        return AsString(Require(o, key), key);
    }

    std::string OptionalString(const boost::json::object &o,
                               const char                *key,
                               const std::string         &def)
    {
        const boost::json::value *v = o.if_contains(key);
        if (!v || v->is_null())
        {
            return def;
        }
        return AsString(*v, key);
    }

    std::int64_t OptionalInt(const boost::json::object &o,
                             const char                *key,
                             std::int64_t               def)
    {
        const boost::json::value *v = o.if_contains(key);
        if (!v || v->is_null())
        {
            return def;
        }
        return AsInt(*v, key);
    }

    bool OptionalBool(const boost::json::object &o,
                      const char                *key,
                      bool                       def)
    {
        const boost::json::value *v = o.if_contains(key);
        if (!v || v->is_null())
        {
            return def;
        }
        return AsBool(*v, key);
    }

    std::vector<std::string> OptionalStringArray(const boost::json::object &o,
                                                 const char                *key)
    {
        std::vector<std::string> out;

        const boost::json::value *v = o.if_contains(key);
        if (!v || v->is_null())
        {
            return out;
        }
        if (!v->is_array())
        {
            TypeMismatch(key, "an array of strings");
        }
        for (const boost::json::value &item : v->as_array())
        {
            out.push_back(AsString(item, key));
        }
        return out;
    }

    const boost::json::object &OptionalObject(const boost::json::object &o,
                                              const char                *key)
    {
        static const boost::json::object empty;

        const boost::json::value *v = o.if_contains(key);
        if (!v || v->is_null())
        {
            return empty;
        }
        if (!v->is_object())
        {
            TypeMismatch(key, "an object");
        }
        return v->as_object();
    }
} // namespace Config
