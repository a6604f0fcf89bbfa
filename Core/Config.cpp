#include "Core/Config.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>

namespace Config
{
    namespace
    {
        const boost::json::value *Find(const boost::json::object &o,
                                       const char                *key)
        {
            const boost::json::value *v = o.if_contains(key);
            if (!v || v->is_null())
            {
                return nullptr;
            }
            return v;
        }

        [[noreturn]] void WrongType(const char *key,
                                    const char *want)
        {
            throw std::invalid_argument(std::string("config: key '") + key + "' must be " + want);
        }

        std::string AsString(const boost::json::value &v,
                             const char               *key)
        {
            if (!v.is_string())
            {
                WrongType(key, "a string");
            }
            return std::string(v.as_string().c_str(), v.as_string().size());
        }

        std::int64_t AsInt(const boost::json::value &v,
                           const char               *key)
        {
            if (v.is_int64())
            {
                return v.as_int64();
            }
            if (v.is_uint64() && v.as_uint64() <= static_cast<std::uint64_t>(INT64_MAX))
            {
                return static_cast<std::int64_t>(v.as_uint64());
            }
            WrongType(key, "an integer");
        }

        bool AsBool(const boost::json::value &v,
                    const char               *key)
        {
            if (!v.is_bool())
            {
                WrongType(key, "a boolean");
            }
            return v.as_bool();
        }
    }

    std::string OptionalString(const boost::json::object &o,
                               const char                *key,
                               const std::string         &def)
    {
        const boost::json::value *v = Find(o, key);
        return v ? AsString(*v, key) : def;
    }

    std::int64_t OptionalInt(const boost::json::object &o,
                             const char                *key,
                             std::int64_t               def)
    {
        const boost::json::value *v = Find(o, key);
        return v ? AsInt(*v, key) : def;
    }

    bool OptionalBool(const boost::json::object &o,
                      const char                *key,
                      bool                       def)
    {
        const boost::json::value *v = Find(o, key);
        return v ? AsBool(*v, key) : def;
    }

    boost::json::object LoadObjectFile(const std::string &path)
    {
        std::ifstream in(path);
        if (!in)
        {
            throw std::runtime_error("config: cannot open " + path);
        }
        std::stringstream ss;
        ss << in.rdbuf();

        boost::system::error_code ec;
        boost::json::value jv = boost::json::parse(ss.str(), ec);
        if (ec)
        {
            throw std::invalid_argument("config: " + path + ": " + ec.message());
        }
        if (!jv.is_object())
        {
            throw std::invalid_argument("config: " + path + ": top level must be an object");
        }
        return std::move(jv.as_object());
    }
} // namespace Config
