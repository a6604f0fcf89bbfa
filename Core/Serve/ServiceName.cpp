#include "Core/Serve/ServiceName.hpp"

#include <cctype>

namespace Serve
{
    namespace
    {
        std::string TrimChar(const std::string &s,
                             char               c)
        {
            const auto b = s.find_first_not_of(c);
            if (b == std::string::npos)
            {
                return {};
            }
            const auto e = s.find_last_not_of(c);
            return s.substr(b, e - b + 1);
        }

        std::string TrimSpace(const std::string &s)
        {
            const auto b = s.find_first_not_of(" \t\r\n\v\f");
            if (b == std::string::npos)
            {
                return {};
            }
            const auto e = s.find_last_not_of(" \t\r\n\v\f");
            return s.substr(b, e - b + 1);
        }
    }

    std::string DnsLabelSanitize(const std::string &s)
    {
        // Каждая серия недопустимых символов превращается в один '-'.
        std::string out;
        out.reserve(s.size());
        bool in_run = false;
        for (unsigned char c : s)
        {
            const char lc = static_cast<char>(std::tolower(c));
            const bool ok = (lc >= 'a' && lc <= 'z') || (lc >= '0' && lc <= '9') || lc == '-';
            if (ok)
            {
                out.push_back(lc);
                in_run = false;
            }
            else if (!in_run)
            {
                out.push_back('-');
                in_run = true;
            }
        }

        out = TrimChar(out, '-');
        if (out.size() > 63)
        {
            out = TrimChar(out.substr(0, 63), '-');
        }
        return out;
    }

    std::string DefaultServiceName(const std::string &ns,
                                   const std::string &name)
    {
        std::string s = DnsLabelSanitize("k8s-" + ns + "-" + name);
        return s.empty() ? std::string(kFallbackName) : s;
    }

    std::string ServiceName(const Kube::Service &svc,
                            const std::string   &annotation_key)
    {
        std::string bare;
        auto it = svc.annotations.find(annotation_key);
        if (it != svc.annotations.end() && !it->second.empty())
        {
            bare = TrimSpace(it->second);
        }
        else
        {
            bare = DefaultServiceName(svc.ns, svc.name);
        }
        if (bare.empty())
        {
            return {};
        }
        return kServicePrefix + bare;
    }

    std::string WithoutPrefix(const std::string &name)
    {
        const std::string prefix = kServicePrefix;
        if (name.compare(0, prefix.size(), prefix) == 0)
        {
            return name.substr(prefix.size());
        }
        return name;
    }
} // namespace Serve
