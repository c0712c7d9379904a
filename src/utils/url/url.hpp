#pragma once
#include <string>

namespace Trawl {
namespace Utils {

struct UrlParsed {
    std::string scheme;
    std::string host;
    std::string port;
    std::string path;
    std::string query;
    std::string fragment;
    std::string start_url;
};

class Url {
public:
    static UrlParsed   parse(const std::string& url);
    static std::string resolve(const std::string& base, const std::string& relative);
    static bool        is_same_domain(const std::string& url1, const std::string& url2);
    static bool        is_http(const std::string& url);

    // Canonical form used for request unique keys: lower-case scheme and
    // host, no default port, no fragment, no trailing slash, utm_*
    // parameters dropped and the rest sorted.
    static std::string normalize(const std::string& url, bool keep_fragment = false);
};

}  // namespace Utils
}  // namespace Trawl
