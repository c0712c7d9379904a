#include "url.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>
#include <string_view>
#include <vector>

namespace Trawl {
namespace Utils {

namespace {
std::string lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

std::string clean_host(std::string host) {
    if (!host.empty() && host.back() == '.')
        host.pop_back();
    return lower(std::move(host));
}

// A colon only ends a scheme when it comes before any '/', '?' or '#'.
size_t scheme_length(std::string_view sv) {
    size_t stop = sv.find_first_of(":/?#");
    if (stop != std::string_view::npos && sv[stop] == ':')
        return stop;
    return std::string_view::npos;
}

void split_host_port(std::string_view host_port, UrlParsed& parsed) {
    if (!host_port.empty() && host_port.front() == '[') {
        size_t close = host_port.find(']');
        if (close == std::string_view::npos) {
            parsed.host = std::string(host_port);
            return;
        }
        parsed.host = std::string(host_port.substr(0, close + 1));
        size_t colon = host_port.find(':', close + 1);
        if (colon != std::string_view::npos)
            parsed.port = std::string(host_port.substr(colon + 1));
        return;
    }

    size_t colon = host_port.rfind(':');
    if (colon == std::string_view::npos) {
        parsed.host = std::string(host_port);
    }
    else {
        parsed.host = std::string(host_port.substr(0, colon));
        parsed.port = std::string(host_port.substr(colon + 1));
    }
}

std::string authority_of(const UrlParsed& parsed) {
    if (parsed.port.empty())
        return parsed.host;
    return parsed.host + ":" + parsed.port;
}

std::string remove_dot_segments(const std::string& path) {
    std::vector<std::string> kept;
    std::stringstream        ss(path);
    std::string              segment;
    while (std::getline(ss, segment, '/')) {
        if (segment.empty() || segment == ".")
            continue;
        if (segment == "..") {
            if (!kept.empty())
                kept.pop_back();
            continue;
        }
        kept.push_back(segment);
    }

    std::string out;
    for (const auto& s : kept)
        out += "/" + s;
    if (out.empty() || (path.size() > 1 && path.back() == '/'))
        out += "/";
    return out;
}
}  // namespace

UrlParsed Url::parse(const std::string& url) {
    UrlParsed parsed;
    parsed.start_url = url;

    std::string_view rest = url;

    size_t scheme_len = scheme_length(rest);
    if (scheme_len != std::string_view::npos) {
        parsed.scheme = std::string(rest.substr(0, scheme_len));
        rest.remove_prefix(scheme_len + 1);
    }

    if (rest.substr(0, 2) == "//") {
        rest.remove_prefix(2);
        size_t           auth_end  = std::min(rest.find_first_of("/?#"), rest.size());
        std::string_view authority = rest.substr(0, auth_end);
        rest.remove_prefix(auth_end);

        size_t at = authority.rfind('@');
        if (at != std::string_view::npos)
            authority.remove_prefix(at + 1);
        split_host_port(authority, parsed);
    }

    size_t hash = rest.find('#');
    if (hash != std::string_view::npos) {
        parsed.fragment = std::string(rest.substr(hash + 1));
        rest            = rest.substr(0, hash);
    }

    size_t question = rest.find('?');
    if (question != std::string_view::npos) {
        parsed.query = std::string(rest.substr(question + 1));
        rest         = rest.substr(0, question);
    }

    parsed.path = rest.empty() ? "/" : std::string(rest);
    return parsed;
}

std::string Url::resolve(const std::string& base, const std::string& relative) {
    if (relative.empty())
        return base;

    if (relative.front() == '#')
        return base.substr(0, base.find('#')) + relative;

    if (relative.front() == '?')
        return base.substr(0, base.find_first_of("?#")) + relative;

    if (relative.find("://") != std::string::npos)
        return relative;

    // mailto:, javascript:, tel: and friends
    size_t colon = relative.find(':');
    if (colon != std::string::npos && colon < 10)
        return "";

    UrlParsed origin = parse(base);
    if (relative.compare(0, 2, "//") == 0)
        return origin.scheme + ":" + relative;

    std::string target;
    if (relative.front() == '/') {
        target = relative;
    }
    else {
        size_t last_slash = origin.path.rfind('/');
        target = (last_slash == std::string::npos ? "/" : origin.path.substr(0, last_slash + 1)) + relative;
    }

    size_t      tail_pos = target.find_first_of("?#");
    std::string tail     = tail_pos == std::string::npos ? "" : target.substr(tail_pos);
    std::string path     = remove_dot_segments(target.substr(0, tail_pos));

    return origin.scheme + "://" + authority_of(origin) + path + tail;
}

bool Url::is_same_domain(const std::string& url1, const std::string& url2) {
    return clean_host(parse(url1).host) == clean_host(parse(url2).host);
}

bool Url::is_http(const std::string& url) {
    const std::string scheme = lower(parse(url).scheme);
    return scheme == "http" || scheme == "https";
}

std::string Url::normalize(const std::string& url, bool keep_fragment) {
    UrlParsed p = parse(url);
    if (p.host.empty())
        return url;

    const std::string scheme = lower(p.scheme);
    std::string       result = scheme + "://" + clean_host(p.host);
    if (!p.port.empty() && !(scheme == "http" && p.port == "80") && !(scheme == "https" && p.port == "443"))
        result += ":" + p.port;

    std::string path = p.path;
    while (path.size() > 1 && path.back() == '/')
        path.pop_back();
    if (path == "/")
        path.clear();
    result += path;

    std::vector<std::string> params;
    std::stringstream        ss(p.query);
    std::string              param;
    while (std::getline(ss, param, '&')) {
        if (param.empty() || param.rfind("utm_", 0) == 0)
            continue;
        params.push_back(param);
    }
    std::sort(params.begin(), params.end());
    for (size_t i = 0; i < params.size(); ++i)
        result += (i == 0 ? "?" : "&") + params[i];

    if (keep_fragment && !p.fragment.empty())
        result += "#" + p.fragment;
    return result;
}

}  // namespace Utils
}  // namespace Trawl
