#include "Endpoint.hpp"
#include <cctype>
#include <stdexcept>

namespace {

std::string percentEncode(const std::string& in) {
    static constexpr char kHex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(in.size());
    for (unsigned char c : in) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('%');
            out.push_back(kHex[c >> 4]);
            out.push_back(kHex[c & 0x0F]);
        }
    }
    return out;
}

} // namespace

Endpoint buildDownloadsEndpoint(const std::string& baseUrl, const std::string& token) {
    Endpoint ep;
    std::string rest;

    const auto schemeEnd = baseUrl.find("://");
    if (schemeEnd == std::string::npos) {
        throw std::invalid_argument("Endpoint: base URL has no scheme: " + baseUrl);
    }
    const std::string scheme = baseUrl.substr(0, schemeEnd);
    if (scheme == "https" || scheme == "wss") {
        ep.secure = true;
    } else if (scheme != "http" && scheme != "ws") {
        throw std::invalid_argument("Endpoint: unsupported scheme '" + scheme + "'");
    }
    rest = baseUrl.substr(schemeEnd + 3);

    const auto pathStart = rest.find('/');
    std::string authority = rest.substr(0, pathStart);
    std::string path = pathStart == std::string::npos ? std::string{} : rest.substr(pathStart);

    const auto colon = authority.rfind(':');
    if (colon != std::string::npos && authority.find(']', colon) == std::string::npos) {
        ep.host = authority.substr(0, colon);
        ep.port = authority.substr(colon + 1);
    } else {
        ep.host = authority;
    }
    if (ep.host.size() >= 2 && ep.host.front() == '[' && ep.host.back() == ']') {
        ep.host = ep.host.substr(1, ep.host.size() - 2);
    }
    if (ep.host.empty()) {
        throw std::invalid_argument("Endpoint: base URL has no host: " + baseUrl);
    }
    if (ep.port.empty()) ep.port = ep.secure ? "443" : "80";

    while (!path.empty() && path.back() == '/') path.pop_back();
    ep.target = path + "/downloads/ws?token=" + percentEncode(token);
    return ep;
}

std::string hostAndPort(const Endpoint& endpoint) {
    if (endpoint.host.find(':') != std::string::npos) {
        return "[" + endpoint.host + "]:" + endpoint.port;
    }
    return endpoint.host + ":" + endpoint.port;
}

std::string describeEndpoint(const Endpoint& endpoint) {
    std::string target = endpoint.target;
    const auto q = target.find("token=");
    if (q != std::string::npos) {
        const auto end = target.find('&', q);
        target.replace(q + 6, end == std::string::npos ? std::string::npos : end - q - 6, "***");
    }
    return (endpoint.secure ? "wss://" : "ws://") + hostAndPort(endpoint) + target;
}
