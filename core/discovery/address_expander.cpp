#include "address_expander.hpp"

#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <memory>
#include <unordered_set>

#include "logging/logger.hpp"

namespace micsync {
namespace discovery {

namespace {

std::string trim(const std::string &s) {
    const auto begin = std::find_if_not(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c) != 0; });
    const auto end = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) { return std::isspace(c) != 0; }).base();
    return begin < end ? std::string(begin, end) : std::string();
}

bool parse_ipv4(const std::string &text, uint32_t &host_order) {
    in_addr addr{};
    if (inet_pton(AF_INET, text.c_str(), &addr) != 1) {
        return false;
    }
    host_order = ntohl(addr.s_addr);
    return true;
}

std::string format_ipv4(uint32_t host_order) {
    in_addr addr{};
    addr.s_addr = htonl(host_order);
    char buf[INET_ADDRSTRLEN] = {};
    if (inet_ntop(AF_INET, &addr, buf, sizeof(buf)) == nullptr) {
        return std::string();
    }
    return std::string(buf);
}

bool parse_prefix(const std::string &text, int &prefix) {
    if (text.empty() || text.size() > 2 ||
        !std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c) != 0; })) {
        return false;
    }
    prefix = std::stoi(text);
    return prefix >= 0 && prefix <= 32;
}

}  // namespace

std::vector<std::string> expand_cidr(const std::string &cidr, int max_hosts) {
    std::vector<std::string> hosts;
    const std::string input = trim(cidr);

    if (input.find(':') != std::string::npos) {
        LOG_WARN("[AddressExpander] IPv6 network not supported: '" << input << "'");
        return hosts;
    }

    const auto slash = input.find('/');
    const std::string address_part = input.substr(0, slash);
    int prefix = 32;
    if (slash != std::string::npos && !parse_prefix(input.substr(slash + 1), prefix)) {
        LOG_WARN("[AddressExpander] Invalid prefix length in '" << input << "'");
        return hosts;
    }

    uint32_t address = 0;
    if (!parse_ipv4(address_part, address)) {
        LOG_WARN("[AddressExpander] Invalid network address in '" << input << "'");
        return hosts;
    }

    const uint32_t mask = prefix == 0 ? 0u : (0xFFFFFFFFu << (32 - prefix));
    const uint32_t network = address & mask;
    const uint32_t broadcast = network | ~mask;

    uint64_t first = network;
    uint64_t last = broadcast;
    if (prefix < 31) {
        first = static_cast<uint64_t>(network) + 1;
        last = static_cast<uint64_t>(broadcast) - 1;
    }

    uint64_t count = last - first + 1;
    if (max_hosts > 0 && count > static_cast<uint64_t>(max_hosts)) {
        LOG_DEBUG("[AddressExpander] " << input << " has " << count << " hosts, truncating to " << max_hosts);
        count = static_cast<uint64_t>(max_hosts);
    }

    hosts.reserve(static_cast<size_t>(count));
    for (uint64_t i = 0; i < count; ++i) {
        hosts.push_back(format_ipv4(static_cast<uint32_t>(first + i)));
    }
    return hosts;
}

bool system_resolve(const std::string &name, std::vector<std::string> &addresses, std::string &error) {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo *res = nullptr;
    const int gai = ::getaddrinfo(name.c_str(), nullptr, &hints, &res);
    std::unique_ptr<addrinfo, void (*)(addrinfo *)> res_guard(res, &::freeaddrinfo);

    if (gai != 0) {
        error = ::gai_strerror(gai);
        return false;
    }

    std::unordered_set<std::string> seen;
    for (addrinfo *rp = res; rp != nullptr; rp = rp->ai_next) {
        char buf[INET6_ADDRSTRLEN] = {};
        const char *text = nullptr;

        if (rp->ai_family == AF_INET) {
            const auto *sin = reinterpret_cast<const sockaddr_in *>(rp->ai_addr);
            text = inet_ntop(AF_INET, &sin->sin_addr, buf, sizeof(buf));
        } else if (rp->ai_family == AF_INET6) {
            const auto *sin6 = reinterpret_cast<const sockaddr_in6 *>(rp->ai_addr);
            text = inet_ntop(AF_INET6, &sin6->sin6_addr, buf, sizeof(buf));
        }

        if (text != nullptr && seen.insert(text).second) {
            addresses.emplace_back(text);
        }
    }

    if (addresses.empty()) {
        error = "no addresses";
        return false;
    }
    return true;
}

std::vector<ResolvedName> resolve_fqdns(const std::vector<std::string> &names) {
    return resolve_fqdns(names, system_resolve);
}

std::vector<ResolvedName> resolve_fqdns(const std::vector<std::string> &names, const ResolverFn &resolver) {
    std::vector<ResolvedName> results;
    std::unordered_set<std::string> seen;

    for (const auto &raw : names) {
        const std::string name = trim(raw);
        if (name.empty() || !seen.insert(name).second) {
            continue;
        }

        ResolvedName entry;
        entry.fqdn = name;

        std::string error;
        std::vector<std::string> addresses;
        if (resolver(name, addresses, error)) {
            std::unordered_set<std::string> unique;
            for (auto &address : addresses) {
                if (unique.insert(address).second) {
                    entry.addresses.push_back(std::move(address));
                }
            }
            LOG_DEBUG("[AddressExpander] " << name << " -> " << entry.addresses.size() << " address(es)");
        } else {
            LOG_WARN("[AddressExpander] Failed to resolve '" << name << "': " << error);
        }

        results.push_back(std::move(entry));
    }

    return results;
}

bool is_valid_ipv4(const std::string &address) {
    uint32_t unused = 0;
    return parse_ipv4(address, unused);
}

std::vector<std::string> filter_ipv4(const std::vector<std::string> &addresses) {
    std::vector<std::string> valid;
    valid.reserve(addresses.size());

    for (const auto &raw : addresses) {
        const std::string address = trim(raw);
        if (is_valid_ipv4(address)) {
            valid.push_back(address);
        } else {
            LOG_WARN("[AddressExpander] Dropping invalid IPv4 address: '" << raw << "'");
        }
    }
    return valid;
}

bool is_valid_hostname(const std::string &name) {
    std::string host = name;
    if (!host.empty() && host.back() == '.') {
        host.pop_back();
    }
    if (host.empty() || host.size() > 253) {
        return false;
    }

    size_t start = 0;
    while (start <= host.size()) {
        const auto dot = host.find('.', start);
        const std::string label = host.substr(start, dot == std::string::npos ? std::string::npos : dot - start);

        if (label.empty() || label.size() > 63 || label.front() == '-' || label.back() == '-') {
            return false;
        }
        if (!std::all_of(label.begin(), label.end(),
                         [](unsigned char c) { return std::isalnum(c) != 0 || c == '-'; })) {
            return false;
        }

        if (dot == std::string::npos) {
            break;
        }
        start = dot + 1;
    }
    return true;
}

}  // namespace discovery
}  // namespace micsync
