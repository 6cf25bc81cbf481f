#pragma once

#include <functional>
#include <string>
#include <vector>

namespace micsync {
namespace discovery {

struct ResolvedName {
    std::string fqdn;
    std::vector<std::string> addresses;  // Empty when resolution failed
};

// Resolves one name. Returns false and fills error on failure.
using ResolverFn =
    std::function<bool(const std::string &name, std::vector<std::string> &addresses, std::string &error)>;

/**
 * @brief Usable IPv4 host addresses of a network, in address order
 *
 * Host bits set in the input are masked off ("10.0.0.7/24" is 10.0.0.0/24).
 * Network and broadcast addresses are excluded, except for /31 (both
 * addresses) and /32 (the single address). At most max_hosts entries are
 * returned; max_hosts <= 0 means no cap. Invalid or non-IPv4 input yields
 * an empty list.
 */
std::vector<std::string> expand_cidr(const std::string &cidr, int max_hosts);

/**
 * @brief Resolve each name to its distinct addresses
 *
 * One entry per distinct input name, in input order. A failing name maps to
 * an empty list and does not affect the others.
 */
std::vector<ResolvedName> resolve_fqdns(const std::vector<std::string> &names);
std::vector<ResolvedName> resolve_fqdns(const std::vector<std::string> &names, const ResolverFn &resolver);

// getaddrinfo() for IPv4 and IPv6; addresses in resolver order, deduplicated
bool system_resolve(const std::string &name, std::vector<std::string> &addresses, std::string &error);

bool is_valid_ipv4(const std::string &address);

// Keeps valid IPv4 entries (trimmed), logs and drops the rest
std::vector<std::string> filter_ipv4(const std::vector<std::string> &addresses);

// RFC 1123 host name: dot-separated labels of [A-Za-z0-9-], 1-63 chars, no
// leading/trailing hyphen, 253 chars total
bool is_valid_hostname(const std::string &name);

}  // namespace discovery
}  // namespace micsync
