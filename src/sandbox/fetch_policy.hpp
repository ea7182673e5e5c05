#pragma once

#include <chrono>
#include <string>
#include <vector>

#include <boost/asio/ip/address.hpp>

namespace hoya::sandbox {

// Case-insensitive; an entry matches itself and any subdomain.
// An empty list allows every host.
bool IsHostAllowed(const std::string& host, const std::vector<std::string>& allowed_domains);

// Loopback, link-local, unspecified and multicast addresses, including
// IPv4-mapped IPv6 forms of them.
bool IsRestrictedAddress(const boost::asio::ip::address& address);

struct ResolvedHost {
    bool ok = false;
    bool restricted = false;
    std::string address;
    std::string error;
};

// Resolves host and returns the first usable address. When allow_restricted is
// false, any restricted address in the answer rejects the whole host so a
// mixed answer cannot be used to reach host-internal services. A lookup that
// takes longer than timeout fails without waiting for the resolver.
ResolvedHost ResolveHost(const std::string& host, int port, bool allow_restricted,
                         std::chrono::milliseconds timeout);

}  // namespace hoya::sandbox
