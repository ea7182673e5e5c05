#include "sandbox/fetch_policy.hpp"

#include <memory>
#include <optional>
#include <thread>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/system/error_code.hpp>

#include "utils/common.hpp"

namespace hoya::sandbox {
namespace {

std::string NormalizeDomain(std::string domain) {
    domain = hoya::utils::ToLower(std::move(domain));
    while (!domain.empty() && domain.front() == '.') {
        domain.erase(0, 1);
    }
    while (!domain.empty() && domain.back() == '.') {
        domain.pop_back();
    }
    return domain;
}

}  // namespace

bool IsHostAllowed(const std::string& host, const std::vector<std::string>& allowed_domains) {
    if (allowed_domains.empty()) {
        return true;
    }
    const auto normalized_host = NormalizeDomain(host);
    if (normalized_host.empty()) {
        return false;
    }
    for (const auto& entry : allowed_domains) {
        const auto domain = NormalizeDomain(entry);
        if (domain.empty()) {
            continue;
        }
        if (normalized_host == domain) {
            return true;
        }
        if (normalized_host.size() > domain.size() &&
            normalized_host.compare(normalized_host.size() - domain.size(), domain.size(), domain) == 0 &&
            normalized_host[normalized_host.size() - domain.size() - 1] == '.') {
            return true;
        }
    }
    return false;
}

bool IsRestrictedAddress(const boost::asio::ip::address& address) {
    if (address.is_loopback() || address.is_unspecified() || address.is_multicast()) {
        return true;
    }
    if (address.is_v4()) {
        const auto bytes = address.to_v4().to_bytes();
        // 169.254.0.0/16 link-local, 0.0.0.0/8 "this network"
        return (bytes[0] == 169 && bytes[1] == 254) || bytes[0] == 0;
    }
    const auto v6 = address.to_v6();
    if (v6.is_v4_mapped()) {
        return IsRestrictedAddress(boost::asio::ip::make_address_v4(boost::asio::ip::v4_mapped, v6));
    }
    return v6.is_link_local() || v6.is_site_local();
}

ResolvedHost ResolveHost(const std::string& host, int port, bool allow_restricted,
                         std::chrono::milliseconds timeout) {
    using boost::asio::ip::tcp;

    struct Lookup {
        boost::system::error_code ec;
        tcp::resolver::results_type endpoints;
    };

    ResolvedHost result{};
    auto io = std::make_shared<boost::asio::io_context>();
    auto resolver = std::make_shared<tcp::resolver>(*io);
    auto lookup = std::make_shared<std::optional<Lookup>>();
    resolver->async_resolve(host, std::to_string(port),
                            [lookup](const boost::system::error_code& ec, tcp::resolver::results_type endpoints) {
                                *lookup = Lookup{.ec = ec, .endpoints = std::move(endpoints)};
                            });
    io->run_for(timeout);
    if (!lookup->has_value()) {
        resolver->cancel();
        // getaddrinfo cannot be interrupted; the lookup finishes on its own thread.
        std::thread([io, resolver]() mutable {
            io->run();
            resolver.reset();
        }).detach();
        result.error = "resolving " + host + " timed out after " + std::to_string(timeout.count()) + "ms";
        return result;
    }
    if ((*lookup)->ec) {
        result.error = "cannot resolve " + host + ": " + (*lookup)->ec.message();
        return result;
    }
    const auto& endpoints = (*lookup)->endpoints;
    for (const auto& entry : endpoints) {
        const auto address = entry.endpoint().address();
        if (IsRestrictedAddress(address)) {
            if (!allow_restricted) {
                result.restricted = true;
                result.address = address.to_string();
                result.error = host + " resolves to restricted address " + address.to_string();
                return result;
            }
        }
        if (!result.ok) {
            result.ok = true;
            result.address = address.to_string();
        }
    }
    if (!result.ok) {
        result.error = "no addresses for " + host;
    }
    return result;
}

}  // namespace hoya::sandbox
