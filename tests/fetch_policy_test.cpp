#include "sandbox/fetch_policy.hpp"

#include <boost/asio/ip/address.hpp>
#include <gtest/gtest.h>

namespace hoya::sandbox {
namespace {

bool Restricted(const char* text) {
    return IsRestrictedAddress(boost::asio::ip::make_address(text));
}

TEST(FetchPolicyTest, EmptyAllowListAllowsEverything) {
    EXPECT_TRUE(IsHostAllowed("anything.test", {}));
}

TEST(FetchPolicyTest, MatchesExactHostAndSubdomains) {
    const std::vector<std::string> allowed = {"example.com", "API.Service.io."};
    EXPECT_TRUE(IsHostAllowed("example.com", allowed));
    EXPECT_TRUE(IsHostAllowed("www.Example.com", allowed));
    EXPECT_TRUE(IsHostAllowed("api.service.io", allowed));
    EXPECT_TRUE(IsHostAllowed("v1.api.service.io", allowed));
}

TEST(FetchPolicyTest, RejectsLookalikes) {
    const std::vector<std::string> allowed = {"example.com"};
    EXPECT_FALSE(IsHostAllowed("evil.test", allowed));
    EXPECT_FALSE(IsHostAllowed("notexample.com", allowed));
    EXPECT_FALSE(IsHostAllowed("example.com.evil.test", allowed));
    EXPECT_FALSE(IsHostAllowed("", allowed));
}

TEST(FetchPolicyTest, ClassifiesRestrictedAddresses) {
    EXPECT_TRUE(Restricted("127.0.0.1"));
    EXPECT_TRUE(Restricted("127.8.9.10"));
    EXPECT_TRUE(Restricted("0.0.0.0"));
    EXPECT_TRUE(Restricted("169.254.169.254"));
    EXPECT_TRUE(Restricted("224.0.0.1"));
    EXPECT_TRUE(Restricted("::1"));
    EXPECT_TRUE(Restricted("::"));
    EXPECT_TRUE(Restricted("fe80::1"));
    EXPECT_TRUE(Restricted("ff02::1"));
    EXPECT_TRUE(Restricted("::ffff:127.0.0.1"));

    EXPECT_FALSE(Restricted("93.184.216.34"));
    EXPECT_FALSE(Restricted("2606:2800:220:1:248:1893:25c8:1946"));
}

TEST(FetchPolicyTest, ResolvingLoopbackIsRestrictedUnlessAllowed) {
    const auto blocked = ResolveHost("127.0.0.1", 80, false, std::chrono::milliseconds(2000));
    EXPECT_TRUE(blocked.restricted);
    EXPECT_FALSE(blocked.ok);

    const auto allowed = ResolveHost("127.0.0.1", 80, true, std::chrono::milliseconds(2000));
    EXPECT_TRUE(allowed.ok);
    EXPECT_FALSE(allowed.restricted);
    EXPECT_EQ(allowed.address, "127.0.0.1");
}

}  // namespace
}  // namespace hoya::sandbox
