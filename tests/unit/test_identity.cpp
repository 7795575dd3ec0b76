#include <gtest/gtest.h>
#include "chunkvault/core/identity.hpp"

using namespace chunkvault::core;

TEST(StaticTokenIdentityProviderTest, ParsesTokenList) {
    auto provider = StaticTokenIdentityProvider::from_string(" alice:tok-a , bob:tok-b,,");
    EXPECT_EQ(provider.token_count(), 2u);

    auto alice = provider.authenticate("tok-a");
    ASSERT_TRUE(alice.has_value());
    EXPECT_EQ(alice->user_id, "alice");

    auto bob = provider.authenticate("tok-b");
    ASSERT_TRUE(bob.has_value());
    EXPECT_EQ(*bob, Principal{"bob"});
}

TEST(StaticTokenIdentityProviderTest, SkipsMalformedEntries) {
    auto provider = StaticTokenIdentityProvider::from_string("nocolon,:missinguser,missingtoken:,carol:c:1");
    EXPECT_EQ(provider.token_count(), 1u);

    auto carol = provider.authenticate("c:1");
    ASSERT_TRUE(carol.has_value());
    EXPECT_EQ(carol->user_id, "carol");
}

TEST(StaticTokenIdentityProviderTest, RejectsUnknownAndEmptyTokens) {
    StaticTokenIdentityProvider provider;
    provider.add_token("secret", "alice");

    EXPECT_FALSE(provider.authenticate("").has_value());
    EXPECT_FALSE(provider.authenticate("Secret").has_value());
    EXPECT_TRUE(provider.authenticate("secret").has_value());
}
