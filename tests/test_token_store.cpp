#include "Core/Metadata/TokenStore.hpp"

#include <gtest/gtest.h>

#include <set>

using Metadata::TokenStore;

namespace
{
    struct ManualClock
    {
        TokenStore::Clock::time_point now{std::chrono::hours(1)};

        TokenStore::TimeFn Fn()
        {
            return [this] { return now; };
        }

        void Advance(int seconds) { now += std::chrono::seconds(seconds); }
    };
}

TEST(TokenStore, TokenIsHexAndUnique)
{
    TokenStore store;
    std::set<std::string> seen;
    for (int i = 0; i < 32; ++i)
    {
        const auto token = store.Create(60);
        ASSERT_EQ(token.size(), 32u);
        EXPECT_EQ(token.find_first_not_of("0123456789abcdef"), std::string::npos);
        EXPECT_TRUE(seen.insert(token).second);
        EXPECT_TRUE(store.Valid(token));
    }
}

TEST(TokenStore, ExpiresAfterTtl)
{
    ManualClock clock;
    TokenStore store(clock.Fn());

    const auto token = store.Create(10);
    clock.Advance(9);
    EXPECT_TRUE(store.Valid(token));
    clock.Advance(1);
    EXPECT_FALSE(store.Valid(token));
}

TEST(TokenStore, TtlIsClamped)
{
    ManualClock clock;
    TokenStore store(clock.Fn());

    const auto short_lived = store.Create(0);
    const auto long_lived  = store.Create(1000000);

    EXPECT_TRUE(store.Valid(short_lived));
    clock.Advance(1);
    EXPECT_FALSE(store.Valid(short_lived));

    clock.Advance(TokenStore::kMaxTtl - 2);
    EXPECT_TRUE(store.Valid(long_lived));
    clock.Advance(1);
    EXPECT_FALSE(store.Valid(long_lived));
}

TEST(TokenStore, UnknownAndEmptyTokensAreInvalid)
{
    TokenStore store;
    store.Create(60);
    EXPECT_FALSE(store.Valid(""));
    EXPECT_FALSE(store.Valid("00000000000000000000000000000000"));
}

TEST(TokenStore, PruneDropsOnlyExpired)
{
    ManualClock clock;
    TokenStore store(clock.Fn());

    store.Create(5);
    store.Create(5);
    const auto keeper = store.Create(100);

    EXPECT_EQ(store.Prune(), 0u);
    clock.Advance(5);
    EXPECT_EQ(store.Prune(), 2u);
    EXPECT_EQ(store.Size(), 1u);
    EXPECT_TRUE(store.Valid(keeper));
}

TEST(TokenStore, ExpiredTokenStaysUntilPruned)
{
    ManualClock clock;
    TokenStore store(clock.Fn());

    store.Create(1);
    clock.Advance(2);
    EXPECT_EQ(store.Size(), 1u);
    store.Prune();
    EXPECT_EQ(store.Size(), 0u);
}
