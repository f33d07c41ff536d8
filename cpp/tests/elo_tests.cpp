#include <doctest/doctest.h>

#include <climits>

#include "maia/elo.hpp"
#include "maia/errors.hpp"

using maia::bucket_for;

TEST_CASE("ratings map to training buckets")
{
    CHECK(bucket_for(INT_MIN).index() == 0);
    CHECK(bucket_for(0).index() == 0);
    CHECK(bucket_for(1000).index() == 0);
    CHECK(bucket_for(1099).index() == 0);
    CHECK(bucket_for(1100).index() == 1);
    CHECK(bucket_for(1199).index() == 1);
    CHECK(bucket_for(1200).index() == 2);
    CHECK(bucket_for(1500).index() == 5);
    CHECK(bucket_for(1999).index() == 9);
    CHECK(bucket_for(2000).index() == 10);
    CHECK(bucket_for(2850).index() == 10);
    CHECK(bucket_for(INT_MAX).index() == 10);
}

TEST_CASE("bucketing is monotone and stays in range")
{
    int previous = bucket_for(-5000).index();
    for (int rating = -5000; rating <= 5000; ++rating)
    {
        const int index = bucket_for(rating).index();
        REQUIRE(index >= previous);
        REQUIRE(index >= 0);
        REQUIRE(index < maia::kEloBucketCount);
        previous = index;
    }
}

TEST_CASE("bucket helpers")
{
    CHECK(maia::clamp_elo(850) == maia::kMinElo);
    CHECK(maia::clamp_elo(2400) == maia::kMaxElo);
    CHECK(maia::clamp_elo(1437) == 1437);

    CHECK(maia::bucket_lower_bound(bucket_for(1234)) == 1200);
    CHECK(maia::bucket_lower_bound(bucket_for(900)) == maia::kMinElo);
    CHECK(maia::bucket_lower_bound(bucket_for(2500)) == 2000);

    for (int i = 0; i < maia::kEloBucketCount; ++i)
    {
        CHECK(bucket_for(maia::kBucketElos[static_cast<std::size_t>(i)]).index() == i);
        CHECK(maia::bucket_from_index(i).index() == i);
    }
    CHECK_THROWS_AS(maia::bucket_from_index(-1), maia::InputError);
    CHECK_THROWS_AS(maia::bucket_from_index(maia::kEloBucketCount), maia::InputError);

    CHECK(bucket_for(1300) < bucket_for(1400));
    CHECK(bucket_for(1310) == bucket_for(1390));
}
