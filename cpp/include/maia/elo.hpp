#pragma once

#include <array>
#include <compare>

namespace maia
{

constexpr int kMinElo = 1000;
constexpr int kMaxElo = 2000;
constexpr int kFirstBucketedElo = 1100;
constexpr int kEloBucketWidth = 100;
constexpr int kEloBucketCount = 11;

/// Representative rating of each bucket. Bucket 0 covers everything below
/// 1100 and the last bucket everything from 2000 up.
constexpr std::array<int, kEloBucketCount> kBucketElos{
    1000, 1100, 1200, 1300, 1400, 1500, 1600, 1700, 1800, 1900, 2000};

/// Rating category fed to the network, index in [0, kEloBucketCount).
class EloBucket
{
public:
    constexpr int index() const noexcept { return index_; }

    constexpr bool operator==(const EloBucket&) const = default;
    constexpr auto operator<=>(const EloBucket&) const = default;

private:
    constexpr explicit EloBucket(int index) noexcept
        : index_(index)
    {
    }

    friend EloBucket bucket_for(int rating) noexcept;
    friend EloBucket bucket_from_index(int index);

    int index_;
};

int clamp_elo(int rating) noexcept;

/// Total and monotone: every int maps to a bucket, out-of-range ratings clamp.
EloBucket bucket_for(int rating) noexcept;

/// Throws InputError when index is outside [0, kEloBucketCount).
EloBucket bucket_from_index(int index);

/// Lowest rating that maps to `bucket` after clamping.
int bucket_lower_bound(EloBucket bucket) noexcept;

} // namespace maia
