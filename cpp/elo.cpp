#include "maia/elo.hpp"

#include <algorithm>
#include <string>

#include "maia/errors.hpp"

namespace maia
{

int clamp_elo(int rating) noexcept
{
    return std::clamp(rating, kMinElo, kMaxElo);
}

EloBucket bucket_for(int rating) noexcept
{
    const int clamped = clamp_elo(rating);
    if (clamped < kFirstBucketedElo)
    {
        return EloBucket(0);
    }
    if (clamped >= kMaxElo)
    {
        return EloBucket(kEloBucketCount - 1);
    }
    return EloBucket((clamped - kFirstBucketedElo) / kEloBucketWidth + 1);
}

EloBucket bucket_from_index(int index)
{
    if (index < 0 || index >= kEloBucketCount)
    {
        throw InputError("Elo bucket index out of range: " + std::to_string(index));
    }
    return EloBucket(index);
}

int bucket_lower_bound(EloBucket bucket) noexcept
{
    if (bucket.index() == 0)
    {
        return kMinElo;
    }
    return kBucketElos[static_cast<std::size_t>(bucket.index())];
}

} // namespace maia
