#include "core/deduplicator.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <unordered_set>

std::vector<RawAssetHandle> Deduplicator::dedupe(const std::vector<RawAssetHandle> &assets)
{
    std::vector<RawAssetHandle> unique;
    unique.reserve(assets.size());
    std::unordered_set<std::string> seen_ids;

    for (const auto &asset : assets)
    {
        if (seen_ids.insert(asset.id).second)
        {
            unique.push_back(asset);
        }
    }

    std::sort(unique.begin(), unique.end(), [](const RawAssetHandle &a, const RawAssetHandle &b)
              {
        if (a.creation_time != b.creation_time)
            return a.creation_time > b.creation_time;
        return a.id < b.id; });

    if (unique.size() != assets.size())
    {
        Logger::debug("Removed " + std::to_string(assets.size() - unique.size()) + " duplicate asset(s)");
    }
    return unique;
}
