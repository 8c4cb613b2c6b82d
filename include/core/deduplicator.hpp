#pragma once

#include <vector>
#include "core/media_types.hpp"

class Deduplicator
{
public:
    /**
     * @brief Keep one handle per id, newest first
     *
     * The first occurrence of an id wins. Ties on creation time are ordered by id so the
     * output is deterministic; applying dedupe twice gives the same result.
     */
    static std::vector<RawAssetHandle> dedupe(const std::vector<RawAssetHandle> &assets);
};
