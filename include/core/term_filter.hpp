#pragma once

#include <string>
#include <vector>
#include "core/media_types.hpp"

/**
 * @brief Free-text narrowing of assets by display title
 */
class TermFilter
{
public:
    /**
     * @brief Keep assets whose title contains any term or the whole original query
     *
     * Matching is case-insensitive substring matching. With no non-empty terms the
     * input is returned unchanged. Order is preserved.
     */
    static std::vector<RawAssetHandle> filter(const std::vector<RawAssetHandle> &assets,
                                              const std::vector<std::string> &terms,
                                              const std::string &original_query);

    static bool titleMatches(const std::string &title, const std::vector<std::string> &lowered_terms,
                             const std::string &lowered_query);
};
