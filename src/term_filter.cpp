#include "core/term_filter.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <cctype>
#include <iterator>

namespace
{
    std::string toLower(std::string value)
    {
        std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c)
                       { return static_cast<char>(std::tolower(c)); });
        return value;
    }

    std::string trim(const std::string &value)
    {
        size_t first = value.find_first_not_of(" \t\r\n");
        if (first == std::string::npos)
            return "";
        size_t last = value.find_last_not_of(" \t\r\n");
        return value.substr(first, last - first + 1);
    }
}

bool TermFilter::titleMatches(const std::string &title, const std::vector<std::string> &lowered_terms,
                              const std::string &lowered_query)
{
    std::string lowered_title = toLower(title);
    for (const auto &term : lowered_terms)
    {
        if (lowered_title.find(term) != std::string::npos)
        {
            return true;
        }
    }
    return !lowered_query.empty() && lowered_title.find(lowered_query) != std::string::npos;
}

std::vector<RawAssetHandle> TermFilter::filter(const std::vector<RawAssetHandle> &assets,
                                               const std::vector<std::string> &terms,
                                               const std::string &original_query)
{
    std::vector<std::string> lowered_terms;
    for (const auto &term : terms)
    {
        if (!term.empty())
        {
            lowered_terms.push_back(toLower(term));
        }
    }

    if (lowered_terms.empty())
    {
        return assets;
    }

    std::string lowered_query = toLower(trim(original_query));
    std::vector<RawAssetHandle> matched;
    std::copy_if(assets.begin(), assets.end(), std::back_inserter(matched), [&](const RawAssetHandle &asset)
                 { return titleMatches(asset.title, lowered_terms, lowered_query); });

    Logger::debug("Term filter kept " + std::to_string(matched.size()) + " of " + std::to_string(assets.size()) +
                  " asset(s)");
    return matched;
}
