/*
 * Copyright (C) 2025 Tracklike contributors
 *
 * This file is part of Tracklike.
 *
 * Tracklike is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * Tracklike is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with Tracklike.  If not, see <http://www.gnu.org/licenses/>.
 */

#include "services/recommendation/Types.hpp"

#include <utility>

#include "core/String.hpp"

namespace tracklike::recommendation
{
    namespace
    {
        constexpr std::pair<Strategy, std::string_view> strategyNames[]{
            { Strategy::Global, "global" },
            { Strategy::Cluster, "cluster" },
            { Strategy::Hybrid, "hybrid" },
            { Strategy::Artist, "artist" },
            { Strategy::Genre, "genre" },
        };
    } // namespace

    std::string_view toString(Strategy strategy)
    {
        for (const auto& [value, name] : strategyNames)
        {
            if (value == strategy)
                return name;
        }
        return "";
    }

    std::optional<Strategy> strategyFromString(std::string_view str)
    {
        for (const auto& [value, name] : strategyNames)
        {
            if (core::stringUtils::stringCaseInsensitiveEqual(name, str))
                return value;
        }
        return std::nullopt;
    }

    std::string_view toString(MatchKind matchKind)
    {
        switch (matchKind)
        {
        case MatchKind::Global:
            return "global";
        case MatchKind::Cluster:
            return "cluster";
        case MatchKind::ClusterFallback:
            return "cluster_fallback";
        case MatchKind::Artist:
            return "artist";
        case MatchKind::Genre:
            return "genre";
        case MatchKind::Padding:
            return "padding";
        }
        return "";
    }

    std::string_view toString(ClusterSortKey sortKey)
    {
        switch (sortKey)
        {
        case ClusterSortKey::Size:
            return "size";
        case ClusterSortKey::Id:
            return "id";
        }
        return "";
    }

    std::optional<ClusterSortKey> clusterSortKeyFromString(std::string_view str)
    {
        for (const ClusterSortKey sortKey : { ClusterSortKey::Size, ClusterSortKey::Id })
        {
            if (core::stringUtils::stringCaseInsensitiveEqual(toString(sortKey), str))
                return sortKey;
        }
        return std::nullopt;
    }

    std::string_view toString(ComparisonErrorKind errorKind)
    {
        switch (errorKind)
        {
        case ComparisonErrorKind::VariantNotFound:
            return "variant_not_found";
        case ComparisonErrorKind::RegistryEmpty:
            return "registry_empty";
        case ComparisonErrorKind::UnknownTrack:
            return "unknown_track";
        case ComparisonErrorKind::InvalidQuery:
            return "invalid_query";
        case ComparisonErrorKind::Internal:
            return "internal";
        }
        return "";
    }
} // namespace tracklike::recommendation
