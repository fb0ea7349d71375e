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

#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "model/ClusterIndex.hpp"
#include "model/ModelVariant.hpp"
#include "model/Track.hpp"
#include "model/Types.hpp"

namespace tracklike::recommendation
{
    enum class Strategy
    {
        Global,  // nearest neighbors in the whole feature space
        Cluster, // nearest neighbors inside the cluster of each seed
        Hybrid,  // cluster matches first, then global ones
        Artist,  // tracks of the seed artists, then global padding
        Genre,   // tracks sharing a dominant genre of the seed clusters, then global padding
    };

    std::string_view toString(Strategy strategy);
    std::optional<Strategy> strategyFromString(std::string_view str);

    enum class MatchKind
    {
        Global,
        Cluster,
        ClusterFallback, // global match for a seed whose cluster is too small or noise
        Artist,
        Genre,
        Padding, // global match completing an artist or genre result
    };

    std::string_view toString(MatchKind matchKind);

    enum class ResultStatus
    {
        Ok,
        EmptyCandidateSet,
    };

    struct RecommendedTrack
    {
        model::Track track;
        std::optional<model::ClusterId> clusterId; // unset for noise
        double similarity{};
        model::Distance distance{};
        model::TrackId sourceSeedId;
        MatchKind matchKind{ MatchKind::Global };
    };

    struct RecommendationQuery
    {
        std::vector<model::TrackId> seedIds;
        Strategy strategy{ Strategy::Global };
        std::optional<std::size_t> count;       // default count if unset
        std::optional<std::string> variantName; // active variant if unset
    };

    struct RecommendationResult
    {
        std::string variantName;
        Strategy strategy{ Strategy::Global };
        ResultStatus status{ ResultStatus::Ok };
        std::vector<RecommendedTrack> tracks;
        std::vector<model::TrackId> fallbackSeedIds;
    };

    struct ComparisonLabel
    {
        std::optional<std::string> variantName; // active variant if unset
        Strategy strategy{ Strategy::Global };
    };

    enum class ComparisonErrorKind
    {
        VariantNotFound,
        RegistryEmpty,
        UnknownTrack,
        InvalidQuery,
        Internal,
    };

    std::string_view toString(ComparisonErrorKind errorKind);

    struct ComparisonError
    {
        ComparisonErrorKind kind{ ComparisonErrorKind::Internal };
        std::string message;
    };

    struct ComparisonEntry
    {
        ComparisonLabel label;
        std::optional<RecommendationResult> result; // unset on error
        std::optional<ComparisonError> error;
        std::chrono::microseconds elapsed{};
    };

    struct VariantSummary
    {
        std::string name;
        model::VariantConfig config;
        std::size_t trackCount{};
        std::size_t clusterCount{};
        bool active{};
    };

    struct ClusterInfo
    {
        std::string variantName;
        model::ClusterStats stats;
        std::vector<model::Track> sampleTracks; // most popular first
    };

    enum class ClusterSortKey
    {
        Size,
        Id,
    };

    std::string_view toString(ClusterSortKey sortKey);
    std::optional<ClusterSortKey> clusterSortKeyFromString(std::string_view str);

    // Noise is never listed. Ties are broken by ascending cluster id.
    struct ClusterListQuery
    {
        std::size_t minSize{}; // no filter if 0
        ClusterSortKey sortBy{ ClusterSortKey::Size };
        bool descending{ true };
        std::size_t offset{};
        std::optional<std::size_t> limit; // all if unset
        std::optional<std::string> variantName; // active variant if unset
    };

    struct TrackInfo
    {
        std::string variantName;
        model::Track track;
        std::optional<model::ClusterId> clusterId; // unset for noise
    };

    struct LoadFailure
    {
        std::string variantName;
        std::filesystem::path directory;
        std::string cause;
    };

    struct Settings
    {
        std::filesystem::path modelsDir;
        std::filesystem::path metadataFile; // modelsDir/tracks.json if empty
        std::vector<std::string> preferredVariants{ "llav_pca", "pca_features", "combined_features", "naive_features", "llav_features" };
        std::size_t variantLoadThreadCount{ 2 };
        std::size_t compareThreadCount{ 1 };
        std::size_t defaultRecommendationCount{ 12 };
        std::size_t maxRecommendationCount{ 50 };
        std::size_t minClusterCandidates{}; // cluster strategy falls back below max(count, minClusterCandidates)
        std::size_t clusterSampleCount{ 10 };
    };
} // namespace tracklike::recommendation
