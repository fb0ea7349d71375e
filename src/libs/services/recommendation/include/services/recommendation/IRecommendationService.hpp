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

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "services/recommendation/Types.hpp"

namespace tracklike::core
{
    class IConfig;
}

namespace tracklike::recommendation
{
    class IRecommendationService
    {
    public:
        virtual ~IRecommendationService() = default;

        // Throws model::UnknownTrackException, VariantNotFoundException, RegistryEmptyException, InvalidQueryException
        virtual RecommendationResult recommend(const RecommendationQuery& query) const = 0;

        // Same query through each label, in label order, errors are reported per label
        virtual std::vector<ComparisonEntry> compare(const std::vector<model::TrackId>& seedIds, const std::vector<ComparisonLabel>& labels, std::optional<std::size_t> count) const = 0;

        virtual std::vector<VariantSummary> listVariants() const = 0;
        virtual std::string getActiveVariantName() const = 0;
        virtual void switchVariant(std::string_view variantName) = 0;

        virtual ClusterInfo getClusterInfo(model::ClusterId clusterId, std::optional<std::size_t> sampleCount, const std::optional<std::string>& variantName) const = 0;
        virtual model::ClusterSummary getClusterSummary(const std::optional<std::string>& variantName) const = 0;
        virtual std::vector<model::Track> sampleTracks(std::size_t count, std::optional<model::ClusterId> clusterId, const std::optional<std::string>& variantName) const = 0;
        virtual std::vector<model::ClusterStats> listClusters(const ClusterListQuery& query) const = 0;

        // Throws model::UnknownTrackException
        virtual TrackInfo getTrack(const model::TrackId& trackId, const std::optional<std::string>& variantName) const = 0;
        // Most popular first, then ascending id
        virtual std::vector<model::Track> getPopularTracks(std::size_t count, unsigned minPopularity, const std::optional<std::string>& variantName) const = 0;

        virtual std::vector<LoadFailure> getLoadFailures() const = 0;
        // at least one variant loaded
        virtual bool isHealthy() const = 0;
    };

    Settings readSettings(core::IConfig& config);

    // Loads every variant found in settings.modelsDir
    std::unique_ptr<IRecommendationService> createRecommendationService(const Settings& settings);
} // namespace tracklike::recommendation
