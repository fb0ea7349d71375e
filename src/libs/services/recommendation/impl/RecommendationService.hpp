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

#include "services/recommendation/IRecommendationService.hpp"

#include "ComparisonRunner.hpp"
#include "ModelRegistry.hpp"
#include "RecommendationOrchestrator.hpp"

namespace tracklike::recommendation
{
    class RecommendationService : public IRecommendationService
    {
    public:
        RecommendationService(const Settings& settings);
        ~RecommendationService() override = default;
        RecommendationService(const RecommendationService&) = delete;
        RecommendationService& operator=(const RecommendationService&) = delete;

        // Used to inject already loaded variants
        ModelRegistry& getRegistry() { return _registry; }

    private:
        RecommendationResult recommend(const RecommendationQuery& query) const override;
        std::vector<ComparisonEntry> compare(const std::vector<model::TrackId>& seedIds, const std::vector<ComparisonLabel>& labels, std::optional<std::size_t> count) const override;

        std::vector<VariantSummary> listVariants() const override;
        std::string getActiveVariantName() const override;
        void switchVariant(std::string_view variantName) override;

        ClusterInfo getClusterInfo(model::ClusterId clusterId, std::optional<std::size_t> sampleCount, const std::optional<std::string>& variantName) const override;
        model::ClusterSummary getClusterSummary(const std::optional<std::string>& variantName) const override;
        std::vector<model::Track> sampleTracks(std::size_t count, std::optional<model::ClusterId> clusterId, const std::optional<std::string>& variantName) const override;
        std::vector<model::ClusterStats> listClusters(const ClusterListQuery& query) const override;

        TrackInfo getTrack(const model::TrackId& trackId, const std::optional<std::string>& variantName) const override;
        std::vector<model::Track> getPopularTracks(std::size_t count, unsigned minPopularity, const std::optional<std::string>& variantName) const override;

        std::vector<LoadFailure> getLoadFailures() const override;
        bool isHealthy() const override;

        const Settings _settings;
        ModelRegistry _registry;
        RecommendationOrchestrator _orchestrator;
        ComparisonRunner _comparisonRunner;
    };
} // namespace tracklike::recommendation
