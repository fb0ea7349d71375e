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

#include "RecommendationService.hpp"

#include <algorithm>

#include "core/IConfig.hpp"
#include "core/ILogger.hpp"
#include "core/Random.hpp"
#include "core/String.hpp"
#include "model/Exception.hpp"
#include "model/VariantLoader.hpp"

namespace tracklike::recommendation
{
    namespace
    {
        RecommendationOrchestrator::Limits createLimits(const Settings& settings)
        {
            RecommendationOrchestrator::Limits limits;
            limits.defaultCount = std::min(settings.defaultRecommendationCount, settings.maxRecommendationCount);
            limits.maxCount = settings.maxRecommendationCount;
            limits.minClusterCandidates = settings.minClusterCandidates;

            return limits;
        }
    } // namespace

    Settings readSettings(core::IConfig& config)
    {
        Settings settings;

        settings.modelsDir = config.getPath("models-dir", "/var/lib/tracklike/models");
        settings.metadataFile = config.getPath("metadata-file", "");
        settings.variantLoadThreadCount = config.getULong("variant-load-thread-count", settings.variantLoadThreadCount);
        settings.compareThreadCount = config.getULong("compare-thread-count", settings.compareThreadCount);
        settings.defaultRecommendationCount = config.getULong("default-recommendation-count", settings.defaultRecommendationCount);
        settings.maxRecommendationCount = config.getULong("max-recommendation-count", settings.maxRecommendationCount);
        settings.minClusterCandidates = config.getULong("min-cluster-candidates", settings.minClusterCandidates);
        settings.clusterSampleCount = config.getULong("cluster-sample-count", settings.clusterSampleCount);

        std::vector<std::string> preferredVariants;
        config.visitStrings("preferred-variants", [&](std::string_view variantName) { preferredVariants.emplace_back(variantName); }, {});
        if (!preferredVariants.empty())
            settings.preferredVariants = std::move(preferredVariants);

        return settings;
    }

    std::unique_ptr<IRecommendationService> createRecommendationService(const Settings& settings)
    {
        auto service{ std::make_unique<RecommendationService>(settings) };

        const std::filesystem::path metadataFile{ settings.metadataFile.empty() ? settings.modelsDir / model::artifacts::trackMetadataFile : settings.metadataFile };
        const std::vector<std::string> loadedVariants{ service->getRegistry().loadAll(settings.modelsDir, metadataFile, settings.variantLoadThreadCount) };
        TRACKLIKE_LOG(RECOMMENDATION, INFO, "Loaded variants: " << core::stringUtils::joinStrings(loadedVariants, ", "));

        return service;
    }

    RecommendationService::RecommendationService(const Settings& settings)
        : _settings{ settings }
        , _registry{ settings.preferredVariants }
        , _orchestrator{ _registry, createLimits(settings) }
        , _comparisonRunner{ _registry, _orchestrator, settings.compareThreadCount }
    {
    }

    RecommendationResult RecommendationService::recommend(const RecommendationQuery& query) const
    {
        return _orchestrator.recommend(query);
    }

    std::vector<ComparisonEntry> RecommendationService::compare(const std::vector<model::TrackId>& seedIds, const std::vector<ComparisonLabel>& labels, std::optional<std::size_t> count) const
    {
        return _comparisonRunner.compare(seedIds, labels, count);
    }

    std::vector<VariantSummary> RecommendationService::listVariants() const
    {
        std::vector<VariantSummary> res;

        const model::ModelVariantPtr activeVariant{ _registry.empty() ? nullptr : _registry.getActive() };
        for (const model::ModelVariantPtr& variant : _registry.getAll())
        {
            VariantSummary summary;
            summary.name = variant->getName();
            summary.config = variant->getConfig();
            summary.trackCount = variant->getFeatureStore().size();
            summary.clusterCount = variant->getClusterIndex().getClusterCount();
            summary.active = variant == activeVariant;

            res.push_back(std::move(summary));
        }

        return res;
    }

    std::string RecommendationService::getActiveVariantName() const
    {
        return _registry.getActive()->getName();
    }

    void RecommendationService::switchVariant(std::string_view variantName)
    {
        _registry.switchTo(variantName);
    }

    ClusterInfo RecommendationService::getClusterInfo(model::ClusterId clusterId, std::optional<std::size_t> sampleCount, const std::optional<std::string>& variantName) const
    {
        const model::ModelVariantPtr variant{ _registry.resolve(variantName) };
        const model::ClusterIndex& clusters{ variant->getClusterIndex() };
        const model::FeatureStore& store{ variant->getFeatureStore() };

        ClusterInfo info;
        info.variantName = variant->getName();
        info.stats = clusters.getStats(clusterId);

        std::vector<const model::Track*> members;
        for (const model::TrackId& trackId : clusters.getMembers(clusterId))
            members.push_back(&store.getEntry(trackId).track);

        std::sort(std::begin(members), std::end(members), [](const model::Track* a, const model::Track* b) {
            if (a->popularity != b->popularity)
                return a->popularity > b->popularity;
            return a->id < b->id;
        });

        const std::size_t count{ std::min(sampleCount.value_or(_settings.clusterSampleCount), members.size()) };
        info.sampleTracks.reserve(count);
        for (std::size_t i{}; i < count; ++i)
            info.sampleTracks.push_back(*members[i]);

        return info;
    }

    model::ClusterSummary RecommendationService::getClusterSummary(const std::optional<std::string>& variantName) const
    {
        return _registry.resolve(variantName)->getClusterIndex().computeSummary();
    }

    std::vector<model::Track> RecommendationService::sampleTracks(std::size_t count, std::optional<model::ClusterId> clusterId, const std::optional<std::string>& variantName) const
    {
        const model::ModelVariantPtr variant{ _registry.resolve(variantName) };
        const model::FeatureStore& store{ variant->getFeatureStore() };

        std::vector<model::TrackId> trackIds;
        if (clusterId)
        {
            // validates the cluster id
            (void)variant->getClusterIndex().getStats(*clusterId);
            trackIds = store.sample(count, variant->getClusterIndex().getMembers(*clusterId), core::random::getRandGenerator());
        }
        else
        {
            trackIds = store.sample(count, core::random::getRandGenerator());
        }

        std::vector<model::Track> res;
        res.reserve(trackIds.size());
        for (const model::TrackId& trackId : trackIds)
            res.push_back(store.getEntry(trackId).track);

        return res;
    }

    std::vector<model::ClusterStats> RecommendationService::listClusters(const ClusterListQuery& query) const
    {
        const model::ClusterIndex& clusters{ _registry.resolve(query.variantName)->getClusterIndex() };

        std::vector<const model::ClusterStats*> selected;
        for (const model::ClusterId clusterId : clusters.getClusterIds())
        {
            if (clusterId == model::noiseClusterId)
                continue;

            const model::ClusterStats& stats{ clusters.getStats(clusterId) };
            if (stats.size >= query.minSize)
                selected.push_back(&stats);
        }

        std::sort(std::begin(selected), std::end(selected), [&](const model::ClusterStats* a, const model::ClusterStats* b) {
            if (query.sortBy == ClusterSortKey::Size && a->size != b->size)
                return query.descending ? a->size > b->size : a->size < b->size;
            if (query.sortBy == ClusterSortKey::Id)
                return query.descending ? a->id > b->id : a->id < b->id;
            return a->id < b->id;
        });

        std::vector<model::ClusterStats> res;
        const std::size_t first{ std::min(query.offset, selected.size()) };
        const std::size_t last{ query.limit ? std::min(first + *query.limit, selected.size()) : selected.size() };
        res.reserve(last - first);
        for (std::size_t i{ first }; i < last; ++i)
            res.push_back(*selected[i]);

        return res;
    }

    TrackInfo RecommendationService::getTrack(const model::TrackId& trackId, const std::optional<std::string>& variantName) const
    {
        const model::ModelVariantPtr variant{ _registry.resolve(variantName) };

        TrackInfo info;
        info.variantName = variant->getName();
        info.track = variant->getFeatureStore().getEntry(trackId).track;

        const model::ClusterId clusterId{ variant->getClusterIndex().getClusterOf(trackId) };
        if (clusterId != model::noiseClusterId)
            info.clusterId = clusterId;

        return info;
    }

    std::vector<model::Track> RecommendationService::getPopularTracks(std::size_t count, unsigned minPopularity, const std::optional<std::string>& variantName) const
    {
        const model::ModelVariantPtr variant{ _registry.resolve(variantName) };
        const model::FeatureStore& store{ variant->getFeatureStore() };

        std::vector<const model::Track*> tracks;
        for (const model::TrackId& trackId : store.getAllIds())
        {
            const model::Track& track{ store.getEntry(trackId).track };
            if (track.popularity >= minPopularity)
                tracks.push_back(&track);
        }

        const std::size_t resultCount{ std::min(count, tracks.size()) };
        // ids are already sorted, a stable sort keeps them as tie-break
        std::stable_sort(std::begin(tracks), std::end(tracks), [](const model::Track* a, const model::Track* b) { return a->popularity > b->popularity; });

        std::vector<model::Track> res;
        res.reserve(resultCount);
        for (std::size_t i{}; i < resultCount; ++i)
            res.push_back(*tracks[i]);

        return res;
    }

    std::vector<LoadFailure> RecommendationService::getLoadFailures() const
    {
        return _registry.getLoadFailures();
    }

    bool RecommendationService::isHealthy() const
    {
        return !_registry.empty();
    }
} // namespace tracklike::recommendation
