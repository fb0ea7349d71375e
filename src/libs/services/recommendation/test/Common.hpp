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

#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "model/ModelVariant.hpp"

#include "ModelRegistry.hpp"
#include "RecommendationOrchestrator.hpp"

namespace tracklike::recommendation::tests
{
    struct TrackDesc
    {
        model::TrackId id;
        std::vector<double> features;
        model::ClusterId clusterId{ model::noiseClusterId };
        std::string artist{ model::Track::unknownArtist };
        std::vector<std::string> genres;
        unsigned popularity{};
    };

    class VariantBuilder
    {
    public:
        VariantBuilder(std::string name, std::size_t dimensionCount)
        {
            _config.name = std::move(name);
            _config.approach = "test";
            _config.featureType = "raw";
            _config.dimensionCount = dimensionCount;
        }

        VariantBuilder& addTrack(TrackDesc track)
        {
            _tracks.push_back(std::move(track));
            return *this;
        }

        VariantBuilder& setDominantGenres(model::ClusterId clusterId, std::vector<std::string> genres)
        {
            model::ClusterStats stats;
            stats.id = clusterId;
            stats.dominantGenres = std::move(genres);
            _stats.push_back(std::move(stats));
            return *this;
        }

        model::ModelVariantPtr build() const
        {
            std::vector<model::FeatureStore::Entry> entries;
            std::unordered_map<model::TrackId, model::ClusterId> assignments;

            for (const TrackDesc& desc : _tracks)
            {
                model::Track track;
                track.id = desc.id;
                track.name = "Track " + desc.id;
                track.artist = desc.artist;
                track.genres = desc.genres;
                track.popularity = desc.popularity;

                entries.push_back(model::FeatureStore::Entry{ std::move(track), model::FeatureVector{ desc.features } });
                assignments.emplace(desc.id, desc.clusterId);
            }

            return std::make_shared<const model::ModelVariant>(_config, model::FeatureStore{ _config.dimensionCount, std::move(entries) }, model::ClusterIndex{ std::move(assignments), _stats });
        }

    private:
        model::VariantConfig _config;
        std::vector<TrackDesc> _tracks;
        std::vector<model::ClusterStats> _stats;
    };

    // One dimension, distances are easy to compute by hand:
    //   a1(0) a2(1) a3(2) n1(3) ... b1(10) b2(11)
    inline model::ModelVariantPtr createAlphaVariant(const std::string& name = "alpha")
    {
        return VariantBuilder{ name, 1 }
            .addTrack({ "a1", { 0 }, 0, "Artist A", { "rock" }, 10 })
            .addTrack({ "a2", { 1 }, 0, "Artist A", { "rock" }, 50 })
            .addTrack({ "a3", { 2 }, 0, "Artist B", { "jazz" }, 50 })
            .addTrack({ "n1", { 3 }, model::noiseClusterId, std::string{ model::Track::unknownArtist }, {}, 0 })
            .addTrack({ "b1", { 10 }, 1, "Artist C", { "jazz" }, 80 })
            .addTrack({ "b2", { 11 }, 1, "Artist C", { "jazz" }, 20 })
            .setDominantGenres(0, { "rock" })
            .setDominantGenres(1, { "jazz" })
            .build();
    }

    // Same tracks, different feature space: b tracks are now the closest to a1
    inline model::ModelVariantPtr createBetaVariant(const std::string& name = "beta")
    {
        return VariantBuilder{ name, 1 }
            .addTrack({ "a1", { 0 }, 0 })
            .addTrack({ "a2", { 5 }, 1 })
            .addTrack({ "a3", { 6 }, 1 })
            .addTrack({ "n1", { 7 }, model::noiseClusterId })
            .addTrack({ "b1", { 1 }, 0 })
            .addTrack({ "b2", { 2 }, 0 })
            .build();
    }

    class RecommendationTest : public ::testing::Test
    {
    protected:
        void SetUp() override
        {
            _registry.add(createAlphaVariant());
            _registry.add(createBetaVariant());
        }

        static RecommendationOrchestrator::Limits createLimits(std::size_t minClusterCandidates = 0)
        {
            RecommendationOrchestrator::Limits limits;
            limits.defaultCount = 3;
            limits.maxCount = 5;
            limits.minClusterCandidates = minClusterCandidates;
            return limits;
        }

        RecommendationResult recommend(const std::vector<model::TrackId>& seedIds, Strategy strategy, std::optional<std::size_t> count = std::nullopt, const std::optional<std::string>& variantName = std::nullopt) const
        {
            RecommendationQuery query;
            query.seedIds = seedIds;
            query.strategy = strategy;
            query.count = count;
            query.variantName = variantName;

            return _orchestrator.recommend(query);
        }

        static std::vector<model::TrackId> getTrackIds(const RecommendationResult& result)
        {
            std::vector<model::TrackId> res;
            for (const RecommendedTrack& track : result.tracks)
                res.push_back(track.track.id);
            return res;
        }

        ModelRegistry _registry{ std::vector<std::string>{ "alpha" } };
        RecommendationOrchestrator _orchestrator{ _registry, createLimits() };
    };
} // namespace tracklike::recommendation::tests
