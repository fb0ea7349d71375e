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

#include "RecommendationOrchestrator.hpp"

#include <algorithm>
#include <unordered_map>

#include "core/ILogger.hpp"
#include "model/Exception.hpp"
#include "services/recommendation/Exception.hpp"

#include "ModelRegistry.hpp"

namespace tracklike::recommendation
{
    namespace
    {
        struct Seed
        {
            const model::TrackId& id;
            const model::FeatureStore::Entry& entry;
            model::ClusterId clusterId;
        };

        struct Match
        {
            model::Distance distance{};
            model::TrackId sourceSeedId;
            MatchKind kind{ MatchKind::Global };
        };

        using MatchMap = std::unordered_map<model::TrackId, Match>;
        using RankedMatches = std::vector<std::pair<model::TrackId, Match>>;

        // Keeps the closest match of each track, the first seed wins on equal distances
        void mergeNeighbors(MatchMap& matches, const std::vector<model::Neighbor>& neighbors, const model::TrackId& seedId, MatchKind kind)
        {
            for (const model::Neighbor& neighbor : neighbors)
            {
                auto [it, inserted]{ matches.try_emplace(neighbor.trackId, Match{ neighbor.distance, seedId, kind }) };
                if (!inserted && neighbor.distance < it->second.distance)
                    it->second = Match{ neighbor.distance, seedId, kind };
            }
        }

        RankedMatches rank(MatchMap&& matches, std::size_t count)
        {
            RankedMatches res(std::make_move_iterator(std::begin(matches)), std::make_move_iterator(std::end(matches)));

            std::sort(std::begin(res), std::end(res), [](const auto& a, const auto& b) {
                if (a.second.distance != b.second.distance)
                    return a.second.distance < b.second.distance;
                return a.first < b.first;
            });

            if (res.size() > count)
                res.resize(count);

            return res;
        }

        class StrategyRunner
        {
        public:
            StrategyRunner(const model::ModelVariant& variant, const std::vector<Seed>& seeds, std::size_t count)
                : _variant{ variant }
                , _seeds{ seeds }
                , _count{ count }
            {
                for (const Seed& seed : _seeds)
                    _seedIds.insert(seed.id);
            }

            RankedMatches runGlobal() const
            {
                return findGlobal(_seedIds, _count, MatchKind::Global);
            }

            RankedMatches runCluster(std::size_t minClusterCandidates, std::vector<model::TrackId>& fallbackSeedIds) const
            {
                const std::size_t threshold{ std::max(_count, minClusterCandidates) };
                const model::SimilarityIndex& index{ _variant.getSimilarityIndex() };

                MatchMap matches;
                for (const Seed& seed : _seeds)
                {
                    const model::TrackIdSet& members{ _variant.getClusterIndex().getMembers(seed.clusterId) };

                    bool fallback{ seed.clusterId == model::noiseClusterId };
                    if (!fallback)
                    {
                        const std::size_t candidateCount{ static_cast<std::size_t>(std::count_if(std::cbegin(members), std::cend(members), [this](const model::TrackId& trackId) { return !_seedIds.contains(trackId); })) };
                        fallback = candidateCount < threshold;
                    }

                    if (fallback)
                    {
                        TRACKLIKE_LOG(RECOMMENDATION, DEBUG, "Seed '" << seed.id << "': cluster " << seed.clusterId << " too small, falling back to global search");
                        fallbackSeedIds.push_back(seed.id);
                        mergeNeighbors(matches, index.findNearest(seed.entry.features, _count, _seedIds), seed.id, MatchKind::ClusterFallback);
                    }
                    else
                    {
                        mergeNeighbors(matches, index.findNearest(seed.entry.features, _count, _seedIds, &members), seed.id, MatchKind::Cluster);
                    }
                }

                return rank(std::move(matches), _count);
            }

            RankedMatches runHybrid() const
            {
                const model::SimilarityIndex& index{ _variant.getSimilarityIndex() };

                MatchMap clusterMatches;
                for (const Seed& seed : _seeds)
                {
                    if (seed.clusterId == model::noiseClusterId)
                        continue;

                    const model::TrackIdSet& members{ _variant.getClusterIndex().getMembers(seed.clusterId) };
                    mergeNeighbors(clusterMatches, index.findNearest(seed.entry.features, _count, _seedIds, &members), seed.id, MatchKind::Cluster);
                }

                RankedMatches res{ rank(std::move(clusterMatches), _count) };
                completeWithGlobal(res, MatchKind::Global);

                return res;
            }

            RankedMatches runArtist() const
            {
                model::TrackIdSet candidates;
                for (const Seed& seed : _seeds)
                {
                    if (seed.entry.track.artist == model::Track::unknownArtist)
                        continue;

                    for (const model::TrackId& trackId : _variant.getFeatureStore().getTracksByArtist(seed.entry.track.artist))
                        candidates.insert(trackId);
                }

                RankedMatches res{ findRestricted(candidates, MatchKind::Artist) };
                completeWithGlobal(res, MatchKind::Padding);

                return res;
            }

            RankedMatches runGenre() const
            {
                model::TrackIdSet candidates;
                for (const Seed& seed : _seeds)
                {
                    std::vector<std::string> genres;
                    if (seed.clusterId != model::noiseClusterId)
                        genres = _variant.getClusterIndex().getStats(seed.clusterId).dominantGenres;
                    // noise and clusters without statistics have no dominant genre
                    if (genres.empty())
                        genres = seed.entry.track.genres;

                    for (const std::string& genre : genres)
                    {
                        for (const model::TrackId& trackId : _variant.getFeatureStore().getTracksByGenre(genre))
                            candidates.insert(trackId);
                    }
                }

                RankedMatches res{ findRestricted(candidates, MatchKind::Genre) };
                completeWithGlobal(res, MatchKind::Padding);

                return res;
            }

        private:
            RankedMatches findGlobal(const model::TrackIdSet& exclude, std::size_t count, MatchKind kind) const
            {
                MatchMap matches;
                for (const Seed& seed : _seeds)
                    mergeNeighbors(matches, _variant.getSimilarityIndex().findNearest(seed.entry.features, count, exclude), seed.id, kind);

                return rank(std::move(matches), count);
            }

            RankedMatches findRestricted(const model::TrackIdSet& candidates, MatchKind kind) const
            {
                MatchMap matches;
                if (candidates.empty())
                    return {};

                for (const Seed& seed : _seeds)
                    mergeNeighbors(matches, _variant.getSimilarityIndex().findNearest(seed.entry.features, _count, _seedIds, &candidates), seed.id, kind);

                return rank(std::move(matches), _count);
            }

            // Appends a lower tier of global matches until count is reached
            void completeWithGlobal(RankedMatches& matches, MatchKind kind) const
            {
                if (matches.size() >= _count)
                    return;

                model::TrackIdSet exclude{ _seedIds };
                for (const auto& [trackId, match] : matches)
                    exclude.insert(trackId);

                RankedMatches globalMatches{ findGlobal(exclude, _count - matches.size(), kind) };
                matches.insert(std::end(matches), std::make_move_iterator(std::begin(globalMatches)), std::make_move_iterator(std::end(globalMatches)));
            }

            const model::ModelVariant& _variant;
            const std::vector<Seed>& _seeds;
            const std::size_t _count;
            model::TrackIdSet _seedIds;
        };

        std::vector<Seed> resolveSeeds(const model::ModelVariant& variant, std::span<const model::TrackId> seedIds)
        {
            std::vector<Seed> seeds;
            model::TrackIdSet visitedIds;

            for (const model::TrackId& seedId : seedIds)
            {
                if (!visitedIds.insert(seedId).second)
                    continue;

                const model::FeatureStore::Entry* entry{ variant.getFeatureStore().find(seedId) };
                if (!entry)
                    throw model::UnknownTrackException{ seedId };

                seeds.push_back(Seed{ entry->track.id, *entry, variant.getClusterIndex().getClusterOf(seedId) });
            }

            return seeds;
        }

        RecommendedTrack createRecommendedTrack(const model::ModelVariant& variant, const model::TrackId& trackId, const Match& match)
        {
            RecommendedTrack res;
            res.track = variant.getFeatureStore().getEntry(trackId).track;

            const model::ClusterId clusterId{ variant.getClusterIndex().getClusterOf(trackId) };
            if (clusterId != model::noiseClusterId)
                res.clusterId = clusterId;

            res.similarity = model::similarityFromDistance(match.distance);
            res.distance = match.distance;
            res.sourceSeedId = match.sourceSeedId;
            res.matchKind = match.kind;

            return res;
        }
    } // namespace

    RecommendationOrchestrator::RecommendationOrchestrator(const ModelRegistry& registry, const Limits& limits)
        : _registry{ registry }
        , _limits{ limits }
    {
    }

    RecommendationResult RecommendationOrchestrator::recommend(const RecommendationQuery& query) const
    {
        const model::ModelVariantPtr variant{ _registry.resolve(query.variantName) };

        return recommend(*variant, query.seedIds, query.strategy, query.count);
    }

    RecommendationResult RecommendationOrchestrator::recommend(const model::ModelVariant& variant, std::span<const model::TrackId> seedIds, Strategy strategy, std::optional<std::size_t> count) const
    {
        if (seedIds.empty())
            throw InvalidQueryException{ "No seed track" };

        const std::vector<Seed> seeds{ resolveSeeds(variant, seedIds) };
        const std::size_t resultCount{ std::min(count.value_or(_limits.defaultCount), _limits.maxCount) };

        RecommendationResult result;
        result.variantName = variant.getName();
        result.strategy = strategy;

        if (resultCount == 0)
            return result;

        const StrategyRunner runner{ variant, seeds, resultCount };

        RankedMatches matches;
        switch (strategy)
        {
        case Strategy::Global:
            matches = runner.runGlobal();
            break;
        case Strategy::Cluster:
            matches = runner.runCluster(_limits.minClusterCandidates, result.fallbackSeedIds);
            break;
        case Strategy::Hybrid:
            matches = runner.runHybrid();
            break;
        case Strategy::Artist:
            matches = runner.runArtist();
            break;
        case Strategy::Genre:
            matches = runner.runGenre();
            break;
        }

        result.tracks.reserve(matches.size());
        for (const auto& [trackId, match] : matches)
            result.tracks.push_back(createRecommendedTrack(variant, trackId, match));

        if (result.tracks.empty())
            result.status = ResultStatus::EmptyCandidateSet;

        TRACKLIKE_LOG(RECOMMENDATION, DEBUG, "Variant '" << variant.getName() << "', strategy '" << toString(strategy) << "': " << result.tracks.size() << " tracks from " << seeds.size() << " seeds");

        return result;
    }
} // namespace tracklike::recommendation
