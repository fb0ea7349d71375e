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

#include "Common.hpp"

#include "model/Exception.hpp"
#include "services/recommendation/Exception.hpp"

namespace tracklike::recommendation::tests
{
    using OrchestratorTest = RecommendationTest;

    TEST_F(OrchestratorTest, global)
    {
        const RecommendationResult result{ recommend({ "a1" }, Strategy::Global) };

        EXPECT_EQ(result.variantName, "alpha");
        EXPECT_EQ(result.strategy, Strategy::Global);
        EXPECT_EQ(result.status, ResultStatus::Ok);
        EXPECT_TRUE(result.fallbackSeedIds.empty());
        ASSERT_EQ(getTrackIds(result), (std::vector<model::TrackId>{ "a2", "a3", "n1" }));

        EXPECT_DOUBLE_EQ(result.tracks[0].distance, 1);
        EXPECT_DOUBLE_EQ(result.tracks[0].similarity, 0.5);
        EXPECT_EQ(result.tracks[0].clusterId, 0);
        EXPECT_EQ(result.tracks[0].track.name, "Track a2");
        EXPECT_DOUBLE_EQ(result.tracks[2].similarity, 0.25);
        EXPECT_EQ(result.tracks[2].clusterId, std::nullopt);

        for (const RecommendedTrack& track : result.tracks)
        {
            EXPECT_EQ(track.sourceSeedId, "a1");
            EXPECT_EQ(track.matchKind, MatchKind::Global);
        }
    }

    TEST_F(OrchestratorTest, globalMultipleSeeds)
    {
        const RecommendationResult result{ recommend({ "a1", "b1" }, Strategy::Global, 4) };
        ASSERT_EQ(getTrackIds(result), (std::vector<model::TrackId>{ "a2", "b2", "a3", "n1" }));

        EXPECT_EQ(result.tracks[0].sourceSeedId, "a1");
        EXPECT_EQ(result.tracks[1].sourceSeedId, "b1");
        EXPECT_EQ(result.tracks[2].sourceSeedId, "a1");
        // n1 is closer to a1 (3) than to b1 (7)
        EXPECT_EQ(result.tracks[3].sourceSeedId, "a1");
        EXPECT_DOUBLE_EQ(result.tracks[3].distance, 3);
    }

    TEST_F(OrchestratorTest, equidistantSeeds)
    {
        // a2 is at distance 1 from both seeds: the first seed is kept
        {
            const RecommendationResult result{ recommend({ "a3", "a1" }, Strategy::Global, 1) };
            ASSERT_EQ(getTrackIds(result), (std::vector<model::TrackId>{ "a2" }));
            EXPECT_EQ(result.tracks[0].sourceSeedId, "a3");
        }
        {
            const RecommendationResult result{ recommend({ "a1", "a3" }, Strategy::Global, 1) };
            ASSERT_EQ(getTrackIds(result), (std::vector<model::TrackId>{ "a2" }));
            EXPECT_EQ(result.tracks[0].sourceSeedId, "a1");
        }
    }

    TEST_F(OrchestratorTest, equalDistancesOrderedById)
    {
        _registry.add(VariantBuilder{ "ties", 1 }
                          .addTrack({ "s", { 0 } })
                          .addTrack({ "z", { -1 } })
                          .addTrack({ "y", { 1 } })
                          .addTrack({ "x", { 2 } })
                          .build());

        const RecommendationResult result{ recommend({ "s" }, Strategy::Global, 3, "ties") };
        EXPECT_EQ(getTrackIds(result), (std::vector<model::TrackId>{ "y", "z", "x" }));
    }

    TEST_F(OrchestratorTest, duplicateSeeds)
    {
        const RecommendationResult result{ recommend({ "a1", "a1" }, Strategy::Global) };
        EXPECT_EQ(getTrackIds(result), getTrackIds(recommend({ "a1" }, Strategy::Global)));
    }

    TEST_F(OrchestratorTest, seedsNeverRecommended)
    {
        for (const Strategy strategy : { Strategy::Global, Strategy::Cluster, Strategy::Hybrid, Strategy::Artist, Strategy::Genre })
        {
            const RecommendationResult result{ recommend({ "a1", "a2", "b1" }, strategy, 5) };
            EXPECT_EQ(result.tracks.size(), 3) << toString(strategy);
            for (const RecommendedTrack& track : result.tracks)
            {
                EXPECT_NE(track.track.id, "a1") << toString(strategy);
                EXPECT_NE(track.track.id, "a2") << toString(strategy);
                EXPECT_NE(track.track.id, "b1") << toString(strategy);
            }
        }
    }

    TEST_F(OrchestratorTest, cluster)
    {
        const RecommendationResult result{ recommend({ "a1" }, Strategy::Cluster, 2) };

        EXPECT_TRUE(result.fallbackSeedIds.empty());
        ASSERT_EQ(getTrackIds(result), (std::vector<model::TrackId>{ "a2", "a3" }));
        for (const RecommendedTrack& track : result.tracks)
        {
            EXPECT_EQ(track.matchKind, MatchKind::Cluster);
            EXPECT_EQ(track.clusterId, 0);
        }
    }

    TEST_F(OrchestratorTest, clusterTooSmall)
    {
        // only 2 candidates in the cluster of a1
        const RecommendationResult result{ recommend({ "a1" }, Strategy::Cluster, 3) };

        EXPECT_EQ(result.fallbackSeedIds, (std::vector<model::TrackId>{ "a1" }));
        ASSERT_EQ(getTrackIds(result), (std::vector<model::TrackId>{ "a2", "a3", "n1" }));
        for (const RecommendedTrack& track : result.tracks)
            EXPECT_EQ(track.matchKind, MatchKind::ClusterFallback);
    }

    TEST_F(OrchestratorTest, clusterMinCandidates)
    {
        const RecommendationOrchestrator orchestrator{ _registry, createLimits(5) };

        RecommendationQuery query;
        query.seedIds = { "a1" };
        query.strategy = Strategy::Cluster;
        query.count = 2;

        const RecommendationResult result{ orchestrator.recommend(query) };
        EXPECT_EQ(result.fallbackSeedIds, (std::vector<model::TrackId>{ "a1" }));
        EXPECT_EQ(getTrackIds(result), (std::vector<model::TrackId>{ "a2", "a3" }));
        EXPECT_EQ(result.tracks.front().matchKind, MatchKind::ClusterFallback);
    }

    TEST_F(OrchestratorTest, clusterNoiseSeed)
    {
        const RecommendationResult result{ recommend({ "n1" }, Strategy::Cluster, 2) };

        EXPECT_EQ(result.fallbackSeedIds, (std::vector<model::TrackId>{ "n1" }));
        EXPECT_EQ(getTrackIds(result), (std::vector<model::TrackId>{ "a3", "a2" }));
    }

    TEST_F(OrchestratorTest, clusterMixedSeeds)
    {
        // b1 has a single candidate in its cluster: only b1 falls back
        const RecommendationResult result{ recommend({ "a1", "b1" }, Strategy::Cluster, 2) };

        EXPECT_EQ(result.fallbackSeedIds, (std::vector<model::TrackId>{ "b1" }));
        ASSERT_EQ(getTrackIds(result), (std::vector<model::TrackId>{ "a2", "b2" }));
        EXPECT_EQ(result.tracks[0].matchKind, MatchKind::Cluster);
        EXPECT_EQ(result.tracks[1].matchKind, MatchKind::ClusterFallback);
    }

    TEST_F(OrchestratorTest, hybrid)
    {
        const RecommendationResult result{ recommend({ "a1" }, Strategy::Hybrid, 4) };

        ASSERT_EQ(getTrackIds(result), (std::vector<model::TrackId>{ "a2", "a3", "n1", "b1" }));
        EXPECT_EQ(result.tracks[0].matchKind, MatchKind::Cluster);
        EXPECT_EQ(result.tracks[1].matchKind, MatchKind::Cluster);
        EXPECT_EQ(result.tracks[2].matchKind, MatchKind::Global);
        EXPECT_EQ(result.tracks[3].matchKind, MatchKind::Global);
        EXPECT_TRUE(result.fallbackSeedIds.empty());
    }

    TEST_F(OrchestratorTest, hybridClusterTierFirst)
    {
        // n1 (distance 1 from a3) is closer than a1 (distance 2) but is not in the cluster of a3
        const RecommendationResult result{ recommend({ "a3" }, Strategy::Hybrid, 3) };

        EXPECT_EQ(getTrackIds(result), (std::vector<model::TrackId>{ "a2", "a1", "n1" }));
        EXPECT_EQ(result.tracks[2].matchKind, MatchKind::Global);
    }

    TEST_F(OrchestratorTest, hybridNoiseSeed)
    {
        const RecommendationResult result{ recommend({ "n1" }, Strategy::Hybrid, 2) };

        ASSERT_EQ(getTrackIds(result), (std::vector<model::TrackId>{ "a3", "a2" }));
        EXPECT_EQ(result.tracks[0].matchKind, MatchKind::Global);
    }

    TEST_F(OrchestratorTest, artist)
    {
        const RecommendationResult result{ recommend({ "a1" }, Strategy::Artist, 3) };

        ASSERT_EQ(getTrackIds(result), (std::vector<model::TrackId>{ "a2", "a3", "n1" }));
        EXPECT_EQ(result.tracks[0].matchKind, MatchKind::Artist);
        EXPECT_EQ(result.tracks[1].matchKind, MatchKind::Padding);
        EXPECT_EQ(result.tracks[2].matchKind, MatchKind::Padding);
    }

    TEST_F(OrchestratorTest, artistUnknown)
    {
        const RecommendationResult result{ recommend({ "n1" }, Strategy::Artist, 2) };

        ASSERT_EQ(getTrackIds(result), (std::vector<model::TrackId>{ "a3", "a2" }));
        for (const RecommendedTrack& track : result.tracks)
            EXPECT_EQ(track.matchKind, MatchKind::Padding);
    }

    TEST_F(OrchestratorTest, genre)
    {
        const RecommendationResult result{ recommend({ "b1" }, Strategy::Genre, 3) };

        ASSERT_EQ(getTrackIds(result), (std::vector<model::TrackId>{ "b2", "a3", "n1" }));
        EXPECT_EQ(result.tracks[0].matchKind, MatchKind::Genre);
        EXPECT_EQ(result.tracks[1].matchKind, MatchKind::Genre);
        EXPECT_EQ(result.tracks[2].matchKind, MatchKind::Padding);
    }

    TEST_F(OrchestratorTest, genreNoiseSeed)
    {
        _registry.add(VariantBuilder{ "genres", 1 }
                          .addTrack({ "s", { 0 }, model::noiseClusterId, "Artist", { "Folk" } })
                          .addTrack({ "near", { 1 }, 0, "Artist", { "metal" } })
                          .addTrack({ "far", { 5 }, 0, "Artist", { "folk" } })
                          .build());

        // noise seed: its own genres are used, case insensitive
        const RecommendationResult result{ recommend({ "s" }, Strategy::Genre, 2, "genres") };
        ASSERT_EQ(getTrackIds(result), (std::vector<model::TrackId>{ "far", "near" }));
        EXPECT_EQ(result.tracks[0].matchKind, MatchKind::Genre);
        EXPECT_EQ(result.tracks[1].matchKind, MatchKind::Padding);
    }

    TEST_F(OrchestratorTest, variantSelection)
    {
        EXPECT_EQ(getTrackIds(recommend({ "a1" }, Strategy::Global, 2, "beta")), (std::vector<model::TrackId>{ "b1", "b2" }));
        EXPECT_EQ(getTrackIds(recommend({ "a1" }, Strategy::Global, 2)), (std::vector<model::TrackId>{ "a2", "a3" }));
        EXPECT_THROW(recommend({ "a1" }, Strategy::Global, 2, "gamma"), VariantNotFoundException);
    }

    TEST_F(OrchestratorTest, count)
    {
        EXPECT_EQ(recommend({ "a1" }, Strategy::Global).tracks.size(), 3);
        EXPECT_EQ(recommend({ "a1" }, Strategy::Global, 1).tracks.size(), 1);
        // clamped to max count
        EXPECT_EQ(recommend({ "a1" }, Strategy::Global, 100).tracks.size(), 5);

        const RecommendationResult empty{ recommend({ "a1" }, Strategy::Global, 0) };
        EXPECT_TRUE(empty.tracks.empty());
        EXPECT_EQ(empty.status, ResultStatus::Ok);
    }

    TEST_F(OrchestratorTest, emptyCandidateSet)
    {
        _registry.add(VariantBuilder{ "solo", 1 }.addTrack({ "s", { 0 }, 0 }).build());

        for (const Strategy strategy : { Strategy::Global, Strategy::Cluster, Strategy::Hybrid, Strategy::Artist, Strategy::Genre })
        {
            const RecommendationResult result{ recommend({ "s" }, strategy, 3, "solo") };
            EXPECT_TRUE(result.tracks.empty());
            EXPECT_EQ(result.status, ResultStatus::EmptyCandidateSet) << toString(strategy);
        }
    }

    TEST_F(OrchestratorTest, invalidQueries)
    {
        EXPECT_THROW(recommend({}, Strategy::Global), InvalidQueryException);
        EXPECT_THROW(recommend({ "unknown" }, Strategy::Global), model::UnknownTrackException);
        EXPECT_THROW(recommend({ "a1", "unknown" }, Strategy::Cluster), model::UnknownTrackException);
    }

    TEST_F(OrchestratorTest, deterministic)
    {
        for (const Strategy strategy : { Strategy::Global, Strategy::Cluster, Strategy::Hybrid, Strategy::Artist, Strategy::Genre })
        {
            const RecommendationResult first{ recommend({ "a2", "b2" }, strategy, 4) };
            for (std::size_t i{}; i < 5; ++i)
            {
                const RecommendationResult other{ recommend({ "a2", "b2" }, strategy, 4) };
                ASSERT_EQ(getTrackIds(other), getTrackIds(first)) << toString(strategy);
                for (std::size_t j{}; j < first.tracks.size(); ++j)
                {
                    EXPECT_EQ(other.tracks[j].sourceSeedId, first.tracks[j].sourceSeedId);
                    EXPECT_EQ(other.tracks[j].matchKind, first.tracks[j].matchKind);
                }
            }
        }
    }

    TEST(RecommendationTypes, strategyNames)
    {
        EXPECT_EQ(toString(Strategy::Hybrid), "hybrid");
        EXPECT_EQ(strategyFromString("cluster"), Strategy::Cluster);
        EXPECT_EQ(strategyFromString("GENRE"), Strategy::Genre);
        EXPECT_EQ(strategyFromString("random"), std::nullopt);
        EXPECT_EQ(toString(MatchKind::ClusterFallback), "cluster_fallback");
    }
} // namespace tracklike::recommendation::tests
