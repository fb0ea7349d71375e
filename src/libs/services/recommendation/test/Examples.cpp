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

#include "ComparisonRunner.hpp"

namespace tracklike::recommendation::tests
{
    namespace
    {
        std::string makeId(std::string_view prefix, std::size_t i)
        {
            std::string res{ prefix };
            if (i < 10)
                res += '0';
            res += std::to_string(i);
            return res;
        }

        // cluster 7: trackA + 39 members on the x axis
        // cluster 3: 10 members on the y axis, closer to trackA than most of cluster 7
        // noise: trackX and 4 neighbors far away
        model::ModelVariantPtr createLibraryVariant(const std::string& name)
        {
            VariantBuilder builder{ name, 2 };

            builder.addTrack({ "trackA", { 0, 0 }, 7, "Artist One" });
            for (std::size_t i{ 1 }; i < 40; ++i)
                builder.addTrack({ makeId("c7_", i), { static_cast<double>(i), 0 }, 7, i == 1 ? "Artist One" : "Various" });

            for (std::size_t i{}; i < 10; ++i)
                builder.addTrack({ makeId("c3_", i), { 0, 1 + 0.1 * static_cast<double>(i) }, 3, i == 0 ? "Artist Two" : (i == 5 || i == 6 ? "artist two" : "Various") });

            builder.addTrack({ "trackX", { 100, 100 }, model::noiseClusterId });
            for (std::size_t i{ 1 }; i < 5; ++i)
                builder.addTrack({ makeId("noise_", i), { 100 + static_cast<double>(i), 100 }, model::noiseClusterId });

            return builder.build();
        }

        class ExamplesTest : public ::testing::Test
        {
        protected:
            void SetUp() override
            {
                _registry.add(createLibraryVariant("naive_features"));
            }

            RecommendationResult recommend(const std::vector<model::TrackId>& seedIds, Strategy strategy, std::size_t count) const
            {
                RecommendationQuery query;
                query.seedIds = seedIds;
                query.strategy = strategy;
                query.count = count;

                return _orchestrator.recommend(query);
            }

            ModelRegistry _registry;
            RecommendationOrchestrator _orchestrator{ _registry, RecommendationOrchestrator::Limits{} };
        };
    } // namespace

    TEST_F(ExamplesTest, clusterStaysInCluster)
    {
        const RecommendationResult result{ recommend({ "trackA" }, Strategy::Cluster, 5) };

        ASSERT_EQ(result.tracks.size(), 5);
        EXPECT_TRUE(result.fallbackSeedIds.empty());
        for (std::size_t i{}; i < result.tracks.size(); ++i)
        {
            EXPECT_EQ(result.tracks[i].clusterId, 7);
            EXPECT_EQ(result.tracks[i].matchKind, MatchKind::Cluster);
            if (i > 0)
                EXPECT_LE(result.tracks[i].similarity, result.tracks[i - 1].similarity);
        }

        // the global strategy picks the closer tracks of cluster 3
        const RecommendationResult globalResult{ recommend({ "trackA" }, Strategy::Global, 5) };
        ASSERT_EQ(globalResult.tracks.size(), 5);
        EXPECT_EQ(globalResult.tracks[2].track.id, "c3_01");
        EXPECT_EQ(globalResult.tracks[2].clusterId, 3);
    }

    TEST_F(ExamplesTest, noiseSeedFallsBackToGlobal)
    {
        const RecommendationResult clusterResult{ recommend({ "trackX" }, Strategy::Cluster, 5) };
        const RecommendationResult globalResult{ recommend({ "trackX" }, Strategy::Global, 5) };

        EXPECT_EQ(clusterResult.fallbackSeedIds, (std::vector<model::TrackId>{ "trackX" }));
        ASSERT_EQ(clusterResult.tracks.size(), 5);
        ASSERT_EQ(globalResult.tracks.size(), 5);
        for (std::size_t i{}; i < 5; ++i)
        {
            EXPECT_EQ(clusterResult.tracks[i].track.id, globalResult.tracks[i].track.id);
            EXPECT_DOUBLE_EQ(clusterResult.tracks[i].similarity, globalResult.tracks[i].similarity);
        }
    }

    TEST_F(ExamplesTest, artistPadding)
    {
        const RecommendationResult result{ recommend({ "trackA", "c3_00" }, Strategy::Artist, 10) };

        ASSERT_EQ(result.tracks.size(), 10);
        EXPECT_EQ(result.tracks[0].track.id, "c3_05");
        EXPECT_EQ(result.tracks[1].track.id, "c3_06");
        EXPECT_EQ(result.tracks[2].track.id, "c7_01");
        for (std::size_t i{}; i < 3; ++i)
            EXPECT_EQ(result.tracks[i].matchKind, MatchKind::Artist);
        for (std::size_t i{ 3 }; i < 10; ++i)
        {
            EXPECT_EQ(result.tracks[i].matchKind, MatchKind::Padding);
            EXPECT_NE(result.tracks[i].track.artist, "Artist One");
        }
    }

    TEST_F(ExamplesTest, compareWithMissingVariant)
    {
        const ComparisonRunner runner{ _registry, _orchestrator, 2 };

        const std::vector<ComparisonEntry> entries{ runner.compare({ "trackA" }, { { "naive_features", Strategy::Global }, { "missing_variant", Strategy::Global } }, 5) };
        ASSERT_EQ(entries.size(), 2);

        ASSERT_TRUE(entries[0].result);
        EXPECT_EQ(entries[0].result->tracks.size(), 5);

        EXPECT_FALSE(entries[1].result);
        ASSERT_TRUE(entries[1].error);
        EXPECT_EQ(entries[1].error->kind, ComparisonErrorKind::VariantNotFound);
        EXPECT_NE(entries[1].error->message.find("missing_variant"), std::string::npos);
    }
} // namespace tracklike::recommendation::tests
