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

#include <gtest/gtest.h>

#include "model/ClusterIndex.hpp"
#include "model/Exception.hpp"

namespace tracklike::model::tests
{
    namespace
    {
        ClusterIndex createClusterIndex()
        {
            std::unordered_map<TrackId, ClusterId> assignments{
                { "a1", 0 },
                { "a2", 0 },
                { "a3", 0 },
                { "b1", 1 },
                { "b2", 1 },
                { "n1", noiseClusterId },
            };

            std::vector<ClusterStats> stats(3);
            stats[0].id = 0;
            stats[0].name = "Mellow";
            stats[0].cohesion = 0.8;
            stats[0].separation = 0.4;
            stats[0].size = 1234; // recomputed
            stats[0].dominantGenres = { "indie", "folk" };
            stats[1].id = 1;
            stats[1].cohesion = 0.6;
            stats[1].separation = 0.2;
            stats[1].dominantGenres = { "rock", "indie" };
            stats[2].id = 42; // no member

            return ClusterIndex{ std::move(assignments), std::move(stats) };
        }
    } // namespace

    TEST(ClusterIndex, membership)
    {
        const ClusterIndex index{ createClusterIndex() };

        EXPECT_EQ(index.getTrackCount(), 6);
        EXPECT_EQ(index.getClusterCount(), 2);
        EXPECT_EQ(index.getClusterIds(), (std::vector<ClusterId>{ noiseClusterId, 0, 1 }));

        EXPECT_EQ(index.getClusterOf("a2"), 0);
        EXPECT_EQ(index.getClusterOf("b1"), 1);
        EXPECT_EQ(index.getClusterOf("n1"), noiseClusterId);
        EXPECT_THROW(index.getClusterOf("zz"), UnknownTrackException);

        EXPECT_EQ(index.getMembers(0), (TrackIdSet{ "a1", "a2", "a3" }));
        EXPECT_EQ(index.getMembers(noiseClusterId), (TrackIdSet{ "n1" }));
        EXPECT_TRUE(index.getMembers(42).empty());
        EXPECT_TRUE(index.getMembers(7).empty());
    }

    TEST(ClusterIndex, stats)
    {
        const ClusterIndex index{ createClusterIndex() };

        const ClusterStats& stats0{ index.getStats(0) };
        EXPECT_EQ(stats0.id, 0);
        EXPECT_EQ(stats0.name, "Mellow");
        EXPECT_EQ(stats0.size, 3);
        EXPECT_DOUBLE_EQ(stats0.cohesion, 0.8);

        const ClusterStats& stats1{ index.getStats(1) };
        EXPECT_EQ(stats1.name, "Cluster 1");
        EXPECT_EQ(stats1.size, 2);

        const ClusterStats& noiseStats{ index.getStats(noiseClusterId) };
        EXPECT_EQ(noiseStats.name, "Noise");
        EXPECT_EQ(noiseStats.size, 1);

        EXPECT_THROW(index.getStats(42), UnknownClusterException);
        try
        {
            (void)index.getStats(7);
            FAIL();
        }
        catch (const UnknownClusterException& e)
        {
            EXPECT_EQ(e.getClusterId(), 7);
        }
    }

    TEST(ClusterIndex, invalidClusterId)
    {
        using Assignments = std::unordered_map<TrackId, ClusterId>;
        EXPECT_THROW((ClusterIndex{ Assignments{ { "a", -2 } } }), Exception);
    }

    TEST(ClusterIndex, summary)
    {
        const ClusterIndex index{ createClusterIndex() };

        const ClusterSummary summary{ index.computeSummary(2) };
        EXPECT_EQ(summary.clusterCount, 2);
        EXPECT_EQ(summary.clusteredTrackCount, 5);
        EXPECT_EQ(summary.noiseTrackCount, 1);
        EXPECT_DOUBLE_EQ(summary.averageClusterSize, 2.5);
        EXPECT_EQ(summary.minClusterSize, 2);
        EXPECT_EQ(summary.maxClusterSize, 3);
        EXPECT_DOUBLE_EQ(summary.averageCohesion, 0.7);
        EXPECT_DOUBLE_EQ(summary.averageSeparation, 0.3);

        using GenreCount = std::pair<std::string, std::size_t>;
        EXPECT_EQ(summary.topGenres, (std::vector<GenreCount>{ { "indie", 2 }, { "folk", 1 } }));
    }

    TEST(ClusterIndex, summaryOnlyNoise)
    {
        using Assignments = std::unordered_map<TrackId, ClusterId>;
        const ClusterIndex index{ Assignments{ { "n1", noiseClusterId }, { "n2", noiseClusterId } } };

        const ClusterSummary summary{ index.computeSummary() };
        EXPECT_EQ(summary.clusterCount, 0);
        EXPECT_EQ(summary.noiseTrackCount, 2);
        EXPECT_EQ(summary.minClusterSize, 0);
        EXPECT_DOUBLE_EQ(summary.averageClusterSize, 0);
        EXPECT_TRUE(summary.topGenres.empty());
    }
} // namespace tracklike::model::tests
