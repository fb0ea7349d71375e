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

#include <algorithm>
#include <limits>
#include <set>

#include "model/Exception.hpp"
#include "model/FeatureStore.hpp"

namespace tracklike::model::tests
{
    namespace
    {
        FeatureStore::Entry createEntry(std::string_view id, std::string_view artist, std::vector<std::string> genres, std::vector<double> features)
        {
            Track track;
            track.id = id;
            track.name = "Name of " + std::string{ id };
            track.artist = artist;
            track.genres = std::move(genres);

            return FeatureStore::Entry{ std::move(track), FeatureVector{ std::move(features) } };
        }

        FeatureStore createStore()
        {
            std::vector<FeatureStore::Entry> entries;
            entries.push_back(createEntry("t3", "Radiohead", { "Rock", "alternative" }, { 0.0, 1.0 }));
            entries.push_back(createEntry("t1", "radiohead", { "rock" }, { 1.0, 1.0 }));
            entries.push_back(createEntry("t2", "Portishead", { "Trip-Hop" }, { 2.0, 0.0 }));
            entries.push_back(createEntry("t4", "Massive Attack", { "trip-hop", "TRIP-HOP" }, { 3.0, 0.5 }));

            return FeatureStore{ 2, std::move(entries) };
        }
    } // namespace

    TEST(FeatureStore, lookups)
    {
        const FeatureStore store{ createStore() };

        EXPECT_EQ(store.size(), 4);
        EXPECT_EQ(store.getDimensionCount(), 2);
        EXPECT_EQ(store.getAllIds(), (std::vector<TrackId>{ "t1", "t2", "t3", "t4" }));

        EXPECT_TRUE(store.contains("t2"));
        EXPECT_FALSE(store.contains("t5"));
        EXPECT_EQ(store.get("t2"), (FeatureVector{ std::vector<double>{ 2.0, 0.0 } }));
        EXPECT_EQ(store.getEntry("t4").track.artist, "Massive Attack");

        ASSERT_NE(store.find("t1"), nullptr);
        EXPECT_EQ(store.find("t1")->track.name, "Name of t1");
        EXPECT_EQ(store.find("t5"), nullptr);
    }

    TEST(FeatureStore, unknownTrack)
    {
        const FeatureStore store{ createStore() };

        EXPECT_THROW(store.get("unknown"), UnknownTrackException);
        try
        {
            (void)store.getEntry("unknown");
            FAIL();
        }
        catch (const UnknownTrackException& e)
        {
            EXPECT_EQ(e.getTrackId(), "unknown");
        }
    }

    TEST(FeatureStore, secondaryIndexes)
    {
        const FeatureStore store{ createStore() };

        EXPECT_EQ(store.getTracksByArtist("RADIOHEAD"), (std::vector<TrackId>{ "t1", "t3" }));
        EXPECT_EQ(store.getTracksByArtist("portishead"), (std::vector<TrackId>{ "t2" }));
        EXPECT_TRUE(store.getTracksByArtist("Björk").empty());

        EXPECT_EQ(store.getTracksByGenre("rock"), (std::vector<TrackId>{ "t1", "t3" }));
        EXPECT_EQ(store.getTracksByGenre("Trip-hop"), (std::vector<TrackId>{ "t2", "t4" }));
        EXPECT_EQ(store.getTracksByGenre("alternative"), (std::vector<TrackId>{ "t3" }));
        EXPECT_TRUE(store.getTracksByGenre("jazz").empty());
    }

    TEST(FeatureStore, invalidEntries)
    {
        {
            std::vector<FeatureStore::Entry> entries;
            entries.push_back(createEntry("t1", "a", {}, { 0.0, 1.0 }));
            entries.push_back(createEntry("t1", "a", {}, { 0.0, 1.0 }));
            EXPECT_THROW((FeatureStore{ 2, std::move(entries) }), Exception);
        }

        {
            std::vector<FeatureStore::Entry> entries;
            entries.push_back(createEntry("t1", "a", {}, { 0.0, 1.0, 2.0 }));
            EXPECT_THROW((FeatureStore{ 2, std::move(entries) }), Exception);
        }

        {
            std::vector<FeatureStore::Entry> entries;
            entries.push_back(createEntry("t1", "a", {}, { 0.0, std::numeric_limits<double>::quiet_NaN() }));
            EXPECT_THROW((FeatureStore{ 2, std::move(entries) }), Exception);
        }
    }

    TEST(FeatureStore, sample)
    {
        const FeatureStore store{ createStore() };
        core::random::RandGenerator generator{ core::random::createSeededGenerator(42) };

        for (std::size_t count{}; count <= 6; ++count)
        {
            const std::vector<TrackId> sample{ store.sample(count, generator) };
            EXPECT_EQ(sample.size(), std::min<std::size_t>(count, 4));

            const std::set<TrackId> distinctIds(std::cbegin(sample), std::cend(sample));
            EXPECT_EQ(distinctIds.size(), sample.size());
            for (const TrackId& trackId : sample)
                EXPECT_TRUE(store.contains(trackId));
        }
    }

    TEST(FeatureStore, sampleRestricted)
    {
        const FeatureStore store{ createStore() };
        core::random::RandGenerator generator{ core::random::createSeededGenerator(42) };

        const TrackIdSet population{ "t2", "t4", "unknown" };
        const std::vector<TrackId> sample{ store.sample(10, population, generator) };
        EXPECT_EQ(std::set<TrackId>(std::cbegin(sample), std::cend(sample)), (std::set<TrackId>{ "t2", "t4" }));

        EXPECT_TRUE(store.sample(3, TrackIdSet{}, generator).empty());
    }

    TEST(FeatureStore, sampleIsSeedDeterministic)
    {
        const FeatureStore store{ createStore() };

        core::random::RandGenerator generator1{ core::random::createSeededGenerator(7) };
        core::random::RandGenerator generator2{ core::random::createSeededGenerator(7) };
        EXPECT_EQ(store.sample(2, generator1), store.sample(2, generator2));
    }
} // namespace tracklike::model::tests
