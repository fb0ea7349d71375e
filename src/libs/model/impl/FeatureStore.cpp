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

#include "model/FeatureStore.hpp"

#include <algorithm>
#include <iterator>

#include "core/String.hpp"

namespace tracklike::model
{
    namespace
    {
        const std::vector<TrackId>& findInIndex(const std::unordered_map<std::string, std::vector<TrackId>>& index, std::string_view key)
        {
            static const std::vector<TrackId> empty;

            auto it{ index.find(core::stringUtils::stringToLower(key)) };
            if (it == std::cend(index))
                return empty;

            return it->second;
        }

        std::vector<TrackId> sampleFrom(std::vector<TrackId> population, std::size_t count, core::random::RandGenerator& generator)
        {
            std::vector<TrackId> res;
            res.reserve(std::min(count, population.size()));

            std::sample(std::cbegin(population), std::cend(population), std::back_inserter(res), count, generator);
            std::shuffle(std::begin(res), std::end(res), generator);

            return res;
        }
    } // namespace

    FeatureStore::FeatureStore(std::size_t dimensionCount, std::vector<Entry> entries)
        : _dimensionCount{ dimensionCount }
        , _entries{ std::move(entries) }
    {
        if (_dimensionCount == 0)
            throw Exception{ "Dimension count must be positive" };

        _entryIndexByTrackId.reserve(_entries.size());
        _sortedIds.reserve(_entries.size());

        for (std::size_t i{}; i < _entries.size(); ++i)
        {
            const Entry& entry{ _entries[i] };

            if (entry.features.getDimensionCount() != _dimensionCount)
                throw Exception{ "Track '" + entry.track.id + "' has " + std::to_string(entry.features.getDimensionCount()) + " features, expected " + std::to_string(_dimensionCount) };
            if (!entry.features.isFinite())
                throw Exception{ "Track '" + entry.track.id + "' has non finite features" };
            if (!_entryIndexByTrackId.emplace(entry.track.id, i).second)
                throw Exception{ "Duplicate track '" + entry.track.id + "'" };

            _sortedIds.push_back(entry.track.id);

            _tracksByArtist[core::stringUtils::stringToLower(entry.track.artist)].push_back(entry.track.id);

            std::vector<std::string> genres;
            for (const std::string& genre : entry.track.genres)
            {
                std::string lowerGenre{ core::stringUtils::stringToLower(genre) };
                if (std::find(std::cbegin(genres), std::cend(genres), lowerGenre) == std::cend(genres))
                    genres.push_back(std::move(lowerGenre));
            }
            for (const std::string& genre : genres)
                _tracksByGenre[genre].push_back(entry.track.id);
        }

        std::sort(std::begin(_sortedIds), std::end(_sortedIds));
        for (auto& [artist, trackIds] : _tracksByArtist)
            std::sort(std::begin(trackIds), std::end(trackIds));
        for (auto& [genre, trackIds] : _tracksByGenre)
            std::sort(std::begin(trackIds), std::end(trackIds));
    }

    const FeatureVector& FeatureStore::get(const TrackId& trackId) const
    {
        return getEntry(trackId).features;
    }

    const FeatureStore::Entry& FeatureStore::getEntry(const TrackId& trackId) const
    {
        const Entry* entry{ find(trackId) };
        if (!entry)
            throw UnknownTrackException{ trackId };

        return *entry;
    }

    const FeatureStore::Entry* FeatureStore::find(const TrackId& trackId) const
    {
        auto it{ _entryIndexByTrackId.find(trackId) };
        if (it == std::cend(_entryIndexByTrackId))
            return nullptr;

        return &_entries[it->second];
    }

    const std::vector<TrackId>& FeatureStore::getTracksByArtist(std::string_view artist) const
    {
        return findInIndex(_tracksByArtist, artist);
    }

    const std::vector<TrackId>& FeatureStore::getTracksByGenre(std::string_view genre) const
    {
        return findInIndex(_tracksByGenre, genre);
    }

    std::vector<TrackId> FeatureStore::sample(std::size_t count, core::random::RandGenerator& generator) const
    {
        return sampleFrom(_sortedIds, count, generator);
    }

    std::vector<TrackId> FeatureStore::sample(std::size_t count, const TrackIdSet& population, core::random::RandGenerator& generator) const
    {
        std::vector<TrackId> knownIds;
        knownIds.reserve(population.size());
        std::copy_if(std::cbegin(population), std::cend(population), std::back_inserter(knownIds), [this](const TrackId& trackId) { return contains(trackId); });

        // unordered_set iteration order is not stable
        std::sort(std::begin(knownIds), std::end(knownIds));

        return sampleFrom(std::move(knownIds), count, generator);
    }
} // namespace tracklike::model
