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

#include <cstddef>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "core/Random.hpp"
#include "model/FeatureVector.hpp"
#include "model/Track.hpp"
#include "model/Types.hpp"

namespace tracklike::model
{
    // Embeddings and metadata of the tracks known to a variant. Read-only after construction.
    class FeatureStore
    {
    public:
        struct Entry
        {
            Track track;
            FeatureVector features;
        };

        // Throws Exception on duplicate ids, non finite values or dimension mismatch
        FeatureStore(std::size_t dimensionCount, std::vector<Entry> entries);
        ~FeatureStore() = default;
        FeatureStore(const FeatureStore&) = delete;
        FeatureStore& operator=(const FeatureStore&) = delete;
        FeatureStore(FeatureStore&&) = default;
        FeatureStore& operator=(FeatureStore&&) = default;

        std::size_t getDimensionCount() const { return _dimensionCount; }
        std::size_t size() const { return _entries.size(); }
        bool contains(const TrackId& trackId) const { return _entryIndexByTrackId.contains(trackId); }

        // Throws UnknownTrackException
        const FeatureVector& get(const TrackId& trackId) const;
        const Entry& getEntry(const TrackId& trackId) const;
        const Entry* find(const TrackId& trackId) const;

        // ascending order
        const std::vector<TrackId>& getAllIds() const { return _sortedIds; }

        // Case insensitive lookups, ids in ascending order
        const std::vector<TrackId>& getTracksByArtist(std::string_view artist) const;
        const std::vector<TrackId>& getTracksByGenre(std::string_view genre) const;

        // Uniform sampling without replacement, at most the available count
        std::vector<TrackId> sample(std::size_t count, core::random::RandGenerator& generator) const;
        std::vector<TrackId> sample(std::size_t count, const TrackIdSet& population, core::random::RandGenerator& generator) const;

    private:
        std::size_t _dimensionCount;
        std::vector<Entry> _entries;
        std::unordered_map<TrackId, std::size_t> _entryIndexByTrackId;
        std::vector<TrackId> _sortedIds;
        std::unordered_map<std::string, std::vector<TrackId>> _tracksByArtist;
        std::unordered_map<std::string, std::vector<TrackId>> _tracksByGenre;
    };
} // namespace tracklike::model
