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
#include <span>
#include <unordered_map>
#include <vector>

#include "model/FeatureVector.hpp"
#include "model/Types.hpp"

namespace tracklike::model
{
    class FeatureStore;

    struct Neighbor
    {
        TrackId trackId;
        Distance distance{};

        bool operator==(const Neighbor& other) const = default;
    };

    // Score in (0, 1], 1 for identical vectors
    inline double similarityFromDistance(Distance distance)
    {
        return 1.0 / (1.0 + distance);
    }

    // Exact nearest neighbor search over the embeddings of a FeatureStore
    class SimilarityIndex
    {
    public:
        SimilarityIndex(const FeatureStore& store, Metric metric);
        ~SimilarityIndex() = default;
        SimilarityIndex(const SimilarityIndex&) = delete;
        SimilarityIndex& operator=(const SimilarityIndex&) = delete;

        std::size_t size() const { return _trackIds.size(); }
        Metric getMetric() const { return _metric; }

        // At most count neighbors, ordered by ascending distance then ascending id, never an excluded id.
        // If candidates is set, the search is restricted to these ids (unknown ones are ignored).
        std::vector<Neighbor> findNearest(const FeatureVector& query, std::size_t count, const TrackIdSet& exclude, const TrackIdSet* candidates = nullptr) const;

    private:
        std::span<const double> getRow(std::size_t row) const;
        bool shouldScanCandidates(std::size_t candidateCount) const;

        const Metric _metric;
        const std::size_t _dimensionCount;
        std::vector<TrackId> _trackIds; // ascending order
        std::unordered_map<TrackId, std::size_t> _rowByTrackId;
        std::vector<double> _values; // row major, one row per track
    };
} // namespace tracklike::model
