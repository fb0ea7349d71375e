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
#include <map>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "model/Types.hpp"

namespace tracklike::model
{
    // Cohesion and separation are computed by the offline trainer and kept as is
    struct ClusterStats
    {
        ClusterId id{};
        std::string name;
        std::string description;
        std::size_t size{};
        double cohesion{};
        double separation{};
        std::vector<std::string> dominantGenres;
        std::vector<std::string> dominantFeatures;
    };

    struct ClusterSummary
    {
        std::size_t clusterCount{}; // noise excluded
        std::size_t clusteredTrackCount{};
        std::size_t noiseTrackCount{};
        double averageClusterSize{};
        std::size_t minClusterSize{};
        std::size_t maxClusterSize{};
        double averageCohesion{};
        double averageSeparation{};
        std::vector<std::pair<std::string, std::size_t>> topGenres; // genre, cluster count
    };

    class ClusterIndex
    {
    public:
        // Statistics of unknown clusters are discarded, sizes are computed from the assignments
        ClusterIndex(std::unordered_map<TrackId, ClusterId> assignments, std::vector<ClusterStats> stats = {});
        ~ClusterIndex() = default;
        ClusterIndex(const ClusterIndex&) = delete;
        ClusterIndex& operator=(const ClusterIndex&) = delete;
        ClusterIndex(ClusterIndex&&) = default;
        ClusterIndex& operator=(ClusterIndex&&) = default;

        std::size_t getTrackCount() const { return _clusterByTrackId.size(); }
        // noise excluded
        std::size_t getClusterCount() const;
        // ascending order, noise included if it has members
        std::vector<ClusterId> getClusterIds() const;

        // Throws UnknownTrackException
        ClusterId getClusterOf(const TrackId& trackId) const;
        bool contains(const TrackId& trackId) const { return _clusterByTrackId.contains(trackId); }

        // Empty set if the cluster is unknown
        const TrackIdSet& getMembers(ClusterId clusterId) const;

        // Throws UnknownClusterException
        const ClusterStats& getStats(ClusterId clusterId) const;

        ClusterSummary computeSummary(std::size_t maxTopGenreCount = 5) const;

    private:
        struct Cluster
        {
            TrackIdSet members;
            ClusterStats stats;
        };

        std::unordered_map<TrackId, ClusterId> _clusterByTrackId;
        std::map<ClusterId, Cluster> _clusters;
    };
} // namespace tracklike::model
