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

#include "model/ClusterIndex.hpp"

#include <algorithm>
#include <limits>

#include "core/ILogger.hpp"
#include "model/Exception.hpp"

namespace tracklike::model
{
    namespace
    {
        std::string getDefaultClusterName(ClusterId clusterId)
        {
            if (clusterId == noiseClusterId)
                return "Noise";

            return "Cluster " + std::to_string(clusterId);
        }
    } // namespace

    ClusterIndex::ClusterIndex(std::unordered_map<TrackId, ClusterId> assignments, std::vector<ClusterStats> stats)
        : _clusterByTrackId{ std::move(assignments) }
    {
        for (const auto& [trackId, clusterId] : _clusterByTrackId)
        {
            if (clusterId < noiseClusterId)
                throw Exception{ "Track '" + trackId + "' has invalid cluster id " + std::to_string(clusterId) };

            Cluster& cluster{ _clusters[clusterId] };
            cluster.members.insert(trackId);
        }

        for (ClusterStats& clusterStats : stats)
        {
            auto it{ _clusters.find(clusterStats.id) };
            if (it == std::end(_clusters))
            {
                TRACKLIKE_LOG(MODEL, WARNING, "Discarding statistics of cluster " << clusterStats.id << ": no member");
                continue;
            }

            it->second.stats = std::move(clusterStats);
        }

        for (auto& [clusterId, cluster] : _clusters)
        {
            cluster.stats.id = clusterId;
            cluster.stats.size = cluster.members.size();
            if (cluster.stats.name.empty())
                cluster.stats.name = getDefaultClusterName(clusterId);
        }
    }

    std::size_t ClusterIndex::getClusterCount() const
    {
        return _clusters.size() - (_clusters.contains(noiseClusterId) ? 1 : 0);
    }

    std::vector<ClusterId> ClusterIndex::getClusterIds() const
    {
        std::vector<ClusterId> res;
        res.reserve(_clusters.size());

        for (const auto& [clusterId, cluster] : _clusters)
            res.push_back(clusterId);

        return res;
    }

    ClusterId ClusterIndex::getClusterOf(const TrackId& trackId) const
    {
        auto it{ _clusterByTrackId.find(trackId) };
        if (it == std::cend(_clusterByTrackId))
            throw UnknownTrackException{ trackId };

        return it->second;
    }

    const TrackIdSet& ClusterIndex::getMembers(ClusterId clusterId) const
    {
        static const TrackIdSet empty;

        auto it{ _clusters.find(clusterId) };
        if (it == std::cend(_clusters))
            return empty;

        return it->second.members;
    }

    const ClusterStats& ClusterIndex::getStats(ClusterId clusterId) const
    {
        auto it{ _clusters.find(clusterId) };
        if (it == std::cend(_clusters))
            throw UnknownClusterException{ clusterId };

        return it->second.stats;
    }

    ClusterSummary ClusterIndex::computeSummary(std::size_t maxTopGenreCount) const
    {
        ClusterSummary summary;

        std::map<std::string, std::size_t> genreClusterCounts;
        double totalCohesion{};
        double totalSeparation{};
        std::size_t minSize{ std::numeric_limits<std::size_t>::max() };

        for (const auto& [clusterId, cluster] : _clusters)
        {
            if (clusterId == noiseClusterId)
            {
                summary.noiseTrackCount = cluster.members.size();
                continue;
            }

            summary.clusterCount += 1;
            summary.clusteredTrackCount += cluster.members.size();
            minSize = std::min(minSize, cluster.members.size());
            summary.maxClusterSize = std::max(summary.maxClusterSize, cluster.members.size());
            totalCohesion += cluster.stats.cohesion;
            totalSeparation += cluster.stats.separation;

            for (const std::string& genre : cluster.stats.dominantGenres)
                genreClusterCounts[genre] += 1;
        }

        if (summary.clusterCount > 0)
        {
            const double clusterCount{ static_cast<double>(summary.clusterCount) };

            summary.minClusterSize = minSize;
            summary.averageClusterSize = static_cast<double>(summary.clusteredTrackCount) / clusterCount;
            summary.averageCohesion = totalCohesion / clusterCount;
            summary.averageSeparation = totalSeparation / clusterCount;
        }

        summary.topGenres.assign(std::cbegin(genreClusterCounts), std::cend(genreClusterCounts));
        // map order breaks ties alphabetically
        std::stable_sort(std::begin(summary.topGenres), std::end(summary.topGenres), [](const auto& a, const auto& b) { return a.second > b.second; });
        if (summary.topGenres.size() > maxTopGenreCount)
            summary.topGenres.resize(maxTopGenreCount);

        return summary;
    }
} // namespace tracklike::model
