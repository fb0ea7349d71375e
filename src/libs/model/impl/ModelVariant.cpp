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

#include "model/ModelVariant.hpp"

#include "core/String.hpp"
#include "model/Exception.hpp"

namespace tracklike::model
{
    namespace
    {
        // Returns the store once checked
        const FeatureStore& checkConsistency(const VariantConfig& config, const FeatureStore& store, const ClusterIndex& clusters)
        {
            if (config.name.empty())
                throw Exception{ "Variant has no name" };

            if (config.dimensionCount != store.getDimensionCount())
                throw Exception{ "Variant declares " + std::to_string(config.dimensionCount) + " dimensions, embeddings have " + std::to_string(store.getDimensionCount()) };

            if (clusters.getTrackCount() != store.size())
                throw Exception{ "Cluster assignments cover " + std::to_string(clusters.getTrackCount()) + " tracks, embeddings cover " + std::to_string(store.size()) };

            for (const TrackId& trackId : store.getAllIds())
            {
                if (!clusters.contains(trackId))
                    throw Exception{ "Track '" + trackId + "' has no cluster assignment" };
            }

            return store;
        }
    } // namespace

    std::string_view toString(Metric metric)
    {
        switch (metric)
        {
        case Metric::Euclidean:
            return "euclidean";
        case Metric::Manhattan:
            return "manhattan";
        }
        return "";
    }

    std::optional<Metric> metricFromString(std::string_view str)
    {
        if (core::stringUtils::stringCaseInsensitiveEqual(str, "euclidean"))
            return Metric::Euclidean;
        if (core::stringUtils::stringCaseInsensitiveEqual(str, "manhattan"))
            return Metric::Manhattan;

        return std::nullopt;
    }

    ModelVariant::ModelVariant(VariantConfig config, FeatureStore store, ClusterIndex clusters)
        : _config{ std::move(config) }
        , _store{ std::move(store) }
        , _clusters{ std::move(clusters) }
        , _similarityIndex{ checkConsistency(_config, _store, _clusters), _config.metric }
    {
    }
} // namespace tracklike::model
