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
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "model/ClusterIndex.hpp"
#include "model/FeatureStore.hpp"
#include "model/SimilarityIndex.hpp"
#include "model/Types.hpp"

namespace tracklike::model
{
    // How the offline trainer produced the embeddings and clusters of a variant
    struct VariantConfig
    {
        std::string name;
        std::string approach;
        std::string featureType;
        std::size_t dimensionCount{};
        Metric metric{ Metric::Euclidean };
        bool hasPca{};
        std::optional<std::size_t> pcaComponentCount;
        bool hasScaler{};
        std::size_t minClusterSize{};
    };

    std::string_view toString(Metric metric);
    std::optional<Metric> metricFromString(std::string_view str);

    // Immutable feature space: embeddings, cluster assignments and the matching neighbor index
    class ModelVariant
    {
    public:
        // Throws Exception if the store and the clusters do not describe the same tracks
        ModelVariant(VariantConfig config, FeatureStore store, ClusterIndex clusters);
        ~ModelVariant() = default;
        ModelVariant(const ModelVariant&) = delete;
        ModelVariant& operator=(const ModelVariant&) = delete;
        ModelVariant(ModelVariant&&) = delete;
        ModelVariant& operator=(ModelVariant&&) = delete;

        const std::string& getName() const { return _config.name; }
        const VariantConfig& getConfig() const { return _config; }
        const FeatureStore& getFeatureStore() const { return _store; }
        const ClusterIndex& getClusterIndex() const { return _clusters; }
        const SimilarityIndex& getSimilarityIndex() const { return _similarityIndex; }

    private:
        VariantConfig _config;
        FeatureStore _store;
        ClusterIndex _clusters;
        SimilarityIndex _similarityIndex; // built from _store
    };

    using ModelVariantPtr = std::shared_ptr<const ModelVariant>;
} // namespace tracklike::model
