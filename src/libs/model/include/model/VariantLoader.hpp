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

#include <filesystem>
#include <unordered_map>
#include <vector>

#include "model/ModelVariant.hpp"
#include "model/Track.hpp"
#include "model/Types.hpp"

namespace tracklike::model
{
    using TrackMetadataTable = std::unordered_map<TrackId, Track>;

    // Artifact file names, relative to the models directory or to a variant directory
    namespace artifacts
    {
        static constexpr const char* trackMetadataFile{ "tracks.json" };
        static constexpr const char* variantFile{ "variant.json" };
        static constexpr const char* embeddingsFile{ "embeddings.csv" };
        static constexpr const char* clustersFile{ "clusters.csv" };
        static constexpr const char* clusterStatsFile{ "cluster_stats.json" };
    } // namespace artifacts

    // Throws Exception if the file cannot be read or parsed
    TrackMetadataTable loadTrackMetadata(const std::filesystem::path& metadataFile);

    // Sub directories containing a variant file, in ascending path order
    std::vector<std::filesystem::path> discoverVariantDirectories(const std::filesystem::path& modelsDir);

    // Throws VariantLoadException. Tracks without metadata get a placeholder entry.
    VariantConfig readVariantConfig(const std::filesystem::path& variantDirectory);
    ModelVariantPtr loadVariant(const std::filesystem::path& variantDirectory, const TrackMetadataTable& metadata);
} // namespace tracklike::model
