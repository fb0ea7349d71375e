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

#include "model/VariantLoader.hpp"

#include <algorithm>
#include <fstream>

#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>

#include "core/ILogger.hpp"
#include "core/String.hpp"
#include "model/Exception.hpp"

namespace tracklike::model
{
    namespace
    {
        using Kind = VariantLoadException::Kind;

        std::vector<std::string> readStrings(const boost::property_tree::ptree& node, const std::string& key)
        {
            std::vector<std::string> res;

            const auto child{ node.get_child_optional(key) };
            if (!child)
                return res;

            auto addString{ [&](std::string_view str) {
                str = core::stringUtils::stringTrim(str);
                if (!str.empty())
                    res.emplace_back(str);
            } };

            // either an array or a comma separated string
            if (child->empty())
            {
                const std::string data{ child->get_value<std::string>() };
                for (std::string_view str : core::stringUtils::splitString(data, ','))
                    addString(str);
            }
            else
            {
                for (const auto& [name, value] : *child)
                    addString(value.get_value<std::string>());
            }

            return res;
        }

        // JSON null values are read back as "null" by property_tree
        std::optional<std::string> readOptionalString(const boost::property_tree::ptree& node, const std::string& key)
        {
            std::optional<std::string> res;

            const auto value{ node.get_optional<std::string>(key) };
            if (!value || value->empty() || *value == "null")
                return res;

            res = *value;
            return res;
        }

        boost::property_tree::ptree readJsonFile(const std::string& variantName, const std::filesystem::path& path)
        {
            if (!std::filesystem::exists(path))
                throw VariantLoadException{ variantName, Kind::MissingFile, path.string() };

            boost::property_tree::ptree root;
            try
            {
                boost::property_tree::read_json(path.string(), root);
            }
            catch (const boost::property_tree::json_parser_error& e)
            {
                throw VariantLoadException{ variantName, Kind::CorruptArtifact, e.what() };
            }

            return root;
        }

        // Calls func for each non empty line after the header, with the line number
        template<typename Func>
        void visitCsvRows(const std::string& variantName, const std::filesystem::path& path, Func func)
        {
            std::ifstream ifs{ path };
            if (!ifs)
                throw VariantLoadException{ variantName, Kind::MissingFile, path.string() };

            std::string line;
            std::size_t lineNumber{};
            while (std::getline(ifs, line))
            {
                lineNumber += 1;
                if (lineNumber == 1)
                    continue; // header

                const std::string_view trimmedLine{ core::stringUtils::stringTrim(line) };
                if (trimmedLine.empty())
                    continue;

                func(core::stringUtils::splitString(trimmedLine, ','), lineNumber);
            }

            if (ifs.bad())
                throw VariantLoadException{ variantName, Kind::CorruptArtifact, "cannot read " + path.string() };
        }

        std::string getCsvError(const std::filesystem::path& path, std::size_t lineNumber, std::string_view error)
        {
            return path.filename().string() + ", line " + std::to_string(lineNumber) + ": " + std::string{ error };
        }

        std::vector<FeatureStore::Entry> readEmbeddings(const VariantConfig& config, const std::filesystem::path& path, const TrackMetadataTable& metadata)
        {
            std::vector<FeatureStore::Entry> entries;
            std::size_t missingMetadataCount{};

            visitCsvRows(config.name, path, [&](const std::vector<std::string_view>& fields, std::size_t lineNumber) {
                if (fields.size() != config.dimensionCount + 1)
                    throw VariantLoadException{ config.name, Kind::SchemaMismatch, getCsvError(path, lineNumber, "expected " + std::to_string(config.dimensionCount + 1) + " fields, got " + std::to_string(fields.size())) };

                const TrackId trackId{ core::stringUtils::stringTrim(fields[0]) };
                if (trackId.empty())
                    throw VariantLoadException{ config.name, Kind::CorruptArtifact, getCsvError(path, lineNumber, "empty track id") };

                FeatureVector features(config.dimensionCount);
                for (std::size_t i{}; i < config.dimensionCount; ++i)
                {
                    const std::optional<double> value{ core::stringUtils::readAs<double>(fields[i + 1]) };
                    if (!value)
                        throw VariantLoadException{ config.name, Kind::CorruptArtifact, getCsvError(path, lineNumber, "bad value '" + std::string{ fields[i + 1] } + "'") };

                    features[i] = *value;
                }

                Track track;
                if (auto it{ metadata.find(trackId) }; it != std::cend(metadata))
                {
                    track = it->second;
                }
                else
                {
                    track.id = trackId;
                    track.name = trackId;
                    missingMetadataCount += 1;
                }

                entries.push_back(FeatureStore::Entry{ std::move(track), std::move(features) });
            });

            TRACKLIKE_LOG_IF(MODEL, WARNING, missingMetadataCount > 0, "Variant '" << config.name << "': " << missingMetadataCount << " tracks have no metadata");

            return entries;
        }

        std::unordered_map<TrackId, ClusterId> readClusterAssignments(const std::string& variantName, const std::filesystem::path& path)
        {
            std::unordered_map<TrackId, ClusterId> assignments;

            visitCsvRows(variantName, path, [&](const std::vector<std::string_view>& fields, std::size_t lineNumber) {
                if (fields.size() != 2)
                    throw VariantLoadException{ variantName, Kind::SchemaMismatch, getCsvError(path, lineNumber, "expected 2 fields, got " + std::to_string(fields.size())) };

                const TrackId trackId{ core::stringUtils::stringTrim(fields[0]) };
                const std::optional<ClusterId> clusterId{ core::stringUtils::readAs<ClusterId>(fields[1]) };
                if (trackId.empty() || !clusterId)
                    throw VariantLoadException{ variantName, Kind::CorruptArtifact, getCsvError(path, lineNumber, "bad cluster assignment") };

                if (!assignments.emplace(trackId, *clusterId).second)
                    throw VariantLoadException{ variantName, Kind::CorruptArtifact, getCsvError(path, lineNumber, "duplicate track '" + trackId + "'") };
            });

            return assignments;
        }

        std::vector<ClusterStats> readClusterStats(const std::string& variantName, const std::filesystem::path& path)
        {
            std::vector<ClusterStats> res;

            if (!std::filesystem::exists(path))
            {
                TRACKLIKE_LOG(MODEL, DEBUG, "Variant '" << variantName << "': no cluster statistics");
                return res;
            }

            const boost::property_tree::ptree root{ readJsonFile(variantName, path) };
            try
            {
                const auto clusters{ root.get_child_optional("clusters") };
                if (!clusters)
                    return res;

                for (const auto& [name, node] : *clusters)
                {
                    ClusterStats stats;
                    stats.id = node.get<ClusterId>("id");
                    stats.name = node.get<std::string>("name", "");
                    stats.description = node.get<std::string>("description", "");
                    stats.cohesion = node.get<double>("cohesion", 0);
                    stats.separation = node.get<double>("separation", 0);
                    stats.dominantGenres = readStrings(node, "dominant_genres");
                    stats.dominantFeatures = readStrings(node, "dominant_features");

                    res.push_back(std::move(stats));
                }
            }
            catch (const boost::property_tree::ptree_error& e)
            {
                throw VariantLoadException{ variantName, Kind::CorruptArtifact, path.filename().string() + ": " + e.what() };
            }

            return res;
        }
    } // namespace

    TrackMetadataTable loadTrackMetadata(const std::filesystem::path& metadataFile)
    {
        TrackMetadataTable res;

        try
        {
            boost::property_tree::ptree root;
            boost::property_tree::read_json(metadataFile.string(), root);

            for (const auto& [name, node] : root.get_child("tracks"))
            {
                Track track;
                track.id = node.get<std::string>("id");
                track.name = node.get<std::string>("name", "");

                const std::string artist{ node.get<std::string>("artist", "") };
                if (const std::string_view trimmedArtist{ core::stringUtils::stringTrim(artist) }; !trimmedArtist.empty() && trimmedArtist != "null")
                    track.artist = trimmedArtist;

                track.genres = readStrings(node, "genres");
                track.popularity = static_cast<unsigned>(std::clamp(node.get<double>("popularity", 0), 0.0, 100.0));
                track.previewUrl = readOptionalString(node, "preview_url");

                const TrackId trackId{ track.id };
                if (!res.emplace(trackId, std::move(track)).second)
                    TRACKLIKE_LOG(MODEL, WARNING, "Duplicate metadata for track '" << trackId << "', keeping the first one");
            }
        }
        catch (const boost::property_tree::ptree_error& e)
        {
            throw Exception{ "Cannot read track metadata from '" + metadataFile.string() + "': " + e.what() };
        }

        TRACKLIKE_LOG(MODEL, INFO, "Read metadata of " << res.size() << " tracks");
        return res;
    }

    std::vector<std::filesystem::path> discoverVariantDirectories(const std::filesystem::path& modelsDir)
    {
        std::vector<std::filesystem::path> res;

        std::error_code ec;
        std::filesystem::directory_iterator itDir{ modelsDir, ec };
        if (ec)
        {
            TRACKLIKE_LOG(MODEL, ERROR, "Cannot list models directory '" << modelsDir.string() << "': " << ec.message());
            return res;
        }

        for (const std::filesystem::directory_entry& entry : itDir)
        {
            if (entry.is_directory(ec) && std::filesystem::exists(entry.path() / artifacts::variantFile, ec))
                res.push_back(entry.path());
        }

        std::sort(std::begin(res), std::end(res));
        return res;
    }

    VariantConfig readVariantConfig(const std::filesystem::path& variantDirectory)
    {
        const std::string directoryName{ variantDirectory.filename().string() };
        const boost::property_tree::ptree root{ readJsonFile(directoryName, variantDirectory / artifacts::variantFile) };

        VariantConfig config;
        try
        {
            config.name = root.get<std::string>("name", directoryName);
            config.approach = root.get<std::string>("approach", "");
            config.featureType = root.get<std::string>("feature_type", "");
            config.dimensionCount = root.get<std::size_t>("dimension_count");
            config.hasPca = root.get<bool>("has_pca", false);
            config.hasScaler = root.get<bool>("has_scaler", false);
            config.minClusterSize = root.get<std::size_t>("min_cluster_size", 0);

            if (const std::optional<std::string> pcaComponents{ readOptionalString(root, "pca_components") })
            {
                config.pcaComponentCount = core::stringUtils::readAs<std::size_t>(*pcaComponents);
                if (!config.pcaComponentCount)
                    throw VariantLoadException{ config.name, Kind::SchemaMismatch, "bad pca_components '" + *pcaComponents + "'" };
            }

            const std::string metric{ root.get<std::string>("metric", "euclidean") };
            const std::optional<Metric> parsedMetric{ metricFromString(metric) };
            if (!parsedMetric)
                throw VariantLoadException{ config.name, Kind::SchemaMismatch, "unsupported metric '" + metric + "'" };
            config.metric = *parsedMetric;
        }
        catch (const boost::property_tree::ptree_error& e)
        {
            throw VariantLoadException{ directoryName, Kind::SchemaMismatch, std::string{ artifacts::variantFile } + ": " + e.what() };
        }

        if (config.name.empty())
            throw VariantLoadException{ directoryName, Kind::SchemaMismatch, "empty variant name" };
        if (config.dimensionCount == 0)
            throw VariantLoadException{ config.name, Kind::SchemaMismatch, "dimension_count must be positive" };

        return config;
    }

    ModelVariantPtr loadVariant(const std::filesystem::path& variantDirectory, const TrackMetadataTable& metadata)
    {
        VariantConfig config{ readVariantConfig(variantDirectory) };
        const std::string variantName{ config.name };

        TRACKLIKE_LOG(MODEL, DEBUG, "Loading variant '" << variantName << "' from '" << variantDirectory.string() << "'...");

        std::vector<FeatureStore::Entry> entries{ readEmbeddings(config, variantDirectory / artifacts::embeddingsFile, metadata) };
        std::unordered_map<TrackId, ClusterId> assignments{ readClusterAssignments(variantName, variantDirectory / artifacts::clustersFile) };
        std::vector<ClusterStats> stats{ readClusterStats(variantName, variantDirectory / artifacts::clusterStatsFile) };

        if (entries.empty())
            throw VariantLoadException{ variantName, Kind::CorruptArtifact, "no embedding" };

        try
        {
            FeatureStore store{ config.dimensionCount, std::move(entries) };
            ClusterIndex clusters{ std::move(assignments), std::move(stats) };

            auto variant{ std::make_shared<const ModelVariant>(std::move(config), std::move(store), std::move(clusters)) };

            TRACKLIKE_LOG(MODEL, INFO, "Loaded variant '" << variantName << "': " << variant->getFeatureStore().size() << " tracks, "
                                                          << variant->getClusterIndex().getClusterCount() << " clusters, "
                                                          << variant->getFeatureStore().getDimensionCount() << " dimensions");
            return variant;
        }
        catch (const Exception& e)
        {
            throw VariantLoadException{ variantName, Kind::SchemaMismatch, e.what() };
        }
    }
} // namespace tracklike::model
