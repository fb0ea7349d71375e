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

#include <filesystem>
#include <iomanip>
#include <iostream>
#include <optional>
#include <stdlib.h>
#include <string>
#include <vector>

#include <boost/program_options.hpp>

#include "core/Exception.hpp"
#include "core/IConfig.hpp"
#include "core/ILogger.hpp"
#include "core/Service.hpp"
#include "core/String.hpp"
#include "core/SystemPaths.hpp"
#include "services/recommendation/Exception.hpp"
#include "services/recommendation/IRecommendationService.hpp"

namespace tracklike
{
    namespace
    {
        core::logging::Severity getLogMinSeverity(core::IConfig* config)
        {
            std::string_view minSeverity{ config ? config->getString("log-min-severity", "info") : "info" };

            if (minSeverity == "debug")
                return core::logging::Severity::DEBUG;
            else if (minSeverity == "info")
                return core::logging::Severity::INFO;
            else if (minSeverity == "warning")
                return core::logging::Severity::WARNING;
            else if (minSeverity == "error")
                return core::logging::Severity::ERROR;
            else if (minSeverity == "fatal")
                return core::logging::Severity::FATAL;

            throw core::TracklikeException{ "Invalid config value for 'log-min-severity'" };
        }

        recommendation::Strategy parseStrategy(std::string_view str)
        {
            const std::optional<recommendation::Strategy> strategy{ recommendation::strategyFromString(str) };
            if (!strategy)
                throw core::TracklikeException{ "Invalid strategy '" + std::string{ str } + "'" };

            return *strategy;
        }

        recommendation::ClusterSortKey parseClusterSortKey(std::string_view str)
        {
            const std::optional<recommendation::ClusterSortKey> sortKey{ recommendation::clusterSortKeyFromString(str) };
            if (!sortKey)
                throw core::TracklikeException{ "Invalid cluster sort key '" + std::string{ str } + "'" };

            return *sortKey;
        }

        // "variant:strategy", "variant" or ":strategy"
        recommendation::ComparisonLabel parseComparisonLabel(std::string_view str)
        {
            recommendation::ComparisonLabel label;

            const std::vector<std::string_view> parts{ core::stringUtils::splitString(str, ':') };
            if (parts.empty() || parts.size() > 2)
                throw core::TracklikeException{ "Invalid comparison label '" + std::string{ str } + "'" };

            if (!parts[0].empty())
                label.variantName = std::string{ parts[0] };
            if (parts.size() == 2)
                label.strategy = parseStrategy(parts[1]);

            return label;
        }

        std::string trackToString(const model::Track& track)
        {
            return "'" + track.name + "' - " + track.artist + " [" + track.id + "]";
        }

        void dumpResult(const recommendation::RecommendationResult& result)
        {
            std::cout << "Variant '" << result.variantName << "', strategy '" << recommendation::toString(result.strategy) << "'";
            if (result.status == recommendation::ResultStatus::EmptyCandidateSet)
                std::cout << " (no candidate)";
            std::cout << std::endl;

            if (!result.fallbackSeedIds.empty())
                std::cout << "\tFallback seeds: " << core::stringUtils::joinStrings(result.fallbackSeedIds, ", ") << std::endl;

            for (const recommendation::RecommendedTrack& recommendedTrack : result.tracks)
            {
                std::cout << "\t- " << trackToString(recommendedTrack.track)
                          << " similarity = " << std::fixed << std::setprecision(4) << recommendedTrack.similarity
                          << ", cluster = ";
                if (recommendedTrack.clusterId)
                    std::cout << *recommendedTrack.clusterId;
                else
                    std::cout << "noise";
                std::cout << ", seed = " << recommendedTrack.sourceSeedId
                          << ", match = " << recommendation::toString(recommendedTrack.matchKind) << std::endl;
            }
        }

        void dumpVariants(const recommendation::IRecommendationService& service)
        {
            std::cout << "*** Variants ***" << std::endl;
            for (const recommendation::VariantSummary& variant : service.listVariants())
            {
                std::cout << (variant.active ? "* " : "  ") << variant.name
                          << ": approach = " << variant.config.approach
                          << ", features = " << variant.config.featureType
                          << ", dimensions = " << variant.config.dimensionCount
                          << ", metric = " << model::toString(variant.config.metric)
                          << ", tracks = " << variant.trackCount
                          << ", clusters = " << variant.clusterCount << std::endl;
            }
        }

        void dumpLoadFailures(const recommendation::IRecommendationService& service)
        {
            std::cout << "*** Load failures ***" << std::endl;
            for (const recommendation::LoadFailure& failure : service.getLoadFailures())
                std::cout << failure.variantName << " (" << failure.directory.string() << "): " << failure.cause << std::endl;
        }

        void dumpClusterInfo(const recommendation::ClusterInfo& clusterInfo)
        {
            const model::ClusterStats& stats{ clusterInfo.stats };

            std::cout << "*** Cluster " << stats.id << " (" << clusterInfo.variantName << ") ***" << std::endl;
            std::cout << "Name: " << stats.name << std::endl;
            if (!stats.description.empty())
                std::cout << "Description: " << stats.description << std::endl;
            std::cout << "Size: " << stats.size << std::endl;
            std::cout << "Cohesion: " << stats.cohesion << ", separation: " << stats.separation << std::endl;
            if (!stats.dominantGenres.empty())
                std::cout << "Dominant genres: " << core::stringUtils::joinStrings(stats.dominantGenres, ", ") << std::endl;
            if (!stats.dominantFeatures.empty())
                std::cout << "Dominant features: " << core::stringUtils::joinStrings(stats.dominantFeatures, ", ") << std::endl;

            for (const model::Track& track : clusterInfo.sampleTracks)
                std::cout << "\t- " << trackToString(track) << " popularity = " << track.popularity << std::endl;
        }

        void dumpClusters(const std::vector<model::ClusterStats>& clusters)
        {
            std::cout << "*** Clusters ***" << std::endl;
            for (const model::ClusterStats& stats : clusters)
            {
                std::cout << stats.id << ": '" << stats.name << "', size = " << stats.size
                          << ", cohesion = " << stats.cohesion << ", separation = " << stats.separation;
                if (!stats.dominantGenres.empty())
                    std::cout << ", genres = " << core::stringUtils::joinStrings(stats.dominantGenres, ", ");
                std::cout << std::endl;
            }
        }

        void dumpTrackInfo(const recommendation::TrackInfo& trackInfo)
        {
            const model::Track& track{ trackInfo.track };

            std::cout << "*** Track " << track.id << " (" << trackInfo.variantName << ") ***" << std::endl;
            std::cout << "Name: " << track.name << std::endl;
            std::cout << "Artist: " << track.artist << std::endl;
            if (!track.genres.empty())
                std::cout << "Genres: " << core::stringUtils::joinStrings(track.genres, ", ") << std::endl;
            std::cout << "Popularity: " << track.popularity << std::endl;
            if (track.previewUrl)
                std::cout << "Preview: " << *track.previewUrl << std::endl;
            std::cout << "Cluster: ";
            if (trackInfo.clusterId)
                std::cout << *trackInfo.clusterId;
            else
                std::cout << "noise";
            std::cout << std::endl;
        }

        void dumpClusterSummary(const model::ClusterSummary& summary)
        {
            std::cout << "*** Cluster summary ***" << std::endl;
            std::cout << "Clusters: " << summary.clusterCount << std::endl;
            std::cout << "Clustered tracks: " << summary.clusteredTrackCount << ", noise tracks: " << summary.noiseTrackCount << std::endl;
            std::cout << "Cluster size: avg = " << summary.averageClusterSize << ", min = " << summary.minClusterSize << ", max = " << summary.maxClusterSize << std::endl;
            std::cout << "Cohesion avg = " << summary.averageCohesion << ", separation avg = " << summary.averageSeparation << std::endl;
            for (const auto& [genre, clusterCount] : summary.topGenres)
                std::cout << "\t- " << genre << ": " << clusterCount << " cluster(s)" << std::endl;
        }
    } // namespace
} // namespace tracklike

int main(int argc, char* argv[])
{
    try
    {
        using namespace tracklike;
        namespace po = boost::program_options;

        po::options_description desc{ "Allowed options" };
        desc.add_options()("help,h", "print usage message")("conf,c", po::value<std::string>()->default_value(core::sysconfDirectory / "tracklike.conf"), "Tracklike config file")("models-dir,m", po::value<std::string>(), "Model variants directory (overrides config)")("variant,v", po::value<std::string>(), "Variant to use (defaults to the active one)")("switch", po::value<std::string>(), "Switch the active variant before anything else")("strategy,s", po::value<std::string>()->default_value("global"), "Strategy: global, cluster, hybrid, artist or genre")("count,n", po::value<std::size_t>(), "Recommendation count")("seed", po::value<std::vector<std::string>>()->composing(), "Seed track id (can be repeated)")("compare", po::value<std::vector<std::string>>()->composing(), "Comparison label 'variant:strategy' (can be repeated)")("list-variants,l", "List loaded variants")("load-failures", "List variants that failed to load")("cluster", po::value<long>(), "Display cluster info")("cluster-summary", "Display cluster summary")("sample", po::value<std::size_t>(), "Display random tracks (restricted to --cluster if set)")("list-clusters", "List clusters")("min-size", po::value<std::size_t>()->default_value(0), "Minimum cluster size for --list-clusters")("sort-by", po::value<std::string>()->default_value("size"), "Cluster sort key for --list-clusters: size or id")("ascending", "Ascending order for --list-clusters")("track,t", po::value<std::string>(), "Display track info")("popular", po::value<std::size_t>(), "Display the most popular tracks")("min-popularity", po::value<unsigned>()->default_value(0), "Minimum popularity for --popular");

        po::variables_map vm;
        po::store(po::parse_command_line(argc, argv, desc), vm);
        po::notify(vm);

        if (vm.count("help"))
        {
            std::cout << desc << std::endl;
            return EXIT_SUCCESS;
        }

        core::Service<core::IConfig> config;
        const std::filesystem::path configFilePath{ vm["conf"].as<std::string>() };
        if (std::filesystem::exists(configFilePath))
            config.assign(core::createConfig(configFilePath));

        core::Service<core::logging::ILogger> logger{ core::logging::createLogger(getLogMinSeverity(config.get()), config.get() ? config->getPath("log-file", "") : std::filesystem::path{}) };
        TRACKLIKE_LOG_IF(MAIN, WARNING, !config.get(), "Config file " << configFilePath << " not found, using defaults");

        recommendation::Settings settings{ config.get() ? recommendation::readSettings(*config) : recommendation::Settings{} };
        if (vm.count("models-dir"))
            settings.modelsDir = vm["models-dir"].as<std::string>();
        if (settings.modelsDir.empty())
            throw core::TracklikeException{ "No models directory set" };

        std::cout << "Loading model variants from " << settings.modelsDir << "..." << std::endl;
        const auto recommendationService{ recommendation::createRecommendationService(settings) };
        std::cout << "Model variants loaded!" << std::endl;

        if (vm.count("load-failures"))
            dumpLoadFailures(*recommendationService);

        if (!recommendationService->isHealthy())
        {
            std::cerr << "No model variant loaded" << std::endl;
            return EXIT_FAILURE;
        }

        if (vm.count("switch"))
            recommendationService->switchVariant(vm["switch"].as<std::string>());

        if (vm.count("list-variants"))
            dumpVariants(*recommendationService);

        std::optional<std::string> variantName;
        if (vm.count("variant"))
            variantName = vm["variant"].as<std::string>();

        std::optional<std::size_t> count;
        if (vm.count("count"))
            count = vm["count"].as<std::size_t>();

        std::optional<model::ClusterId> clusterId;
        if (vm.count("cluster"))
            clusterId = vm["cluster"].as<long>();

        if (clusterId)
            dumpClusterInfo(recommendationService->getClusterInfo(*clusterId, std::nullopt, variantName));

        if (vm.count("cluster-summary"))
            dumpClusterSummary(recommendationService->getClusterSummary(variantName));

        if (vm.count("list-clusters"))
        {
            recommendation::ClusterListQuery query;
            query.minSize = vm["min-size"].as<std::size_t>();
            query.sortBy = parseClusterSortKey(vm["sort-by"].as<std::string>());
            query.descending = !vm.count("ascending");
            query.variantName = variantName;

            dumpClusters(recommendationService->listClusters(query));
        }

        if (vm.count("track"))
            dumpTrackInfo(recommendationService->getTrack(vm["track"].as<std::string>(), variantName));

        if (vm.count("popular"))
        {
            std::cout << "*** Popular tracks ***" << std::endl;
            for (const model::Track& track : recommendationService->getPopularTracks(vm["popular"].as<std::size_t>(), vm["min-popularity"].as<unsigned>(), variantName))
                std::cout << "\t- " << trackToString(track) << " popularity = " << track.popularity << std::endl;
        }

        if (vm.count("sample"))
        {
            std::cout << "*** Sample ***" << std::endl;
            for (const model::Track& track : recommendationService->sampleTracks(vm["sample"].as<std::size_t>(), clusterId, variantName))
                std::cout << "\t- " << trackToString(track) << std::endl;
        }

        if (vm.count("seed"))
        {
            const std::vector<std::string>& seedIds{ vm["seed"].as<std::vector<std::string>>() };

            if (vm.count("compare"))
            {
                std::vector<recommendation::ComparisonLabel> labels;
                for (const std::string& label : vm["compare"].as<std::vector<std::string>>())
                    labels.push_back(parseComparisonLabel(label));

                for (const recommendation::ComparisonEntry& entry : recommendationService->compare(seedIds, labels, count))
                {
                    if (entry.result)
                        dumpResult(*entry.result);
                    else
                        std::cout << "Variant '" << entry.label.variantName.value_or("<active>") << "', strategy '" << recommendation::toString(entry.label.strategy) << "' failed (" << recommendation::toString(entry.error->kind) << "): " << entry.error->message << std::endl;
                    std::cout << "\tElapsed: " << entry.elapsed.count() << " us" << std::endl;
                }
            }
            else
            {
                recommendation::RecommendationQuery query;
                query.seedIds = seedIds;
                query.strategy = parseStrategy(vm["strategy"].as<std::string>());
                query.count = count;
                query.variantName = variantName;

                dumpResult(recommendationService->recommend(query));
            }
        }
    }
    catch (std::exception& e)
    {
        std::cerr << "Caught exception: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
