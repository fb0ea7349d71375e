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

#include "ModelRegistry.hpp"

#include <algorithm>

#include "core/IJob.hpp"
#include "core/IJobScheduler.hpp"
#include "core/ILogger.hpp"
#include "model/Exception.hpp"
#include "model/VariantLoader.hpp"
#include "services/recommendation/Exception.hpp"

namespace tracklike::recommendation
{
    namespace
    {
        class LoadVariantJob : public core::IJob
        {
        public:
            LoadVariantJob(const std::filesystem::path& variantDirectory, const model::TrackMetadataTable& metadata)
                : _variantDirectory{ variantDirectory }
                , _metadata{ metadata }
            {
            }

            const std::filesystem::path& getVariantDirectory() const { return _variantDirectory; }
            const model::ModelVariantPtr& getVariant() const { return _variant; }
            const std::optional<LoadFailure>& getFailure() const { return _failure; }

        private:
            core::LiteralString getName() const override { return "Load Variant"; }
            void run() override
            {
                try
                {
                    _variant = model::loadVariant(_variantDirectory, _metadata);
                }
                catch (const model::VariantLoadException& e)
                {
                    _failure = LoadFailure{ e.getVariantName(), _variantDirectory, e.what() };
                }
                catch (const std::exception& e)
                {
                    _failure = LoadFailure{ _variantDirectory.filename().string(), _variantDirectory, e.what() };
                }
            }

            const std::filesystem::path _variantDirectory;
            const model::TrackMetadataTable& _metadata;
            model::ModelVariantPtr _variant;
            std::optional<LoadFailure> _failure;
        };

        model::TrackMetadataTable loadMetadata(const std::filesystem::path& metadataFile)
        {
            try
            {
                return model::loadTrackMetadata(metadataFile);
            }
            catch (const model::Exception& e)
            {
                TRACKLIKE_LOG(RECOMMENDATION, WARNING, e.what() << ", tracks will only be identified by their id");
                return {};
            }
        }
    } // namespace

    ModelRegistry::ModelRegistry(std::vector<std::string> preferredVariants)
        : _preferredVariants{ std::move(preferredVariants) }
    {
    }

    std::vector<std::string> ModelRegistry::loadAll(const std::filesystem::path& modelsDir, const std::filesystem::path& metadataFile, std::size_t threadCount)
    {
        const std::vector<std::filesystem::path> variantDirectories{ model::discoverVariantDirectories(modelsDir) };
        TRACKLIKE_LOG(RECOMMENDATION, INFO, "Found " << variantDirectories.size() << " variants in '" << modelsDir.string() << "'");

        std::vector<std::string> loadedVariants;
        if (!variantDirectories.empty())
        {
            const model::TrackMetadataTable metadata{ loadMetadata(metadataFile) };

            auto scheduler{ core::createJobScheduler("VariantLoader", std::clamp<std::size_t>(threadCount, 1, variantDirectories.size())) };
            for (const std::filesystem::path& variantDirectory : variantDirectories)
                scheduler->scheduleJob(std::make_unique<LoadVariantJob>(variantDirectory, metadata));

            TRACKLIKE_LOG(RECOMMENDATION, DEBUG, "Loading variants using " << scheduler->getThreadCount() << " threads");
            scheduler->wait();

            std::vector<std::unique_ptr<core::IJob>> doneJobs;
            scheduler->popJobsDone(doneJobs, variantDirectories.size());

            // job completion order is not deterministic
            std::sort(std::begin(doneJobs), std::end(doneJobs), [](const auto& a, const auto& b) {
                return static_cast<const LoadVariantJob&>(*a).getVariantDirectory() < static_cast<const LoadVariantJob&>(*b).getVariantDirectory();
            });

            for (const std::unique_ptr<core::IJob>& job : doneJobs)
            {
                const auto& loadJob{ static_cast<const LoadVariantJob&>(*job) };

                if (loadJob.getVariant())
                {
                    try
                    {
                        insert(loadJob.getVariant());
                        loadedVariants.emplace_back(loadJob.getVariant()->getName());
                    }
                    catch (const Exception& e)
                    {
                        std::unique_lock lock{ _mutex };
                        _loadFailures.push_back(LoadFailure{ loadJob.getVariant()->getName(), loadJob.getVariantDirectory(), e.what() });
                    }
                }
                else if (loadJob.getFailure())
                {
                    std::unique_lock lock{ _mutex };
                    _loadFailures.push_back(*loadJob.getFailure());
                }
            }
        }

        selectInitialActive();

        for (const LoadFailure& failure : getLoadFailures())
            TRACKLIKE_LOG(RECOMMENDATION, ERROR, "Variant '" << failure.variantName << "' not loaded: " << failure.cause);

        if (empty())
            TRACKLIKE_LOG(RECOMMENDATION, FATAL, "No variant loaded from '" << modelsDir.string() << "'");
        else
            TRACKLIKE_LOG(RECOMMENDATION, INFO, "Active variant: '" << getActive()->getName() << "'");

        std::sort(std::begin(loadedVariants), std::end(loadedVariants));
        return loadedVariants;
    }

    void ModelRegistry::add(model::ModelVariantPtr variant)
    {
        insert(std::move(variant));
        selectInitialActive();
    }

    void ModelRegistry::insert(model::ModelVariantPtr variant)
    {
        std::unique_lock lock{ _mutex };

        const std::string variantName{ variant->getName() };
        if (!_variants.emplace(variantName, std::move(variant)).second)
            throw Exception{ "Variant '" + variantName + "' already registered" };
    }

    void ModelRegistry::selectInitialActive()
    {
        std::scoped_lock switchLock{ _switchMutex };
        if (_activeVariant.load())
            return;

        std::shared_lock lock{ _mutex };
        if (_variants.empty())
            return;

        for (const std::string& preferredVariant : _preferredVariants)
        {
            auto it{ _variants.find(preferredVariant) };
            if (it != std::cend(_variants))
            {
                _activeVariant.store(it->second);
                return;
            }
        }

        _activeVariant.store(_variants.begin()->second);
    }

    model::ModelVariantPtr ModelRegistry::get(std::string_view variantName) const
    {
        std::shared_lock lock{ _mutex };

        auto it{ _variants.find(variantName) };
        if (it == std::cend(_variants))
            throw VariantNotFoundException{ std::string{ variantName } };

        return it->second;
    }

    model::ModelVariantPtr ModelRegistry::getActive() const
    {
        model::ModelVariantPtr variant{ _activeVariant.load() };
        if (!variant)
            throw RegistryEmptyException{};

        return variant;
    }

    model::ModelVariantPtr ModelRegistry::resolve(const std::optional<std::string>& variantName) const
    {
        if (variantName)
            return get(*variantName);

        return getActive();
    }

    void ModelRegistry::switchTo(std::string_view variantName)
    {
        std::scoped_lock switchLock{ _switchMutex };

        model::ModelVariantPtr variant{ get(variantName) };
        model::ModelVariantPtr previousVariant{ _activeVariant.exchange(variant) };

        TRACKLIKE_LOG(RECOMMENDATION, INFO, "Switched active variant from '" << (previousVariant ? previousVariant->getName() : "") << "' to '" << variant->getName() << "'");
    }

    std::vector<model::ModelVariantPtr> ModelRegistry::getAll() const
    {
        std::vector<model::ModelVariantPtr> res;

        std::shared_lock lock{ _mutex };
        res.reserve(_variants.size());
        for (const auto& [variantName, variant] : _variants)
            res.push_back(variant);

        return res;
    }

    std::vector<LoadFailure> ModelRegistry::getLoadFailures() const
    {
        std::shared_lock lock{ _mutex };
        return _loadFailures;
    }

    bool ModelRegistry::empty() const
    {
        std::shared_lock lock{ _mutex };
        return _variants.empty();
    }
} // namespace tracklike::recommendation
