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

#include <atomic>
#include <filesystem>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

#include "model/ModelVariant.hpp"
#include "services/recommendation/Types.hpp"

namespace tracklike::recommendation
{
    // Named collection of loaded variants, one of them being active.
    // Variants are shared: a reader keeps the variant it resolved even if the active one is switched.
    class ModelRegistry
    {
    public:
        ModelRegistry(std::vector<std::string> preferredVariants = {});
        ~ModelRegistry() = default;
        ModelRegistry(const ModelRegistry&) = delete;
        ModelRegistry& operator=(const ModelRegistry&) = delete;

        // Loads all the variants in parallel, failures are recorded
        // Returns the names of the loaded variants, in ascending order
        std::vector<std::string> loadAll(const std::filesystem::path& modelsDir, const std::filesystem::path& metadataFile, std::size_t threadCount);

        // Throws Exception if a variant with the same name is already registered
        // The first added variant becomes active if none is
        void add(model::ModelVariantPtr variant);

        // Throws VariantNotFoundException
        model::ModelVariantPtr get(std::string_view variantName) const;
        // Throws RegistryEmptyException
        model::ModelVariantPtr getActive() const;
        // Named variant if set, active one otherwise
        model::ModelVariantPtr resolve(const std::optional<std::string>& variantName) const;

        // Throws VariantNotFoundException
        void switchTo(std::string_view variantName);

        // ascending name order
        std::vector<model::ModelVariantPtr> getAll() const;
        std::vector<LoadFailure> getLoadFailures() const;
        bool empty() const;

    private:
        void insert(model::ModelVariantPtr variant);
        // preferred variants first, then ascending name order
        void selectInitialActive();

        const std::vector<std::string> _preferredVariants;

        mutable std::shared_mutex _mutex;
        std::map<std::string, model::ModelVariantPtr, std::less<>> _variants;
        std::vector<LoadFailure> _loadFailures;

        std::mutex _switchMutex;
        std::atomic<model::ModelVariantPtr> _activeVariant;
    };
} // namespace tracklike::recommendation
