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

#include <span>
#include <vector>

#include "model/ModelVariant.hpp"
#include "services/recommendation/Types.hpp"

namespace tracklike::recommendation
{
    class ModelRegistry;

    // Runs the recommendation strategies against a variant of the registry
    class RecommendationOrchestrator
    {
    public:
        struct Limits
        {
            std::size_t defaultCount{ 12 };
            std::size_t maxCount{ 50 };
            std::size_t minClusterCandidates{};
        };

        RecommendationOrchestrator(const ModelRegistry& registry, const Limits& limits);
        ~RecommendationOrchestrator() = default;
        RecommendationOrchestrator(const RecommendationOrchestrator&) = delete;
        RecommendationOrchestrator& operator=(const RecommendationOrchestrator&) = delete;

        RecommendationResult recommend(const RecommendationQuery& query) const;

        // The variant is resolved by the caller and kept alive for the whole computation
        RecommendationResult recommend(const model::ModelVariant& variant, std::span<const model::TrackId> seedIds, Strategy strategy, std::optional<std::size_t> count) const;

        const Limits& getLimits() const { return _limits; }

    private:
        const ModelRegistry& _registry;
        const Limits _limits;
    };
} // namespace tracklike::recommendation
