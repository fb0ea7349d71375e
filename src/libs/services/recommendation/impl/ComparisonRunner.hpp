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

#include <optional>
#include <vector>

#include "services/recommendation/Types.hpp"

namespace tracklike::recommendation
{
    class ModelRegistry;
    class RecommendationOrchestrator;

    // Runs the same query through several variant/strategy labels without touching the active variant
    class ComparisonRunner
    {
    public:
        ComparisonRunner(const ModelRegistry& registry, const RecommendationOrchestrator& orchestrator, std::size_t threadCount);
        ~ComparisonRunner() = default;
        ComparisonRunner(const ComparisonRunner&) = delete;
        ComparisonRunner& operator=(const ComparisonRunner&) = delete;

        std::vector<ComparisonEntry> compare(const std::vector<model::TrackId>& seedIds, const std::vector<ComparisonLabel>& labels, std::optional<std::size_t> count) const;

    private:
        const ModelRegistry& _registry;
        const RecommendationOrchestrator& _orchestrator;
        const std::size_t _threadCount;
    };
} // namespace tracklike::recommendation
