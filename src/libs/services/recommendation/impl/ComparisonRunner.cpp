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

#include "ComparisonRunner.hpp"

#include <algorithm>
#include <chrono>

#include "core/IJob.hpp"
#include "core/IJobScheduler.hpp"
#include "core/ILogger.hpp"
#include "model/Exception.hpp"
#include "services/recommendation/Exception.hpp"

#include "ModelRegistry.hpp"
#include "RecommendationOrchestrator.hpp"

namespace tracklike::recommendation
{
    namespace
    {
        struct ComparisonContext
        {
            const ModelRegistry& registry;
            const RecommendationOrchestrator& orchestrator;
            const std::vector<model::TrackId>& seedIds;
            std::optional<std::size_t> count;
            model::ModelVariantPtr activeVariant; // captured once for all the labels
        };

        ComparisonEntry runLabel(const ComparisonContext& context, const ComparisonLabel& label)
        {
            ComparisonEntry entry;
            entry.label = label;

            const auto start{ std::chrono::steady_clock::now() };
            try
            {
                model::ModelVariantPtr variant{ label.variantName ? context.registry.get(*label.variantName) : context.activeVariant };
                if (!variant)
                    throw RegistryEmptyException{};

                entry.result = context.orchestrator.recommend(*variant, context.seedIds, label.strategy, context.count);
            }
            catch (const VariantNotFoundException& e)
            {
                entry.error = ComparisonError{ ComparisonErrorKind::VariantNotFound, e.what() };
            }
            catch (const RegistryEmptyException& e)
            {
                entry.error = ComparisonError{ ComparisonErrorKind::RegistryEmpty, e.what() };
            }
            catch (const model::UnknownTrackException& e)
            {
                entry.error = ComparisonError{ ComparisonErrorKind::UnknownTrack, e.what() };
            }
            catch (const InvalidQueryException& e)
            {
                entry.error = ComparisonError{ ComparisonErrorKind::InvalidQuery, e.what() };
            }
            catch (const core::TracklikeException& e)
            {
                TRACKLIKE_LOG(RECOMMENDATION, ERROR, "Comparison label '" << label.variantName.value_or("<active>") << "/" << toString(label.strategy) << "' raised an unexpected error: " << e.what());
                entry.error = ComparisonError{ ComparisonErrorKind::Internal, e.what() };
            }
            entry.elapsed = std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() - start);

            TRACKLIKE_LOG_IF(RECOMMENDATION, DEBUG, entry.error.has_value(), "Comparison label '" << label.variantName.value_or("<active>") << "/" << toString(label.strategy) << "' failed: " << toString(entry.error->kind) << ": " << entry.error->message);

            return entry;
        }

        class CompareLabelJob : public core::IJob
        {
        public:
            CompareLabelJob(const ComparisonContext& context, const ComparisonLabel& label, std::size_t labelIndex)
                : _context{ context }
                , _label{ label }
                , _labelIndex{ labelIndex }
            {
            }

            std::size_t getLabelIndex() const { return _labelIndex; }
            ComparisonEntry& getEntry() { return _entry; }

        private:
            core::LiteralString getName() const override { return "Compare Label"; }
            void run() override
            {
                _entry = runLabel(_context, _label);
            }

            const ComparisonContext& _context;
            const ComparisonLabel& _label;
            const std::size_t _labelIndex;
            ComparisonEntry _entry;
        };
    } // namespace

    ComparisonRunner::ComparisonRunner(const ModelRegistry& registry, const RecommendationOrchestrator& orchestrator, std::size_t threadCount)
        : _registry{ registry }
        , _orchestrator{ orchestrator }
        , _threadCount{ threadCount }
    {
    }

    std::vector<ComparisonEntry> ComparisonRunner::compare(const std::vector<model::TrackId>& seedIds, const std::vector<ComparisonLabel>& labels, std::optional<std::size_t> count) const
    {
        if (seedIds.empty())
            throw InvalidQueryException{ "No seed track" };

        ComparisonContext context{ _registry, _orchestrator, seedIds, count, {} };
        if (!_registry.empty())
            context.activeVariant = _registry.getActive();

        std::vector<ComparisonEntry> entries;
        entries.reserve(labels.size());

        if (_threadCount <= 1 || labels.size() <= 1)
        {
            for (const ComparisonLabel& label : labels)
                entries.push_back(runLabel(context, label));

            return entries;
        }

        auto scheduler{ core::createJobScheduler("Comparison", std::min(_threadCount, labels.size())) };
        for (std::size_t i{}; i < labels.size(); ++i)
            scheduler->scheduleJob(std::make_unique<CompareLabelJob>(context, labels[i], i));

        scheduler->wait();

        std::vector<std::unique_ptr<core::IJob>> doneJobs;
        scheduler->popJobsDone(doneJobs, labels.size());

        entries.resize(labels.size());
        for (const std::unique_ptr<core::IJob>& job : doneJobs)
        {
            auto& compareJob{ static_cast<CompareLabelJob&>(*job) };
            entries[compareJob.getLabelIndex()] = std::move(compareJob.getEntry());
        }

        return entries;
    }
} // namespace tracklike::recommendation
