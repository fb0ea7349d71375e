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

#include "model/SimilarityIndex.hpp"

#include <algorithm>
#include <queue>

#include "model/Exception.hpp"
#include "model/FeatureStore.hpp"

namespace tracklike::model
{
    namespace
    {
        struct Candidate
        {
            Distance distance;
            std::size_t row;
        };

        // Keeps the count best candidates seen so far, the worst one on top
        class BoundedNeighborQueue
        {
        public:
            BoundedNeighborQueue(std::size_t maxCount, const std::vector<TrackId>& trackIds)
                : _maxCount{ maxCount }
                , _queue{ WorseFirst{ trackIds } }
            {
            }

            void push(const Candidate& candidate)
            {
                if (_queue.size() < _maxCount)
                {
                    _queue.push(candidate);
                }
                else if (_queue.comp(candidate, _queue.top()))
                {
                    _queue.pop();
                    _queue.push(candidate);
                }
            }

            std::vector<Candidate> popAll()
            {
                std::vector<Candidate> res;
                res.reserve(_queue.size());
                while (!_queue.empty())
                {
                    res.push_back(_queue.top());
                    _queue.pop();
                }
                std::reverse(std::begin(res), std::end(res));
                return res;
            }

        private:
            // a < b if a is closer than b, ties broken by ascending track id
            struct WorseFirst
            {
                const std::vector<TrackId>& trackIds;

                bool operator()(const Candidate& a, const Candidate& b) const
                {
                    if (a.distance != b.distance)
                        return a.distance < b.distance;
                    return trackIds[a.row] < trackIds[b.row];
                }
            };

            // exposes the comparator of std::priority_queue
            struct Queue : std::priority_queue<Candidate, std::vector<Candidate>, WorseFirst>
            {
                using std::priority_queue<Candidate, std::vector<Candidate>, WorseFirst>::priority_queue;
                using std::priority_queue<Candidate, std::vector<Candidate>, WorseFirst>::comp;
            };

            const std::size_t _maxCount;
            Queue _queue;
        };

        // Below this ratio of the index size, restricted searches visit the candidates directly
        constexpr std::size_t bruteForceCandidateRatio{ 4 };
    } // namespace

    SimilarityIndex::SimilarityIndex(const FeatureStore& store, Metric metric)
        : _metric{ metric }
        , _dimensionCount{ store.getDimensionCount() }
        , _trackIds{ store.getAllIds() }
    {
        _rowByTrackId.reserve(_trackIds.size());
        _values.reserve(_trackIds.size() * _dimensionCount);

        for (std::size_t row{}; row < _trackIds.size(); ++row)
        {
            const FeatureVector& features{ store.get(_trackIds[row]) };
            _values.insert(std::end(_values), std::cbegin(features), std::cend(features));
            _rowByTrackId.emplace(_trackIds[row], row);
        }
    }

    std::span<const double> SimilarityIndex::getRow(std::size_t row) const
    {
        return std::span<const double>{ _values.data() + row * _dimensionCount, _dimensionCount };
    }

    bool SimilarityIndex::shouldScanCandidates(std::size_t candidateCount) const
    {
        return candidateCount * bruteForceCandidateRatio < _trackIds.size();
    }

    std::vector<Neighbor> SimilarityIndex::findNearest(const FeatureVector& query, std::size_t count, const TrackIdSet& exclude, const TrackIdSet* candidates) const
    {
        if (query.getDimensionCount() != _dimensionCount)
            throw Exception{ "Query has " + std::to_string(query.getDimensionCount()) + " dimensions, expected " + std::to_string(_dimensionCount) };

        std::vector<Neighbor> res;
        if (count == 0)
            return res;

        const std::span<const double> queryValues{ query.getValues() };
        BoundedNeighborQueue queue{ count, _trackIds };

        auto visitRow{ [&](std::size_t row) {
            if (exclude.contains(_trackIds[row]))
                return;

            queue.push(Candidate{ computeDistance(queryValues, getRow(row), _metric), row });
        } };

        if (candidates && shouldScanCandidates(candidates->size()))
        {
            for (const TrackId& trackId : *candidates)
            {
                auto it{ _rowByTrackId.find(trackId) };
                if (it != std::cend(_rowByTrackId))
                    visitRow(it->second);
            }
        }
        else
        {
            for (std::size_t row{}; row < _trackIds.size(); ++row)
            {
                if (candidates && !candidates->contains(_trackIds[row]))
                    continue;

                visitRow(row);
            }
        }

        const std::vector<Candidate> nearest{ queue.popAll() };
        res.reserve(nearest.size());
        for (const Candidate& candidate : nearest)
            res.push_back(Neighbor{ _trackIds[candidate.row], candidate.distance });

        return res;
    }
} // namespace tracklike::model
