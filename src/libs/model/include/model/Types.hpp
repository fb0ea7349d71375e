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

#include <string>
#include <unordered_set>

namespace tracklike::model
{
    using TrackId = std::string;
    using TrackIdSet = std::unordered_set<TrackId>;

    using ClusterId = long;
    // Tracks the clustering left unassigned
    static constexpr ClusterId noiseClusterId{ -1 };

    using Distance = double;

    enum class Metric
    {
        Euclidean,
        Manhattan,
    };
} // namespace tracklike::model
