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

#include "model/FeatureVector.hpp"

namespace tracklike::model
{
    Distance computeDistance(std::span<const double> a, std::span<const double> b, Metric metric)
    {
        Distance res{};

        switch (metric)
        {
        case Metric::Euclidean:
            for (std::size_t i{}; i < a.size(); ++i)
            {
                const double diff{ a[i] - b[i] };
                res += diff * diff;
            }
            return std::sqrt(res);

        case Metric::Manhattan:
            for (std::size_t i{}; i < a.size(); ++i)
                res += std::abs(a[i] - b[i]);
            return res;
        }

        return res;
    }
} // namespace tracklike::model
