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

#include <cmath>
#include <span>
#include <vector>

#include "model/Exception.hpp"
#include "model/Types.hpp"

namespace tracklike::model
{
    // Distance between two points of the same dimension, no bound checks
    Distance computeDistance(std::span<const double> a, std::span<const double> b, Metric metric);

    class FeatureVector
    {
    public:
        using value_type = double;

        FeatureVector() = default;
        FeatureVector(std::size_t dimensionCount, value_type defaultValue = value_type{})
            : _values(dimensionCount, defaultValue) {}
        FeatureVector(std::vector<value_type> values)
            : _values{ std::move(values) } {}

        bool hasSameDimension(const FeatureVector& other) const
        {
            return _values.size() == other._values.size();
        }

        std::size_t getDimensionCount() const
        {
            return _values.size();
        }

        value_type& operator[](std::size_t index)
        {
            if (index >= getDimensionCount())
                throw Exception{ "Bad feature index" };

            return _values[index];
        }

        value_type operator[](std::size_t index) const
        {
            if (index >= getDimensionCount())
                throw Exception{ "Bad feature index" };

            return _values[index];
        }

        Distance computeDistance(const FeatureVector& other, Metric metric) const
        {
            if (!hasSameDimension(other))
                throw Exception{ "Not the same dimension count" };

            return model::computeDistance(_values, other._values, metric);
        }

        bool isFinite() const
        {
            for (value_type value : _values)
            {
                if (!std::isfinite(value))
                    return false;
            }
            return true;
        }

        std::span<const value_type> getValues() const { return _values; }

        std::vector<value_type>::const_iterator begin() const { return _values.begin(); }
        std::vector<value_type>::const_iterator end() const { return _values.end(); }

        bool operator==(const FeatureVector& other) const = default;

    private:
        std::vector<value_type> _values;
    };
} // namespace tracklike::model
