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
#include <string>
#include <string_view>
#include <vector>

#include "model/Types.hpp"

namespace tracklike::model
{
    // Descriptive data of a track, shared by all variants
    struct Track
    {
        static constexpr std::string_view unknownArtist{ "Unknown Artist" };

        TrackId id;
        std::string name;
        std::string artist{ unknownArtist };
        std::vector<std::string> genres;
        unsigned popularity{}; // 0-100
        std::optional<std::string> previewUrl;

        bool operator==(const Track& other) const = default;
    };
} // namespace tracklike::model
