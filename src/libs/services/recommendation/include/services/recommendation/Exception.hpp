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

#include "core/Exception.hpp"

namespace tracklike::recommendation
{
    class Exception : public core::TracklikeException
    {
    public:
        using core::TracklikeException::TracklikeException;
    };

    class VariantNotFoundException : public Exception
    {
    public:
        VariantNotFoundException(const std::string& variantName)
            : Exception{ "Variant '" + variantName + "' not found" }
            , _variantName{ variantName }
        {
        }

        const std::string& getVariantName() const { return _variantName; }

    private:
        std::string _variantName;
    };

    // No variant could be loaded, the service cannot answer any query
    class RegistryEmptyException : public Exception
    {
    public:
        RegistryEmptyException()
            : Exception{ "No model variant loaded" }
        {
        }
    };

    class InvalidQueryException : public Exception
    {
    public:
        using Exception::Exception;
    };
} // namespace tracklike::recommendation
