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
#include "model/Types.hpp"

namespace tracklike::model
{
    class Exception : public core::TracklikeException
    {
    public:
        using core::TracklikeException::TracklikeException;
    };

    class UnknownTrackException : public Exception
    {
    public:
        UnknownTrackException(const TrackId& trackId)
            : Exception{ "Unknown track '" + trackId + "'" }
            , _trackId{ trackId }
        {
        }

        const TrackId& getTrackId() const { return _trackId; }

    private:
        TrackId _trackId;
    };

    class UnknownClusterException : public Exception
    {
    public:
        UnknownClusterException(ClusterId clusterId)
            : Exception{ "Unknown cluster " + std::to_string(clusterId) }
            , _clusterId{ clusterId }
        {
        }

        ClusterId getClusterId() const { return _clusterId; }

    private:
        ClusterId _clusterId;
    };

    class VariantLoadException : public Exception
    {
    public:
        enum class Kind
        {
            MissingFile,
            SchemaMismatch,
            CorruptArtifact,
        };

        VariantLoadException(const std::string& variantName, Kind kind, const std::string& details)
            : Exception{ "Cannot load variant '" + variantName + "': " + getKindName(kind) + ": " + details }
            , _variantName{ variantName }
            , _kind{ kind }
        {
        }

        const std::string& getVariantName() const { return _variantName; }
        Kind getKind() const { return _kind; }

        static const char* getKindName(Kind kind)
        {
            switch (kind)
            {
            case Kind::MissingFile:
                return "missing file";
            case Kind::SchemaMismatch:
                return "schema mismatch";
            case Kind::CorruptArtifact:
                return "corrupt artifact";
            }
            return "";
        }

    private:
        std::string _variantName;
        Kind _kind;
    };
} // namespace tracklike::model
