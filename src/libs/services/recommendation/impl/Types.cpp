/*
 * Copyright (C) 2025 The Cine developers
 *
 * This file is part of Cine.
 *
 * Cine is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * Cine is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with Cine.  If not, see <http://www.gnu.org/licenses/>.
 */

#include "services/recommendation/Types.hpp"

namespace cine::recommendation
{
    std::string_view getCandidateSourceKindName(CandidateSourceKind kind)
    {
        switch (kind)
        {
        case CandidateSourceKind::GraphPreference:
            return "graph-preference";
        case CandidateSourceKind::GraphSeed:
            return "graph-seed";
        case CandidateSourceKind::EmbeddingSeed:
            return "embedding-seed";
        }
        return "";
    }

    std::string_view getDegradationKindName(DegradationKind kind)
    {
        switch (kind)
        {
        case DegradationKind::SourceUnavailable:
            return "source unavailable";
        case DegradationKind::FilterVerificationFailed:
            return "filter verification failed";
        case DegradationKind::DiversificationFailed:
            return "diversification failed";
        }
        return "";
    }
} // namespace cine::recommendation
