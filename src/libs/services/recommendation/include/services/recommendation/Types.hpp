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

#pragma once

#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include "services/knowledge/Types.hpp"

namespace cine::recommendation
{
    // Entity under consideration, accumulated across candidate sources
    struct Candidate
    {
        double score{};
        std::set<std::string> reasons;
        double qualitySignal{};

        bool operator==(const Candidate&) const = default;
    };

    // ordered by entity id
    using CandidateMap = std::map<knowledge::EntityId, Candidate>;

    enum class CandidateSourceKind
    {
        GraphPreference,
        GraphSeed,
        EmbeddingSeed,
    };

    std::string_view getCandidateSourceKindName(CandidateSourceKind kind);

    struct RankedEntry
    {
        knowledge::EntityId entityId;
        double score{};
        std::string reason;

        bool operator==(const RankedEntry&) const = default;
    };

    using RankedList = std::vector<RankedEntry>;

    enum class DegradationKind
    {
        SourceUnavailable,
        FilterVerificationFailed,
        DiversificationFailed,
    };

    std::string_view getDegradationKindName(DegradationKind kind);

    struct Degradation
    {
        DegradationKind kind;
        std::string message;
    };

    // Result of a pipeline stage, possibly computed through a fallback path
    template<typename T>
    struct Outcome
    {
        T value;
        std::optional<Degradation> degradation;

        bool isDegraded() const { return degradation.has_value(); }
    };

    struct Recommendation
    {
        knowledge::EntityId id;
        std::string label;
        double score{};
        std::string reason;
        std::optional<std::string> imageId;
    };

    enum class RecommendationStatus
    {
        Ok,
        NoSeedsOrPreferences, // nothing to start from
        NothingFound,         // the search ran but returned nothing
    };

    struct RecommendationResult
    {
        RecommendationStatus status{ RecommendationStatus::Ok };
        std::vector<Recommendation> recommendations;
        std::vector<Degradation> degradations;
    };
} // namespace cine::recommendation
