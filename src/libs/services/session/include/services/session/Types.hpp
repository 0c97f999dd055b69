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
#include <string>
#include <string_view>
#include <variant>

#include "services/knowledge/Types.hpp"

namespace cine::session
{
    using UserId = std::string;

    // property kind -> entity, one entry per kind
    using Preferences = std::map<knowledge::PropertyKind, knowledge::EntityId>;
    using Negations = std::map<knowledge::PropertyKind, knowledge::EntityId>;

    enum class Comparison
    {
        Less,
        LessOrEqual,
        Equal,
        GreaterOrEqual,
        Greater,
    };

    std::optional<Comparison> parseComparison(std::string_view str);
    std::string_view getComparisonSymbol(Comparison comparison);

    struct YearConstraint
    {
        Comparison comparison{ Comparison::Equal };
        int year{};

        bool operator==(const YearConstraint&) const = default;
    };

    // inclusive bounds
    struct YearRangeConstraint
    {
        int start{};
        int end{};

        bool operator==(const YearRangeConstraint&) const = default;
    };

    struct LanguageConstraint
    {
        knowledge::EntityId language;

        bool operator==(const LanguageConstraint&) const = default;
    };

    struct MinRatingConstraint
    {
        double threshold{};

        bool operator==(const MinRatingConstraint&) const = default;
    };

    using Constraint = std::variant<YearConstraint, YearRangeConstraint, LanguageConstraint, MinRatingConstraint>;

    enum class ConstraintKind
    {
        Year,
        YearRange,
        Language,
        MinRating,
    };

    ConstraintKind getConstraintKind(const Constraint& constraint);

    // one entry per kind
    using Constraints = std::map<ConstraintKind, Constraint>;

    // Output of the intent parser for one user message
    struct ParsedIntent
    {
        knowledge::EntitySet seedEntities;
        Preferences preferences;
        Constraints constraints;
        Negations negations;
        bool isFollowUp{};
    };

    struct Turn
    {
        std::string request;
        std::string response;
    };
} // namespace cine::session
