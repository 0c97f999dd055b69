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

#include "services/knowledge/PropertyCatalog.hpp"
#include "services/knowledge/Types.hpp"
#include "services/recommendation/RecommendationSettings.hpp"
#include "services/recommendation/Types.hpp"
#include "services/session/Types.hpp"

namespace cine::knowledge
{
    class IGraphStore;
}

namespace cine::recommendation::CandidateSource
{
    // Candidates sharing structured properties with the seeds, or matching explicit preferences
    class GraphCandidateSource
    {
    public:
        GraphCandidateSource(const knowledge::IGraphStore& graphStore, const knowledge::PropertyCatalog& catalog, const RecommendationSettings& settings);
        ~GraphCandidateSource() = default;
        GraphCandidateSource(const GraphCandidateSource&) = delete;
        GraphCandidateSource& operator=(const GraphCandidateSource&) = delete;

        // one query per shared property category, a failing category is skipped
        CandidateMap findFromSeeds(const knowledge::EntitySet& seeds, const knowledge::QueryFilters& filters, const knowledge::EntitySet& exclude) const;

        // single category query, throws on store failure
        CandidateMap findFromCategory(const SharedPropertyCategory& category, const knowledge::EntitySet& seeds, const knowledge::QueryFilters& filters, const knowledge::EntitySet& exclude) const;

        // a single query requiring all the preferred values
        CandidateMap findFromPreferences(const session::Preferences& preferences, const knowledge::QueryFilters& filters, const knowledge::EntitySet& exclude) const;

        static constexpr std::string_view preferenceReason{ "it matches your preferences" };
        static constexpr std::string_view unknownValueLabel{ "a shared property" };

    private:
        const knowledge::IGraphStore& _graphStore;
        const knowledge::PropertyCatalog& _catalog;
        const RecommendationSettings& _settings;
    };
} // namespace cine::recommendation::CandidateSource
