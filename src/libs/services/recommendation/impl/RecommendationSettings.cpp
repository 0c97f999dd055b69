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

#include "services/recommendation/RecommendationSettings.hpp"

#include <string_view>

#include "core/Exception.hpp"
#include "core/IConfig.hpp"
#include "core/ILogger.hpp"
#include "core/String.hpp"

namespace cine::recommendation
{
    namespace
    {
        // "kind;weight;reason template"
        SharedPropertyCategory parseSharedPropertyCategory(std::string_view str)
        {
            const std::vector<std::string_view> fields{ core::stringUtils::splitString(str, ';') };
            if (fields.size() != 3)
                throw core::CineException{ "Bad shared property entry '" + std::string{ str } + "': expected 'kind;weight;reason'" };

            const std::optional<knowledge::PropertyKind> kind{ knowledge::parsePropertyKind(fields[0]) };
            if (!kind)
                throw core::CineException{ "Bad shared property entry '" + std::string{ str } + "': unknown property kind" };

            const std::optional<double> weight{ core::stringUtils::readAs<double>(core::stringUtils::stringTrim(fields[1])) };
            if (!weight || *weight <= 0)
                throw core::CineException{ "Bad shared property entry '" + std::string{ str } + "': weight must be a positive number" };

            const std::string_view reasonTemplate{ core::stringUtils::stringTrim(fields[2]) };
            if (reasonTemplate.empty())
                throw core::CineException{ "Bad shared property entry '" + std::string{ str } + "': empty reason" };

            return SharedPropertyCategory{ *kind, *weight, std::string{ reasonTemplate } };
        }
    } // namespace

    double RecommendationSettings::getSourceWeight(CandidateSourceKind kind) const
    {
        switch (kind)
        {
        case CandidateSourceKind::GraphPreference:
            return graphPreferenceWeight;
        case CandidateSourceKind::GraphSeed:
            return graphSeedWeight;
        case CandidateSourceKind::EmbeddingSeed:
            return embeddingSeedWeight;
        }
        return 0;
    }

    std::vector<SharedPropertyCategory> RecommendationSettings::getDefaultSharedPropertyCategories()
    {
        return {
            { knowledge::PropertyKind::Genre, 1.0, "shares the genre" },
            { knowledge::PropertyKind::Director, 0.8, "has the same director" },
            { knowledge::PropertyKind::Actor, 0.5, "shares an actor" },
            { knowledge::PropertyKind::Series, 0.9, "is in the same series as" },
            { knowledge::PropertyKind::BasedOn, 0.7, "is based on similar work as" },
        };
    }

    RecommendationSettings loadRecommendationSettings(core::IConfig& config)
    {
        RecommendationSettings settings;

        settings.graphPreferenceWeight = config.getDouble("recommendation-weight-graph-preference", settings.graphPreferenceWeight);
        settings.graphSeedWeight = config.getDouble("recommendation-weight-graph-seed", settings.graphSeedWeight);
        settings.embeddingSeedWeight = config.getDouble("recommendation-weight-embedding-seed", settings.embeddingSeedWeight);
        settings.preferenceMatchScore = config.getDouble("recommendation-preference-match-score", settings.preferenceMatchScore);
        settings.graphQueryLimit = config.getULong("recommendation-graph-query-limit", settings.graphQueryLimit);
        settings.embeddingNeighborCount = config.getULong("recommendation-embedding-neighbor-count", settings.embeddingNeighborCount);
        settings.filterCandidateCap = config.getULong("recommendation-filter-candidate-cap", settings.filterCandidateCap);
        settings.ratingWeight = config.getDouble("recommendation-rating-weight", settings.ratingWeight);
        settings.diversityLambda = config.getDouble("recommendation-diversity-lambda", settings.diversityLambda);
        settings.threadCount = config.getULong("recommendation-thread-count", settings.threadCount);
        settings.externalCallTimeout = std::chrono::milliseconds{ config.getULong("recommendation-external-call-timeout-ms", settings.externalCallTimeout.count()) };

        std::vector<SharedPropertyCategory> categories;
        config.visitStrings("recommendation-shared-properties", [&](std::string_view entry) { categories.push_back(parseSharedPropertyCategory(entry)); }, {});
        if (!categories.empty())
            settings.sharedPropertyCategories = std::move(categories);

        if (!(settings.graphPreferenceWeight > settings.graphSeedWeight && settings.graphSeedWeight > settings.embeddingSeedWeight))
            throw core::CineException{ "recommendation weights must be ordered: graph-preference > graph-seed > embedding-seed" };
        if (settings.diversityLambda < 0 || settings.diversityLambda > 1)
            throw core::CineException{ "recommendation-diversity-lambda must be in [0, 1]" };
        if (settings.threadCount == 0)
            throw core::CineException{ "recommendation-thread-count must be at least 1" };
        if (settings.filterCandidateCap == 0)
            throw core::CineException{ "recommendation-filter-candidate-cap must be at least 1" };

        CINE_LOG(CONFIG, DEBUG, "Recommendation settings: " << settings.sharedPropertyCategories.size() << " shared property categories, "
                                                            << settings.threadCount << " threads, timeout = " << settings.externalCallTimeout.count() << "ms");

        return settings;
    }
} // namespace cine::recommendation
