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

#include <gtest/gtest.h>

#include "core/Exception.hpp"
#include "core/IConfig.hpp"
#include "services/recommendation/RecommendationSettings.hpp"

#include "Common.hpp"

namespace cine::recommendation::tests
{
    TEST(RecommendationSettings, defaults)
    {
        const RecommendationSettings settings;

        EXPECT_GT(settings.getSourceWeight(CandidateSourceKind::GraphPreference), settings.getSourceWeight(CandidateSourceKind::GraphSeed));
        EXPECT_GT(settings.getSourceWeight(CandidateSourceKind::GraphSeed), settings.getSourceWeight(CandidateSourceKind::EmbeddingSeed));
        EXPECT_EQ(settings.sharedPropertyCategories, RecommendationSettings::getDefaultSharedPropertyCategories());
    }

    TEST(RecommendationSettings, config)
    {
        const TmpFile file{
            "recommendation-weight-graph-preference = 3.0;\n"
            "recommendation-thread-count = 4;\n"
            "recommendation-external-call-timeout-ms = 250;\n"
            "recommendation-shared-properties = ( \"director;1.5;has the same director\", \"genre;0.5;shares the genre\" );\n"
        };

        const auto config{ core::createConfig(file.getPath()) };
        const RecommendationSettings settings{ loadRecommendationSettings(*config) };

        EXPECT_DOUBLE_EQ(settings.graphPreferenceWeight, 3.0);
        EXPECT_DOUBLE_EQ(settings.graphSeedWeight, 1.0);
        EXPECT_EQ(settings.threadCount, 4);
        EXPECT_EQ(settings.externalCallTimeout, std::chrono::milliseconds{ 250 });
        EXPECT_EQ(settings.sharedPropertyCategories, (std::vector<SharedPropertyCategory>{
                                                         { knowledge::PropertyKind::Director, 1.5, "has the same director" },
                                                         { knowledge::PropertyKind::Genre, 0.5, "shares the genre" },
                                                     }));
    }

    TEST(RecommendationSettings, sourceWeightsMustBeOrdered)
    {
        const char* configs[]{
            "recommendation-weight-graph-seed = 2.5;\n",
            "recommendation-weight-graph-seed = 2.0;\n",
            "recommendation-weight-embedding-seed = 1.0;\n",
            "recommendation-weight-embedding-seed = 1.5;\n",
        };

        for (const char* content : configs)
        {
            const TmpFile file{ content };
            const auto config{ core::createConfig(file.getPath()) };

            EXPECT_THROW(loadRecommendationSettings(*config), core::CineException) << content;
        }
    }

    TEST(RecommendationSettings, badValues)
    {
        const char* configs[]{
            "recommendation-diversity-lambda = 1.5;\n",
            "recommendation-thread-count = 0;\n",
            "recommendation-filter-candidate-cap = 0;\n",
            "recommendation-shared-properties = ( \"mood;1.0;shares the mood\" );\n",
            "recommendation-shared-properties = ( \"genre;-1.0;shares the genre\" );\n",
            "recommendation-shared-properties = ( \"genre;1.0\" );\n",
        };

        for (const char* content : configs)
        {
            const TmpFile file{ content };
            const auto config{ core::createConfig(file.getPath()) };

            EXPECT_THROW(loadRecommendationSettings(*config), core::CineException) << content;
        }
    }
} // namespace cine::recommendation::tests
