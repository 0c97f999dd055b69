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

#include "services/knowledge/PropertyCatalog.hpp"

#include "candidate-sources/EmbeddingCandidateSource.hpp"
#include "candidate-sources/GraphCandidateSource.hpp"

#include "Common.hpp"

namespace cine::recommendation::tests
{
    using CandidateSource::EmbeddingCandidateSource;
    using CandidateSource::GraphCandidateSource;

    class GraphCandidateSourceTest : public ::testing::Test
    {
    public:
        FakeGraphStore store;
        const knowledge::PropertyCatalog catalog{ knowledge::createDefaultPropertyCatalog() };
        const RecommendationSettings settings;
        const GraphCandidateSource source{ store, catalog, settings };
        const knowledge::QueryFilters filters{ .requiredType = knowledge::PropertyValue{ "P31", "Q11424" } };
    };

    TEST_F(GraphCandidateSourceTest, sharedProperties)
    {
        store.sharedPropertyRows["P136"] = { createRow("M2", "drama film", 7.5), createRow("M3", "drama film") };
        store.sharedPropertyRows["P57"] = { createRow("M2", "Some Director", 8.0) };

        const CandidateMap candidates{ source.findFromSeeds({ "M1" }, filters, { "M1" }) };

        ASSERT_EQ(candidates.size(), 2);
        EXPECT_DOUBLE_EQ(candidates.at("M2").score, 1.0 + 0.8);
        EXPECT_EQ(candidates.at("M2").reasons, (std::set<std::string>{ "shares the genre 'drama film'", "has the same director 'Some Director'" }));
        EXPECT_DOUBLE_EQ(candidates.at("M2").qualitySignal, 8.0);
        EXPECT_DOUBLE_EQ(candidates.at("M3").score, 1.0);
        EXPECT_DOUBLE_EQ(candidates.at("M3").qualitySignal, 0);

        // one query per category, carrying the filters and the limit
        ASSERT_EQ(store.queriedPatterns.size(), settings.sharedPropertyCategories.size());
        for (std::size_t i{}; i < store.queriedPatterns.size(); ++i)
        {
            const auto& pattern{ std::get<knowledge::SharedPropertyPattern>(store.queriedPatterns[i]) };
            EXPECT_EQ(pattern.seeds, knowledge::EntitySet{ "M1" });
            EXPECT_EQ(pattern.limit, settings.graphQueryLimit);
            EXPECT_EQ(pattern.property, catalog.getProperty(settings.sharedPropertyCategories[i].kind));
            EXPECT_EQ(store.queriedFilters[i], filters);
        }
    }

    TEST_F(GraphCandidateSourceTest, sameValueSharedSeveralTimes)
    {
        store.sharedPropertyRows["P161"] = { createRow("M2", "Actor A"), createRow("M2", "Actor B") };

        const CandidateMap candidates{ source.findFromSeeds({ "M1" }, filters, {}) };

        EXPECT_DOUBLE_EQ(candidates.at("M2").score, 0.5 + 0.5);
        EXPECT_EQ(candidates.at("M2").reasons.size(), 2);
    }

    TEST_F(GraphCandidateSourceTest, missingLabel)
    {
        store.sharedPropertyRows["P179"] = { createRow("M2") };

        const CandidateMap candidates{ source.findFromSeeds({ "M1" }, filters, {}) };

        EXPECT_EQ(candidates.at("M2").reasons, std::set<std::string>{ "is in the same series as 'a shared property'" });
    }

    TEST_F(GraphCandidateSourceTest, failingCategoryIsSkipped)
    {
        store.sharedPropertyRows["P136"] = { createRow("M2", "drama film") };
        store.sharedPropertyRows["P57"] = { createRow("M3", "Some Director") };
        store.failingProperties = { "P136" };

        const CandidateMap candidates{ source.findFromSeeds({ "M1" }, filters, {}) };

        ASSERT_EQ(candidates.size(), 1);
        EXPECT_TRUE(candidates.contains("M3"));
        EXPECT_EQ(store.queriedPatterns.size(), settings.sharedPropertyCategories.size());
    }

    TEST_F(GraphCandidateSourceTest, singleCategory)
    {
        store.sharedPropertyRows["P57"] = { createRow("M2", "Some Director", 8.0) };
        store.failingProperties = { "P136" };
        const SharedPropertyCategory director{ knowledge::PropertyKind::Director, 0.8, "has the same director" };
        const SharedPropertyCategory genre{ knowledge::PropertyKind::Genre, 1.0, "shares the genre" };

        const CandidateMap candidates{ source.findFromCategory(director, { "M1" }, filters, { "M1" }) };
        ASSERT_EQ(candidates.size(), 1);
        EXPECT_DOUBLE_EQ(candidates.at("M2").score, 0.8);
        EXPECT_EQ(candidates.at("M2").reasons, std::set<std::string>{ "has the same director 'Some Director'" });

        // failures are left to the caller
        EXPECT_THROW(source.findFromCategory(genre, { "M1" }, filters, {}), knowledge::Exception);
    }

    TEST_F(GraphCandidateSourceTest, excludedEntitiesNeverReturned)
    {
        // store ignoring the exclusion
        store.sharedPropertyRows["P136"] = { createRow("M2", "drama film"), createRow("M3", "drama film") };
        store.preferenceRows = { createRow("M2"), createRow("M4") };

        const CandidateMap fromSeeds{ source.findFromSeeds({ "M1" }, filters, { "M1", "M2" }) };
        EXPECT_FALSE(fromSeeds.contains("M2"));
        EXPECT_TRUE(fromSeeds.contains("M3"));

        const CandidateMap fromPreferences{ source.findFromPreferences({ { knowledge::PropertyKind::Genre, "Q_drama" } }, filters, { "M2" }) };
        EXPECT_FALSE(fromPreferences.contains("M2"));
        EXPECT_TRUE(fromPreferences.contains("M4"));
    }

    TEST_F(GraphCandidateSourceTest, noSeeds)
    {
        EXPECT_TRUE(source.findFromSeeds({}, filters, {}).empty());
        EXPECT_TRUE(store.queriedPatterns.empty());
    }

    TEST_F(GraphCandidateSourceTest, preferences)
    {
        store.preferenceRows = { createRow("M2", std::nullopt, 6.0), createRow("M3") };

        const CandidateMap candidates{ source.findFromPreferences({ { knowledge::PropertyKind::Genre, "Q_drama" }, { knowledge::PropertyKind::Director, "Q_nolan" } }, filters, {}) };

        ASSERT_EQ(candidates.size(), 2);
        EXPECT_DOUBLE_EQ(candidates.at("M2").score, settings.preferenceMatchScore);
        EXPECT_EQ(candidates.at("M2").reasons, std::set<std::string>{ "it matches your preferences" });
        EXPECT_DOUBLE_EQ(candidates.at("M2").qualitySignal, 6.0);

        // a single query requiring every preference at once
        ASSERT_EQ(store.queriedPatterns.size(), 1);
        const auto& pattern{ std::get<knowledge::PropertyMatchPattern>(store.queriedPatterns.front()) };
        EXPECT_EQ(pattern.required, (std::vector<knowledge::PropertyValue>{ { "P136", "Q_drama" }, { "P57", "Q_nolan" } }));
        EXPECT_EQ(pattern.limit, settings.graphQueryLimit);
    }

    TEST_F(GraphCandidateSourceTest, preferenceMatchOutweighsCategories)
    {
        for (const SharedPropertyCategory& category : settings.sharedPropertyCategories)
            EXPECT_GT(settings.preferenceMatchScore, category.weight);
    }

    TEST(GraphCandidateSource, unmappedPreferencesAreIgnored)
    {
        FakeGraphStore store;
        knowledge::PropertyCatalog catalog{ knowledge::createDefaultPropertyCatalog() };
        catalog.properties.erase(knowledge::PropertyKind::Composer);
        const RecommendationSettings settings;
        const GraphCandidateSource source{ store, catalog, settings };

        EXPECT_TRUE(source.findFromPreferences({ { knowledge::PropertyKind::Composer, "Q_zimmer" } }, {}, {}).empty());
        EXPECT_TRUE(store.queriedPatterns.empty());
    }

    TEST_F(GraphCandidateSourceTest, failingPreferenceQuery)
    {
        store.failPreferenceQuery = true;

        EXPECT_TRUE(source.findFromPreferences({ { knowledge::PropertyKind::Genre, "Q_drama" } }, filters, {}).empty());
    }

    class EmbeddingCandidateSourceTest : public ::testing::Test
    {
    public:
        FakeVectorIndex index;
        const RecommendationSettings settings;
        const EmbeddingCandidateSource source{ index, settings };
    };

    TEST_F(EmbeddingCandidateSourceTest, similaritiesAreSummed)
    {
        index.embeddings = { { "M1", { 1, 0 } }, { "M5", { 0, 1 } } };
        index.neighbors["M1"] = { { "M2", 0.6f }, { "M3", 0.4f } };
        index.neighbors["M5"] = { { "M2", 0.3f } };

        const CandidateMap candidates{ source.findFromSeeds({ "M1", "M5" }, { "M1", "M5" }) };

        ASSERT_EQ(candidates.size(), 2);
        EXPECT_NEAR(candidates.at("M2").score, 0.9, 1e-6);
        EXPECT_NEAR(candidates.at("M3").score, 0.4, 1e-6);
        EXPECT_EQ(candidates.at("M2").reasons, std::set<std::string>{ "it's similar to movies you like" });
        EXPECT_DOUBLE_EQ(candidates.at("M2").qualitySignal, 0);
    }

    TEST_F(EmbeddingCandidateSourceTest, seedsWithoutEmbeddingAreSkipped)
    {
        index.embeddings = { { "M1", { 1, 0 } } };
        index.neighbors["M1"] = { { "M2", 0.6f } };
        index.neighbors["M9"] = { { "M3", 0.9f } };

        const CandidateMap candidates{ source.findFromSeeds({ "M1", "M9" }, {}) };

        ASSERT_EQ(candidates.size(), 1);
        EXPECT_TRUE(candidates.contains("M2"));
    }

    TEST_F(EmbeddingCandidateSourceTest, excludedEntitiesNeverReturned)
    {
        index.embeddings = { { "M1", { 1, 0 } } };
        index.neighbors["M1"] = { { "M2", 0.6f }, { "M3", 0.4f } };

        const CandidateMap candidates{ source.findFromSeeds({ "M1" }, { "M1", "M2" }) };

        EXPECT_FALSE(candidates.contains("M2"));
        EXPECT_TRUE(candidates.contains("M3"));
    }

    TEST_F(EmbeddingCandidateSourceTest, failingLookupIsSkipped)
    {
        index.embeddings = { { "M1", { 1, 0 } }, { "M5", { 0, 1 } } };
        index.neighbors["M5"] = { { "M3", 0.4f } };
        index.failingNeighbors = { "M1" };

        const CandidateMap candidates{ source.findFromSeeds({ "M1", "M5" }, {}) };

        ASSERT_EQ(candidates.size(), 1);
        EXPECT_TRUE(candidates.contains("M3"));
    }

    TEST_F(EmbeddingCandidateSourceTest, singleSeed)
    {
        index.embeddings = { { "M1", { 1, 0 } } };
        index.neighbors["M1"] = { { "M2", 0.6f } };
        index.failingNeighbors = { "M5" };
        index.embeddings["M5"] = { 0, 1 };

        const CandidateMap candidates{ source.findFromSeed("M1", { "M1" }) };
        ASSERT_EQ(candidates.size(), 1);
        EXPECT_NEAR(candidates.at("M2").score, 0.6, 1e-6);

        EXPECT_TRUE(source.findFromSeed("M9", {}).empty());
        EXPECT_THROW(source.findFromSeed("M5", {}), knowledge::Exception);
    }

    TEST_F(EmbeddingCandidateSourceTest, neighborCount)
    {
        index.embeddings = { { "M1", { 1, 0 } } };
        for (std::size_t i{}; i < 50; ++i)
            index.neighbors["M1"].push_back({ "N" + std::to_string(i), 0.5f });

        EXPECT_EQ(source.findFromSeeds({ "M1" }, {}).size(), settings.embeddingNeighborCount);
    }
} // namespace cine::recommendation::tests
