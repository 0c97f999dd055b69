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

#include <algorithm>

#include "services/knowledge/PropertyCatalog.hpp"
#include "services/recommendation/IRecommendationService.hpp"
#include "services/session/Session.hpp"

#include "Common.hpp"

namespace cine::recommendation::tests
{
    namespace
    {
        bool hasDegradation(const RecommendationResult& result, DegradationKind kind)
        {
            return std::any_of(std::cbegin(result.degradations), std::cend(result.degradations), [=](const Degradation& degradation) { return degradation.kind == kind; });
        }

        std::vector<knowledge::EntityId> getIds(const RecommendationResult& result)
        {
            std::vector<knowledge::EntityId> res;
            for (const Recommendation& recommendation : result.recommendations)
                res.push_back(recommendation.id);
            return res;
        }
    } // namespace

    class RecommendationServiceTest : public ::testing::Test
    {
    public:
        RecommendationServiceTest()
        {
            store.sharedPropertyRows["P136"] = { createRow("M2", "drama film", 8.0), createRow("M3", "drama film") };
            index.embeddings = { { "M1", { 1, 0 } }, { "M2", { 1, 0.1f } }, { "M3", { 0.5f, 0.5f } }, { "M4", { 0, 1 } } };
            index.neighbors["M1"] = { { "M2", 0.6f }, { "M4", 0.5f } };
            store.labels = { { "M1", "Seed movie" }, { "M2", "Second" }, { "M3", "Third" }, { "M4", "Fourth" }, { "M7", "Seventh" } };
            store.images = { { "M2", "m2.jpg" } };
        }

        std::unique_ptr<IRecommendationService> createService() const
        {
            return createRecommendationService(store, index, store, catalog, settings);
        }

        FakeGraphStore store;
        FakeVectorIndex index;
        const knowledge::PropertyCatalog catalog{ knowledge::createDefaultPropertyCatalog() };
        RecommendationSettings settings;
        session::Session session{ "user" };
    };

    TEST_F(RecommendationServiceTest, noSeedsOrPreferences)
    {
        const auto service{ createService() };

        const RecommendationResult result{ service->getRecommendations(session, 5) };

        EXPECT_EQ(result.status, RecommendationStatus::NoSeedsOrPreferences);
        EXPECT_TRUE(result.recommendations.empty());
        EXPECT_TRUE(store.queriedPatterns.empty());
    }

    TEST_F(RecommendationServiceTest, fromSeeds)
    {
        const auto service{ createService() };
        session.update(session::ParsedIntent{ .seedEntities = { "M1" } });

        const RecommendationResult result{ service->getRecommendations(session, 5) };

        EXPECT_EQ(result.status, RecommendationStatus::Ok);
        EXPECT_TRUE(result.degradations.empty());
        ASSERT_EQ(getIds(result), (std::vector<knowledge::EntityId>{ "M2", "M3", "M4" }));

        const Recommendation& first{ result.recommendations[0] };
        EXPECT_EQ(first.label, "Second");
        EXPECT_NEAR(first.score, 1.0 + 0.6 * 0.1 + 8.0 * 0.02, 1e-6);
        EXPECT_EQ(first.reason, "shares the genre 'drama film'");
        EXPECT_EQ(first.imageId, "m2.jpg");

        EXPECT_DOUBLE_EQ(result.recommendations[1].score, 1.0);
        EXPECT_EQ(result.recommendations[1].imageId, std::nullopt);

        EXPECT_NEAR(result.recommendations[2].score, 0.05, 1e-6);
        EXPECT_EQ(result.recommendations[2].reason, "it's similar to movies you like");

        // the merged candidates are verified in a single batch
        ASSERT_EQ(store.getVerificationCount(), 1);
        EXPECT_EQ(store.verifiedIds.front(), (knowledge::EntitySet{ "M2", "M3", "M4" }));
    }

    TEST_F(RecommendationServiceTest, fromPreferences)
    {
        const auto service{ createService() };
        store.preferenceRows = { createRow("M7", std::nullopt, 5.0) };
        session.update(session::ParsedIntent{ .preferences = { { knowledge::PropertyKind::Genre, "Q_drama" } } });

        const RecommendationResult result{ service->getRecommendations(session, 5) };

        ASSERT_EQ(getIds(result), std::vector<knowledge::EntityId>{ "M7" });
        EXPECT_DOUBLE_EQ(result.recommendations[0].score, 2.0 * 2.0 + 5.0 * 0.02);
        EXPECT_EQ(result.recommendations[0].reason, "it matches your preferences");
    }

    TEST_F(RecommendationServiceTest, maxCount)
    {
        const auto service{ createService() };
        session.update(session::ParsedIntent{ .seedEntities = { "M1" } });

        const RecommendationResult result{ service->getRecommendations(session, 2) };

        ASSERT_EQ(result.recommendations.size(), 2);
        EXPECT_EQ(result.recommendations[0].id, "M2");
    }

    TEST_F(RecommendationServiceTest, excludeListHonored)
    {
        const auto service{ createService() };
        session.update(session::ParsedIntent{ .seedEntities = { "M1" } });
        session.addRecommendations({ "M2" });

        const RecommendationResult result{ service->getRecommendations(session, 5) };

        EXPECT_EQ(getIds(result), (std::vector<knowledge::EntityId>{ "M3", "M4" }));
    }

    TEST_F(RecommendationServiceTest, constraintsReachTheStore)
    {
        const auto service{ createService() };
        session.update(session::ParsedIntent{
            .seedEntities = { "M1" },
            .constraints = { { session::ConstraintKind::Year, session::YearConstraint{ session::Comparison::Greater, 2000 } } },
            .negations = { { knowledge::PropertyKind::Genre, "Q_horror" } },
        });

        const RecommendationResult result{ service->getRecommendations(session, 5) };

        ASSERT_FALSE(store.queriedFilters.empty());
        const knowledge::QueryFilters& filters{ store.queriedFilters.front() };
        EXPECT_EQ(filters.minYear, 2001);
        EXPECT_EQ(filters.excluded, (std::vector<knowledge::PropertyValue>{ { "P136", "Q_horror" } }));

        // same filters at verification time
        ASSERT_EQ(store.getVerificationCount(), 1);
        EXPECT_EQ(store.verifiedFilters.front(), filters);
    }

    TEST_F(RecommendationServiceTest, verificationRemovesInvalidCandidates)
    {
        const auto service{ createService() };
        store.validIds = knowledge::EntitySet{ "M3" };
        session.update(session::ParsedIntent{ .seedEntities = { "M1" } });

        const RecommendationResult result{ service->getRecommendations(session, 5) };

        EXPECT_EQ(getIds(result), std::vector<knowledge::EntityId>{ "M3" });
        EXPECT_TRUE(result.degradations.empty());
    }

    TEST_F(RecommendationServiceTest, verificationFailureFailsOpen)
    {
        const auto service{ createService() };
        store.failVerification = true;
        session.update(session::ParsedIntent{ .seedEntities = { "M1" } });

        const RecommendationResult result{ service->getRecommendations(session, 5) };

        EXPECT_EQ(getIds(result), (std::vector<knowledge::EntityId>{ "M2", "M3", "M4" }));
        EXPECT_TRUE(hasDegradation(result, DegradationKind::FilterVerificationFailed));
    }

    TEST_F(RecommendationServiceTest, verificationTimeoutFailsOpen)
    {
        settings.externalCallTimeout = std::chrono::milliseconds{ 100 };
        store.verifyDelay = std::chrono::milliseconds{ 1000 };
        const auto service{ createService() };
        session.update(session::ParsedIntent{ .seedEntities = { "M1" } });

        const auto start{ std::chrono::steady_clock::now() };
        const RecommendationResult result{ service->getRecommendations(session, 5) };
        EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::milliseconds{ 900 });

        EXPECT_EQ(getIds(result), (std::vector<knowledge::EntityId>{ "M2", "M3", "M4" }));
        EXPECT_TRUE(hasDegradation(result, DegradationKind::FilterVerificationFailed));
    }

    TEST_F(RecommendationServiceTest, sourceTimeout)
    {
        settings.externalCallTimeout = std::chrono::milliseconds{ 100 };
        settings.threadCount = 3;
        store.queryDelay = std::chrono::milliseconds{ 200 };
        const auto service{ createService() };
        session.update(session::ParsedIntent{ .seedEntities = { "M1" } });

        const RecommendationResult result{ service->getRecommendations(session, 5) };

        // the graph source is too slow, the embedding source still contributes
        EXPECT_TRUE(hasDegradation(result, DegradationKind::SourceUnavailable));
        EXPECT_EQ(getIds(result), (std::vector<knowledge::EntityId>{ "M2", "M4" }));
        EXPECT_EQ(result.recommendations[0].reason, "it's similar to movies you like");
    }

    TEST_F(RecommendationServiceTest, slowCategoryIsSkipped)
    {
        settings.externalCallTimeout = std::chrono::milliseconds{ 200 };
        settings.threadCount = 3;
        store.propertyDelays["P161"] = std::chrono::milliseconds{ 400 };
        const auto service{ createService() };
        session.update(session::ParsedIntent{ .seedEntities = { "M1" } });

        const RecommendationResult result{ service->getRecommendations(session, 5) };

        // only the actor query is lost
        EXPECT_EQ(result.status, RecommendationStatus::Ok);
        EXPECT_EQ(getIds(result), (std::vector<knowledge::EntityId>{ "M2", "M3", "M4" }));
        EXPECT_EQ(result.recommendations[0].reason, "shares the genre 'drama film'");
        ASSERT_EQ(result.degradations.size(), 1);
        EXPECT_EQ(result.degradations[0].kind, DegradationKind::SourceUnavailable);
        EXPECT_NE(result.degradations[0].message.find("actor"), std::string::npos);
    }

    TEST_F(RecommendationServiceTest, unknownErrorIsReported)
    {
        index.unknownErrorNeighbors = { "M1" };
        const auto service{ createService() };
        session.update(session::ParsedIntent{ .seedEntities = { "M1" } });

        const RecommendationResult result{ service->getRecommendations(session, 5) };

        EXPECT_EQ(getIds(result), (std::vector<knowledge::EntityId>{ "M2", "M3" }));
        ASSERT_EQ(result.degradations.size(), 1);
        EXPECT_EQ(result.degradations[0].kind, DegradationKind::SourceUnavailable);
    }

    TEST_F(RecommendationServiceTest, failingCategoryDoesNotAbort)
    {
        store.failingProperties = { "P136" };
        store.sharedPropertyRows["P57"] = { createRow("M3", "Some Director") };
        const auto service{ createService() };
        session.update(session::ParsedIntent{ .seedEntities = { "M1" } });

        const RecommendationResult result{ service->getRecommendations(session, 5) };

        EXPECT_EQ(result.status, RecommendationStatus::Ok);
        EXPECT_EQ(getIds(result), (std::vector<knowledge::EntityId>{ "M3", "M2", "M4" }));
        EXPECT_EQ(result.recommendations[0].reason, "has the same director 'Some Director'");
    }

    TEST_F(RecommendationServiceTest, unlabeledEntriesAreDropped)
    {
        store.labels.erase("M3");
        store.failingLabels = { "M4" };
        const auto service{ createService() };
        session.update(session::ParsedIntent{ .seedEntities = { "M1" } });

        const RecommendationResult result{ service->getRecommendations(session, 5) };

        EXPECT_EQ(getIds(result), std::vector<knowledge::EntityId>{ "M2" });
    }

    TEST_F(RecommendationServiceTest, nothingFound)
    {
        store.sharedPropertyRows.clear();
        index.neighbors.clear();
        const auto service{ createService() };
        session.update(session::ParsedIntent{ .seedEntities = { "M1" } });

        const RecommendationResult result{ service->getRecommendations(session, 5) };

        EXPECT_EQ(result.status, RecommendationStatus::NothingFound);
        EXPECT_TRUE(result.recommendations.empty());
        EXPECT_TRUE(result.degradations.empty());
    }

    TEST_F(RecommendationServiceTest, idempotent)
    {
        const auto service{ createService() };
        session.update(session::ParsedIntent{ .seedEntities = { "M1" } });

        const RecommendationResult result1{ service->getRecommendations(session, 2) };
        const RecommendationResult result2{ service->getRecommendations(session, 2) };

        ASSERT_EQ(getIds(result1), getIds(result2));
        for (std::size_t i{}; i < result1.recommendations.size(); ++i)
        {
            EXPECT_DOUBLE_EQ(result1.recommendations[i].score, result2.recommendations[i].score);
            EXPECT_EQ(result1.recommendations[i].reason, result2.recommendations[i].reason);
        }
    }

    TEST_F(RecommendationServiceTest, followUpConversation)
    {
        const auto service{ createService() };
        session.update(session::ParsedIntent{ .seedEntities = { "M1" } });

        const RecommendationResult first{ service->getRecommendations(session, 1) };
        ASSERT_EQ(getIds(first), std::vector<knowledge::EntityId>{ "M2" });
        session.addRecommendations({ "M2" });

        session.update(session::ParsedIntent{ .isFollowUp = true });
        EXPECT_EQ(session.getSeedEntities(), (knowledge::EntitySet{ "M1", "M2" }));

        const RecommendationResult second{ service->getRecommendations(session, 5) };
        for (const Recommendation& recommendation : second.recommendations)
        {
            EXPECT_NE(recommendation.id, "M1");
            EXPECT_NE(recommendation.id, "M2");
        }
    }
} // namespace cine::recommendation::tests
