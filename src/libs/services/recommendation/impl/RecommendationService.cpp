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

#include "RecommendationService.hpp"

#include "core/ILogger.hpp"
#include "services/knowledge/IGraphStore.hpp"
#include "services/knowledge/ILabelResolver.hpp"
#include "services/knowledge/IVectorIndex.hpp"
#include "services/session/Session.hpp"

#include "QueryFilters.hpp"

namespace cine::recommendation
{
    namespace
    {
        template<typename T>
        std::optional<T> waitResult(std::future<T>& future, std::chrono::steady_clock::time_point deadline, const std::string& taskName, std::vector<Degradation>& degradations, DegradationKind degradationKind)
        {
            if (future.wait_until(deadline) != std::future_status::ready)
            {
                CINE_LOG(RECOMMENDATION, ERROR, "Timeout while waiting for " << taskName);
                degradations.push_back(Degradation{ degradationKind, taskName + ": timeout" });
                return std::nullopt;
            }

            try
            {
                return future.get();
            }
            catch (const std::exception& e)
            {
                CINE_LOG(RECOMMENDATION, ERROR, "Error in " << taskName << ": " << e.what());
                degradations.push_back(Degradation{ degradationKind, taskName + ": " + e.what() });
            }
            catch (...)
            {
                CINE_LOG(RECOMMENDATION, ERROR, "Unknown error in " << taskName);
                degradations.push_back(Degradation{ degradationKind, taskName + ": unknown error" });
            }

            return std::nullopt;
        }
    } // namespace

    std::unique_ptr<IRecommendationService> createRecommendationService(const knowledge::IGraphStore& graphStore,
                                                                        const knowledge::IVectorIndex& vectorIndex,
                                                                        const knowledge::ILabelResolver& labelResolver,
                                                                        const knowledge::PropertyCatalog& catalog,
                                                                        const RecommendationSettings& settings)
    {
        return std::make_unique<RecommendationService>(graphStore, vectorIndex, labelResolver, catalog, settings);
    }

    RecommendationService::RecommendationService(const knowledge::IGraphStore& graphStore,
                                                 const knowledge::IVectorIndex& vectorIndex,
                                                 const knowledge::ILabelResolver& labelResolver,
                                                 const knowledge::PropertyCatalog& catalog,
                                                 const RecommendationSettings& settings)
        : _graphStore{ graphStore }
        , _labelResolver{ labelResolver }
        , _catalog{ catalog }
        , _settings{ settings }
        , _graphCandidateSource{ graphStore, _catalog, _settings }
        , _embeddingCandidateSource{ vectorIndex, _settings }
        , _candidateAggregator{ _settings }
        , _constraintFilter{ graphStore, _settings }
        , _ranker{ _settings }
        , _diversitySelector{ vectorIndex, _settings }
        , _ioContextRunner{ _ioContext, _settings.threadCount, "Recommendation" }
    {
        CINE_LOG(RECOMMENDATION, INFO, "Recommendation service started, " << _settings.sharedPropertyCategories.size() << " shared property categories");
    }

    RecommendationResult RecommendationService::getRecommendations(const session::Session& session, std::size_t maxCount) const
    {
        CINE_LOG(RECOMMENDATION, DEBUG, "Getting " << maxCount << " recommendations for user '" << session.getUserId() << "'");

        RecommendationResult result;
        if (!session.hasSeedsOrPreferences())
        {
            result.status = RecommendationStatus::NoSeedsOrPreferences;
            return result;
        }

        auto context{ std::make_shared<GenerationContext>() };
        context->seeds = session.getSeedEntities();
        context->preferences = session.getPreferences();
        context->filters = createQueryFilters(session.getConstraints(), session.getNegations(), _catalog);
        context->exclude = session.getExcludeList();

        const CandidateMap candidates{ generateCandidates(context, result.degradations) };
        CINE_LOG(RECOMMENDATION, DEBUG, "Generated " << candidates.size() << " raw candidates");

        Outcome<CandidateMap> filteredCandidates{ filterCandidates(candidates, context->filters) };
        if (filteredCandidates.degradation)
            result.degradations.push_back(*filteredCandidates.degradation);

        const RankedList rankedList{ _ranker.rank(filteredCandidates.value) };

        Outcome<RankedList> diversifiedList{ _diversitySelector.select(rankedList, maxCount) };
        if (diversifiedList.degradation)
            result.degradations.push_back(*diversifiedList.degradation);

        result.recommendations = format(diversifiedList.value);
        result.status = result.recommendations.empty() ? RecommendationStatus::NothingFound : RecommendationStatus::Ok;

        CINE_LOG(RECOMMENDATION, INFO, "User '" << session.getUserId() << "': " << result.recommendations.size() << " recommendations, " << result.degradations.size() << " degradations");

        return result;
    }

    CandidateMap RecommendationService::generateCandidates(const std::shared_ptr<const GenerationContext>& context, std::vector<Degradation>& degradations) const
    {
        struct PendingCall
        {
            std::string name;
            CandidateSourceKind sourceKind;
            std::future<CandidateMap> future;
        };

        // one task per external call, the fast embedding lookups first
        std::vector<PendingCall> calls;
        for (const knowledge::EntityId& seed : context->seeds)
        {
            calls.push_back(PendingCall{ std::string{ getCandidateSourceKindName(CandidateSourceKind::EmbeddingSeed) } + " '" + seed + "'",
                                         CandidateSourceKind::EmbeddingSeed,
                                         postTask([this, context, seed] { return _embeddingCandidateSource.findFromSeed(seed, context->exclude); }) });
        }

        if (!context->preferences.empty())
        {
            calls.push_back(PendingCall{ std::string{ getCandidateSourceKindName(CandidateSourceKind::GraphPreference) },
                                         CandidateSourceKind::GraphPreference,
                                         postTask([this, context] { return _graphCandidateSource.findFromPreferences(context->preferences, context->filters, context->exclude); }) });
        }

        if (!context->seeds.empty())
        {
            for (const SharedPropertyCategory& category : _settings.sharedPropertyCategories)
            {
                calls.push_back(PendingCall{ std::string{ getCandidateSourceKindName(CandidateSourceKind::GraphSeed) } + " '" + std::string{ knowledge::getPropertyKindName(category.kind) } + "'",
                                             CandidateSourceKind::GraphSeed,
                                             postTask([this, context, &category] { return _graphCandidateSource.findFromCategory(category, context->seeds, context->filters, context->exclude); }) });
            }
        }

        // the calls run concurrently, each one is bounded by the timeout from its issue
        const auto deadline{ std::chrono::steady_clock::now() + _settings.externalCallTimeout };

        CandidateMap candidates;
        for (const CandidateSourceKind sourceKind : { CandidateSourceKind::GraphSeed, CandidateSourceKind::EmbeddingSeed, CandidateSourceKind::GraphPreference })
        {
            for (PendingCall& call : calls)
            {
                if (call.sourceKind != sourceKind)
                    continue;

                if (std::optional<CandidateMap> callCandidates{ waitResult(call.future, deadline, call.name, degradations, DegradationKind::SourceUnavailable) })
                    _candidateAggregator.merge(candidates, *callCandidates, sourceKind);
            }
        }

        return candidates;
    }

    Outcome<CandidateMap> RecommendationService::filterCandidates(const CandidateMap& candidates, const knowledge::QueryFilters& filters) const
    {
        if (candidates.empty())
            return { candidates, std::nullopt };

        auto future{ postTask([this, candidates, filters] { return _constraintFilter.filter(candidates, filters); }) };

        std::vector<Degradation> degradations;
        std::optional<Outcome<CandidateMap>> outcome{ waitResult(future, std::chrono::steady_clock::now() + _settings.externalCallTimeout, "candidate verification", degradations, DegradationKind::FilterVerificationFailed) };
        if (!outcome)
            return { candidates, degradations.front() };

        return std::move(*outcome);
    }

    std::vector<Recommendation> RecommendationService::format(const RankedList& rankedList) const
    {
        std::vector<Recommendation> recommendations;
        recommendations.reserve(rankedList.size());

        for (const RankedEntry& entry : rankedList)
        {
            Recommendation recommendation;
            recommendation.id = entry.entityId;
            recommendation.score = entry.score;
            recommendation.reason = entry.reason;

            try
            {
                std::optional<std::string> label{ _labelResolver.getLabel(entry.entityId) };
                if (!label || label->empty())
                {
                    CINE_LOG(RECOMMENDATION, DEBUG, "No label for '" << entry.entityId << "', skipping");
                    continue;
                }
                recommendation.label = std::move(*label);
            }
            catch (const std::exception& e)
            {
                CINE_LOG(RECOMMENDATION, WARNING, "Cannot get label for '" << entry.entityId << "': " << e.what());
                continue;
            }
            catch (...)
            {
                CINE_LOG(RECOMMENDATION, WARNING, "Cannot get label for '" << entry.entityId << "': unknown error");
                continue;
            }

            try
            {
                recommendation.imageId = _graphStore.getImage(entry.entityId);
            }
            catch (const std::exception& e)
            {
                CINE_LOG(RECOMMENDATION, WARNING, "Cannot get image for '" << entry.entityId << "': " << e.what());
            }
            catch (...)
            {
                CINE_LOG(RECOMMENDATION, WARNING, "Cannot get image for '" << entry.entityId << "': unknown error");
            }

            recommendations.push_back(std::move(recommendation));
        }

        return recommendations;
    }
} // namespace cine::recommendation
