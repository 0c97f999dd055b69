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

#include <chrono>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>

#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>

#include "core/IOContextRunner.hpp"
#include "services/knowledge/PropertyCatalog.hpp"
#include "services/recommendation/IRecommendationService.hpp"

#include "CandidateAggregator.hpp"
#include "ConstraintFilter.hpp"
#include "DiversitySelector.hpp"
#include "Ranker.hpp"
#include "candidate-sources/EmbeddingCandidateSource.hpp"
#include "candidate-sources/GraphCandidateSource.hpp"

namespace cine::recommendation
{
    class RecommendationService : public IRecommendationService
    {
    public:
        RecommendationService(const knowledge::IGraphStore& graphStore,
                              const knowledge::IVectorIndex& vectorIndex,
                              const knowledge::ILabelResolver& labelResolver,
                              const knowledge::PropertyCatalog& catalog,
                              const RecommendationSettings& settings);
        ~RecommendationService() override = default;
        RecommendationService(const RecommendationService&) = delete;
        RecommendationService& operator=(const RecommendationService&) = delete;

    private:
        RecommendationResult getRecommendations(const session::Session& session, std::size_t maxCount) const override;

        // Snapshot of the session, tasks may outlive the request
        struct GenerationContext
        {
            knowledge::EntitySet seeds;
            session::Preferences preferences;
            knowledge::QueryFilters filters;
            knowledge::EntitySet exclude;
        };

        CandidateMap generateCandidates(const std::shared_ptr<const GenerationContext>& context, std::vector<Degradation>& degradations) const;
        Outcome<CandidateMap> filterCandidates(const CandidateMap& candidates, const knowledge::QueryFilters& filters) const;
        std::vector<Recommendation> format(const RankedList& rankedList) const;

        template<typename Func>
        std::future<std::invoke_result_t<Func>> postTask(Func&& func) const
        {
            using ResultType = std::invoke_result_t<Func>;

            auto task{ std::make_shared<std::packaged_task<ResultType()>>(std::forward<Func>(func)) };
            std::future<ResultType> future{ task->get_future() };
            boost::asio::post(_ioContext, [task] { (*task)(); });

            return future;
        }

        const knowledge::IGraphStore& _graphStore;
        const knowledge::ILabelResolver& _labelResolver;
        const knowledge::PropertyCatalog _catalog;
        const RecommendationSettings _settings;

        const CandidateSource::GraphCandidateSource _graphCandidateSource;
        const CandidateSource::EmbeddingCandidateSource _embeddingCandidateSource;
        const CandidateAggregator _candidateAggregator;
        const ConstraintFilter _constraintFilter;
        const Ranker _ranker;
        const DiversitySelector _diversitySelector;

        mutable boost::asio::io_context _ioContext;
        core::IOContextRunner _ioContextRunner; // must be last, joins the pending tasks first
    };
} // namespace cine::recommendation
