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

#include "DiversitySelector.hpp"

#include <algorithm>
#include <limits>
#include <optional>
#include <vector>

#include "core/ILogger.hpp"
#include "services/knowledge/IVectorIndex.hpp"

namespace cine::recommendation
{
    DiversitySelector::DiversitySelector(const knowledge::IVectorIndex& vectorIndex, const RecommendationSettings& settings)
        : _vectorIndex{ vectorIndex }
        , _settings{ settings }
    {
    }

    Outcome<RankedList> DiversitySelector::select(const RankedList& rankedList, std::size_t k) const
    {
        if (rankedList.size() <= k)
            return { rankedList, std::nullopt };

        try
        {
            return { selectMMR(rankedList, k), std::nullopt };
        }
        catch (const std::exception& e)
        {
            CINE_LOG(RECOMMENDATION, ERROR, "Diversification failed, using the top " << k << " entries: " << e.what());
            return { RankedList(std::cbegin(rankedList), std::cbegin(rankedList) + k), Degradation{ DegradationKind::DiversificationFailed, e.what() } };
        }
        catch (...)
        {
            CINE_LOG(RECOMMENDATION, ERROR, "Diversification failed with an unknown error, using the top " << k << " entries");
            return { RankedList(std::cbegin(rankedList), std::cbegin(rankedList) + k), Degradation{ DegradationKind::DiversificationFailed, "unknown error" } };
        }
    }

    RankedList DiversitySelector::selectMMR(const RankedList& rankedList, std::size_t k) const
    {
        RankedList selected;
        if (k == 0)
            return selected;

        const double maxScore{ std::max_element(std::cbegin(rankedList), std::cend(rankedList), [](const RankedEntry& lhs, const RankedEntry& rhs) { return lhs.score < rhs.score; })->score };
        auto computeRelevance{ [&](const RankedEntry& entry) {
            return maxScore > 0 ? entry.score / maxScore : entry.score;
        } };

        struct PoolEntry
        {
            const RankedEntry* entry;
            double relevance;
            knowledge::Embedding embedding;
        };

        // the top entry is always selected, even without embedding
        selected.push_back(rankedList.front());
        std::vector<knowledge::Embedding> selectedEmbeddings;
        if (std::optional<knowledge::Embedding> embedding{ _vectorIndex.getEmbedding(rankedList.front().entityId) })
            selectedEmbeddings.push_back(std::move(*embedding));

        std::vector<PoolEntry> pool;
        for (auto it{ std::next(std::cbegin(rankedList)) }; it != std::cend(rankedList); ++it)
        {
            std::optional<knowledge::Embedding> embedding{ _vectorIndex.getEmbedding(it->entityId) };
            if (!embedding)
                continue;

            pool.push_back(PoolEntry{ &(*it), computeRelevance(*it), std::move(*embedding) });
        }

        const double lambda{ _settings.diversityLambda };
        while (selected.size() < k && !pool.empty())
        {
            auto itBest{ std::end(pool) };
            double bestScore{ -std::numeric_limits<double>::infinity() };

            for (auto it{ std::begin(pool) }; it != std::end(pool); ++it)
            {
                double maxSimilarity{};
                for (const knowledge::Embedding& selectedEmbedding : selectedEmbeddings)
                    maxSimilarity = std::max(maxSimilarity, static_cast<double>(_vectorIndex.computeCosineSimilarity(it->embedding, selectedEmbedding)));

                const double score{ lambda * it->relevance - (1 - lambda) * maxSimilarity };
                if (score > bestScore)
                {
                    bestScore = score;
                    itBest = it;
                }
            }

            if (itBest == std::end(pool))
                break;

            selected.push_back(*itBest->entry);
            selectedEmbeddings.push_back(std::move(itBest->embedding));
            pool.erase(itBest);
        }

        CINE_LOG(RECOMMENDATION, DEBUG, "Selected " << selected.size() << " diverse entries out of " << rankedList.size());

        return selected;
    }
} // namespace cine::recommendation
