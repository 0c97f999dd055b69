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

#include "InMemoryVectorIndex.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <iterator>
#include <numeric>

#include "core/ILogger.hpp"
#include "core/String.hpp"
#include "services/knowledge/Exception.hpp"

namespace cine::knowledge
{
    namespace
    {
        constexpr double normEpsilon{ 1e-12 };

        double computeNorm(std::span<const float> v)
        {
            double sum{};
            for (const float value : v)
                sum += static_cast<double>(value) * value;

            return std::sqrt(sum);
        }

        double computeDotProduct(std::span<const float> a, std::span<const float> b)
        {
            return std::inner_product(std::cbegin(a), std::cend(a), std::cbegin(b), 0.0);
        }
    } // namespace

    std::unique_ptr<IInMemoryVectorIndex> createInMemoryVectorIndex()
    {
        return std::make_unique<InMemoryVectorIndex>();
    }

    void InMemoryVectorIndex::load(const std::filesystem::path& embeddingsFile)
    {
        CINE_LOG(EMBEDDING, INFO, "Loading embeddings from '" << embeddingsFile.string() << "'...");

        std::ifstream ifs{ embeddingsFile };
        if (!ifs)
            throw LoadException{ "Cannot open embeddings file '" + embeddingsFile.string() + "'" };

        std::size_t lineNumber{};
        std::size_t loadedCount{};
        std::string line;
        while (std::getline(ifs, line))
        {
            ++lineNumber;

            const std::string_view trimmedLine{ core::stringUtils::stringTrim(line) };
            if (trimmedLine.empty() || trimmedLine.front() == '#')
                continue;

            const std::size_t tab{ trimmedLine.find('\t') };
            if (tab == std::string_view::npos)
                throw LoadException{ "Malformed embedding in '" + embeddingsFile.string() + "', line " + std::to_string(lineNumber) + ": missing tab separator" };

            const EntityId id{ core::stringUtils::stringTrim(trimmedLine.substr(0, tab)) };

            Embedding embedding;
            for (const std::string_view component : core::stringUtils::splitString(core::stringUtils::stringTrim(trimmedLine.substr(tab + 1)), ' '))
            {
                if (component.empty())
                    continue;

                const std::optional<float> value{ core::stringUtils::readAs<float>(component) };
                if (!value)
                    throw LoadException{ "Malformed embedding in '" + embeddingsFile.string() + "', line " + std::to_string(lineNumber) + ": bad value '" + std::string{ component } + "'" };

                embedding.push_back(*value);
            }

            if (id.empty() || embedding.empty())
                throw LoadException{ "Malformed embedding in '" + embeddingsFile.string() + "', line " + std::to_string(lineNumber) + ": empty entry" };

            try
            {
                addEmbedding(id, embedding);
            }
            catch (const Exception& e)
            {
                throw LoadException{ "Malformed embedding in '" + embeddingsFile.string() + "', line " + std::to_string(lineNumber) + ": " + e.what() };
            }
            loadedCount++;
        }

        CINE_LOG(EMBEDDING, INFO, "Loaded " << loadedCount << " embeddings, dimension = " << _dimensionCount);
    }

    void InMemoryVectorIndex::addEmbedding(const EntityId& id, const Embedding& embedding)
    {
        if (embedding.empty())
            throw Exception{ "Empty embedding for '" + id + "'" };

        if (_dimensionCount == 0)
            _dimensionCount = embedding.size();
        else if (embedding.size() != _dimensionCount)
            throw Exception{ "Dimension mismatch for '" + id + "': expected " + std::to_string(_dimensionCount) + ", got " + std::to_string(embedding.size()) };

        const double norm{ std::max(computeNorm(embedding), normEpsilon) };

        Embedding normalized;
        normalized.reserve(embedding.size());
        std::transform(std::cbegin(embedding), std::cend(embedding), std::back_inserter(normalized), [norm](float value) { return static_cast<float>(value / norm); });

        _embeddings[id] = std::move(normalized);
    }

    std::size_t InMemoryVectorIndex::getDimensionCount() const
    {
        return _dimensionCount;
    }

    std::size_t InMemoryVectorIndex::getEmbeddingCount() const
    {
        return _embeddings.size();
    }

    std::vector<Neighbor> InMemoryVectorIndex::findNearestNeighbors(const EntityId& id, std::size_t k) const
    {
        const auto itQuery{ _embeddings.find(id) };
        if (itQuery == std::cend(_embeddings) || k == 0)
            return {};

        std::vector<Neighbor> neighbors;
        neighbors.reserve(_embeddings.size());
        for (const auto& [otherId, embedding] : _embeddings)
        {
            if (otherId == id)
                continue;

            // vectors are normalized
            neighbors.push_back(Neighbor{ otherId, static_cast<float>(computeDotProduct(itQuery->second, embedding)) });
        }

        const std::size_t count{ std::min(k, neighbors.size()) };
        std::partial_sort(std::begin(neighbors), std::begin(neighbors) + count, std::end(neighbors), [](const Neighbor& lhs, const Neighbor& rhs) {
            if (lhs.similarity != rhs.similarity)
                return lhs.similarity > rhs.similarity;
            return lhs.id < rhs.id;
        });
        neighbors.resize(count);

        return neighbors;
    }

    std::optional<Embedding> InMemoryVectorIndex::getEmbedding(const EntityId& id) const
    {
        const auto it{ _embeddings.find(id) };
        if (it == std::cend(_embeddings))
            return std::nullopt;

        return it->second;
    }

    float InMemoryVectorIndex::computeCosineSimilarity(std::span<const float> a, std::span<const float> b) const
    {
        if (a.size() != b.size())
            throw Exception{ "Cannot compare embeddings of different dimensions (" + std::to_string(a.size()) + " and " + std::to_string(b.size()) + ")" };

        const double denominator{ std::max(computeNorm(a) * computeNorm(b), normEpsilon) };
        return static_cast<float>(computeDotProduct(a, b) / denominator);
    }
} // namespace cine::knowledge
