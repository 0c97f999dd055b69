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

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <map>
#include <mutex>
#include <set>
#include <thread>
#include <variant>

#include "services/knowledge/Exception.hpp"
#include "services/knowledge/IGraphStore.hpp"
#include "services/knowledge/ILabelResolver.hpp"
#include "services/knowledge/IVectorIndex.hpp"
#include "services/recommendation/Types.hpp"

namespace cine::recommendation::tests
{
    // Returns canned rows, records what it has been asked
    class FakeGraphStore : public knowledge::IGraphStore, public knowledge::ILabelResolver
    {
    public:
        std::vector<knowledge::GraphRow> query(const knowledge::GraphPattern& pattern, const knowledge::QueryFilters& filters, const knowledge::EntitySet&) const override
        {
            {
                const std::scoped_lock lock{ _mutex };
                queriedPatterns.push_back(pattern);
                queriedFilters.push_back(filters);
            }

            if (queryDelay.count() > 0)
                std::this_thread::sleep_for(queryDelay);

            if (const auto* sharedProperty{ std::get_if<knowledge::SharedPropertyPattern>(&pattern) })
            {
                if (const auto it{ propertyDelays.find(sharedProperty->property) }; it != std::cend(propertyDelays))
                    std::this_thread::sleep_for(it->second);

                if (failingProperties.contains(sharedProperty->property))
                    throw knowledge::Exception{ "store unavailable" };

                const auto it{ sharedPropertyRows.find(sharedProperty->property) };
                return it != std::cend(sharedPropertyRows) ? it->second : std::vector<knowledge::GraphRow>{};
            }

            if (failPreferenceQuery)
                throw knowledge::Exception{ "store unavailable" };

            return preferenceRows;
        }

        knowledge::EntitySet verifyMembership(const knowledge::EntitySet& ids, const knowledge::QueryFilters& filters) const override
        {
            {
                const std::scoped_lock lock{ _mutex };
                verifiedIds.push_back(ids);
                verifiedFilters.push_back(filters);
            }

            if (verifyDelay.count() > 0)
                std::this_thread::sleep_for(verifyDelay);

            if (failVerification)
                throw knowledge::Exception{ "verification unavailable" };

            if (!validIds)
                return ids;

            knowledge::EntitySet res;
            for (const knowledge::EntityId& id : ids)
            {
                if (validIds->contains(id))
                    res.insert(id);
            }
            return res;
        }

        std::optional<std::string> getImage(const knowledge::EntityId& id) const override
        {
            const auto it{ images.find(id) };
            return it != std::cend(images) ? std::make_optional(it->second) : std::nullopt;
        }

        std::optional<std::string> getLabel(const knowledge::EntityId& id) const override
        {
            if (failingLabels.contains(id))
                throw knowledge::Exception{ "label lookup failed" };

            const auto it{ labels.find(id) };
            return it != std::cend(labels) ? std::make_optional(it->second) : std::nullopt;
        }

        std::size_t getVerificationCount() const
        {
            const std::scoped_lock lock{ _mutex };
            return verifiedIds.size();
        }

        // property -> rows
        std::map<knowledge::PropertyRef, std::vector<knowledge::GraphRow>> sharedPropertyRows;
        std::set<knowledge::PropertyRef> failingProperties;
        std::map<knowledge::PropertyRef, std::chrono::milliseconds> propertyDelays;
        std::vector<knowledge::GraphRow> preferenceRows;
        bool failPreferenceQuery{};
        std::chrono::milliseconds queryDelay{};

        std::optional<knowledge::EntitySet> validIds; // all valid if not set
        bool failVerification{};
        std::chrono::milliseconds verifyDelay{};

        std::map<knowledge::EntityId, std::string> labels;
        std::set<knowledge::EntityId> failingLabels;
        std::map<knowledge::EntityId, std::string> images;

        mutable std::vector<knowledge::GraphPattern> queriedPatterns;
        mutable std::vector<knowledge::QueryFilters> queriedFilters;
        mutable std::vector<knowledge::EntitySet> verifiedIds;
        mutable std::vector<knowledge::QueryFilters> verifiedFilters;

    private:
        mutable std::mutex _mutex;
    };

    class FakeVectorIndex : public knowledge::IVectorIndex
    {
    public:
        std::vector<knowledge::Neighbor> findNearestNeighbors(const knowledge::EntityId& id, std::size_t k) const override
        {
            if (failingNeighbors.contains(id))
                throw knowledge::Exception{ "index unavailable" };
            if (unknownErrorNeighbors.contains(id))
                throw 42;

            if (neighborDelay.count() > 0)
                std::this_thread::sleep_for(neighborDelay);

            const auto it{ neighbors.find(id) };
            if (it == std::cend(neighbors))
                return {};

            std::vector<knowledge::Neighbor> res{ it->second };
            if (res.size() > k)
                res.resize(k);
            return res;
        }

        std::optional<knowledge::Embedding> getEmbedding(const knowledge::EntityId& id) const override
        {
            const auto it{ embeddings.find(id) };
            return it != std::cend(embeddings) ? std::make_optional(it->second) : std::nullopt;
        }

        float computeCosineSimilarity(std::span<const float> a, std::span<const float> b) const override
        {
            if (unknownErrorOnSimilarity)
                throw 42;
            if (a.size() != b.size())
                throw knowledge::Exception{ "dimension mismatch" };

            double dot{};
            double normA{};
            double normB{};
            for (std::size_t i{}; i < a.size(); ++i)
            {
                dot += a[i] * b[i];
                normA += a[i] * a[i];
                normB += b[i] * b[i];
            }

            return static_cast<float>(dot / std::max(std::sqrt(normA) * std::sqrt(normB), 1e-12));
        }

        std::map<knowledge::EntityId, knowledge::Embedding> embeddings;
        std::map<knowledge::EntityId, std::vector<knowledge::Neighbor>> neighbors;
        std::set<knowledge::EntityId> failingNeighbors;
        std::set<knowledge::EntityId> unknownErrorNeighbors; // throws a non standard exception
        bool unknownErrorOnSimilarity{};
        std::chrono::milliseconds neighborDelay{};
    };

    class TmpFile final
    {
    public:
        TmpFile(std::string_view content)
            : _path{ std::tmpnam(nullptr) }
        {
            std::ofstream ofs{ _path };
            ofs << content;
        }
        ~TmpFile() { std::filesystem::remove(_path); }
        TmpFile(const TmpFile&) = delete;
        TmpFile& operator=(const TmpFile&) = delete;

        const std::filesystem::path& getPath() const { return _path; }

    private:
        const std::filesystem::path _path;
    };

    inline knowledge::GraphRow createRow(const knowledge::EntityId& entity, std::optional<std::string> matchedValueLabel = std::nullopt, std::optional<double> qualitySignal = std::nullopt)
    {
        knowledge::GraphRow row;
        row.entity = entity;
        row.matchedValueLabel = std::move(matchedValueLabel);
        row.qualitySignal = qualitySignal;
        return row;
    }

    inline std::vector<knowledge::EntityId> getIds(const RankedList& rankedList)
    {
        std::vector<knowledge::EntityId> res;
        for (const RankedEntry& entry : rankedList)
            res.push_back(entry.entityId);
        return res;
    }
} // namespace cine::recommendation::tests
