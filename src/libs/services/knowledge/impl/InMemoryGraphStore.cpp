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

#include "InMemoryGraphStore.hpp"

#include <algorithm>
#include <fstream>
#include <tuple>
#include <type_traits>

#include "core/ILogger.hpp"
#include "core/String.hpp"
#include "services/knowledge/Exception.hpp"

namespace cine::knowledge
{
    std::unique_ptr<IInMemoryGraphStore> createInMemoryGraphStore(const PropertyCatalog& catalog)
    {
        return std::make_unique<InMemoryGraphStore>(catalog);
    }

    InMemoryGraphStore::InMemoryGraphStore(const PropertyCatalog& catalog)
        : _catalog{ catalog }
    {
    }

    void InMemoryGraphStore::load(const std::filesystem::path& triplesFile)
    {
        CINE_LOG(GRAPH, INFO, "Loading triples from '" << triplesFile.string() << "'...");

        std::ifstream ifs{ triplesFile };
        if (!ifs)
            throw LoadException{ "Cannot open triples file '" + triplesFile.string() + "'" };

        const std::size_t previousTripleCount{ _tripleCount };
        std::size_t lineNumber{};
        std::string line;
        while (std::getline(ifs, line))
        {
            ++lineNumber;

            const std::string_view trimmedLine{ core::stringUtils::stringTrim(line, "\r\n") };
            if (core::stringUtils::stringTrim(trimmedLine).empty() || trimmedLine.front() == '#')
                continue;

            const std::size_t firstTab{ trimmedLine.find('\t') };
            const std::size_t secondTab{ firstTab == std::string_view::npos ? std::string_view::npos : trimmedLine.find('\t', firstTab + 1) };
            if (secondTab == std::string_view::npos)
                throw LoadException{ "Malformed triple in '" + triplesFile.string() + "', line " + std::to_string(lineNumber) + ": expected 3 tab separated fields" };

            const std::string_view subject{ core::stringUtils::stringTrim(trimmedLine.substr(0, firstTab)) };
            const std::string_view predicate{ core::stringUtils::stringTrim(trimmedLine.substr(firstTab + 1, secondTab - firstTab - 1)) };
            const std::string_view object{ core::stringUtils::stringTrim(trimmedLine.substr(secondTab + 1)) };
            if (subject.empty() || predicate.empty() || object.empty())
                throw LoadException{ "Malformed triple in '" + triplesFile.string() + "', line " + std::to_string(lineNumber) + ": empty field" };

            addTriple(subject, predicate, object);
        }

        CINE_LOG(GRAPH, INFO, "Loaded " << (_tripleCount - previousTripleCount) << " triples, " << _triples.size() << " subjects");
    }

    void InMemoryGraphStore::addTriple(std::string_view subject, std::string_view predicate, std::string_view object)
    {
        auto [it, inserted]{ _triples[EntityId{ subject }][PropertyRef{ predicate }].emplace(object) };
        if (!inserted)
            return;

        _reverseIndex[PropertyRef{ predicate }][EntityId{ object }].emplace(subject);
        _tripleCount++;
    }

    std::size_t InMemoryGraphStore::getTripleCount() const
    {
        return _tripleCount;
    }

    std::vector<GraphRow> InMemoryGraphStore::query(const GraphPattern& pattern, const QueryFilters& filters, const EntitySet& exclude) const
    {
        return std::visit([&](const auto& p) {
            using PatternType = std::decay_t<decltype(p)>;

            if constexpr (std::is_same_v<PatternType, SharedPropertyPattern>)
                return querySharedProperty(p, filters, exclude);
            else
                return queryPropertyMatch(p, filters, exclude);
        },
                          pattern);
    }

    std::vector<GraphRow> InMemoryGraphStore::querySharedProperty(const SharedPropertyPattern& pattern, const QueryFilters& filters, const EntitySet& exclude) const
    {
        // value -> number of seeds having it
        std::map<EntityId, std::size_t> seedCountByValue;
        for (const EntityId& seed : pattern.seeds)
        {
            if (const EntitySet * values{ getValues(seed, pattern.property) })
            {
                for (const EntityId& value : *values)
                    seedCountByValue[value]++;
            }
        }

        const auto itProperty{ _reverseIndex.find(pattern.property) };
        if (itProperty == std::cend(_reverseIndex))
            return {};

        struct Match
        {
            std::size_t seedCount;
            EntityId entity;
            EntityId value;
        };
        std::vector<Match> matches;

        for (const auto& [value, seedCount] : seedCountByValue)
        {
            const auto itValue{ itProperty->second.find(value) };
            if (itValue == std::cend(itProperty->second))
                continue;

            for (const EntityId& entity : itValue->second)
            {
                if (pattern.seeds.contains(entity) || exclude.contains(entity))
                    continue;

                if (!matchesFilters(entity, filters))
                    continue;

                matches.push_back(Match{ seedCount, entity, value });
            }
        }

        std::sort(std::begin(matches), std::end(matches), [](const Match& lhs, const Match& rhs) {
            return std::tie(rhs.seedCount, lhs.entity, lhs.value) < std::tie(lhs.seedCount, rhs.entity, rhs.value);
        });

        if (matches.size() > pattern.limit)
            matches.resize(pattern.limit);

        std::vector<GraphRow> rows;
        rows.reserve(matches.size());
        for (const Match& match : matches)
            rows.push_back(createRow(match.entity, match.value));

        return rows;
    }

    std::vector<GraphRow> InMemoryGraphStore::queryPropertyMatch(const PropertyMatchPattern& pattern, const QueryFilters& filters, const EntitySet& exclude) const
    {
        if (pattern.required.empty())
            return {};

        // start from the subjects of the first required value, the others are checked per entity
        const PropertyValue& first{ pattern.required.front() };
        const auto itProperty{ _reverseIndex.find(first.property) };
        if (itProperty == std::cend(_reverseIndex))
            return {};

        const auto itValue{ itProperty->second.find(first.value) };
        if (itValue == std::cend(itProperty->second))
            return {};

        std::vector<GraphRow> rows;
        for (const EntityId& entity : itValue->second)
        {
            if (rows.size() >= pattern.limit)
                break;

            if (exclude.contains(entity))
                continue;

            const bool hasAllValues{ std::all_of(std::cbegin(pattern.required), std::cend(pattern.required), [&](const PropertyValue& required) { return hasValue(entity, required); }) };
            if (!hasAllValues || !matchesFilters(entity, filters))
                continue;

            rows.push_back(createRow(entity, std::nullopt));
        }

        return rows;
    }

    EntitySet InMemoryGraphStore::verifyMembership(const EntitySet& ids, const QueryFilters& filters) const
    {
        EntitySet res;

        for (const EntityId& id : ids)
        {
            if (_triples.contains(id) && matchesFilters(id, filters))
                res.insert(id);
        }

        CINE_LOG(GRAPH, DEBUG, "Verified " << res.size() << "/" << ids.size() << " entities");

        return res;
    }

    std::optional<std::string> InMemoryGraphStore::getImage(const EntityId& id) const
    {
        return getFirstValue(id, _catalog.image);
    }

    std::optional<std::string> InMemoryGraphStore::getLabel(const EntityId& id) const
    {
        return getFirstValue(id, _catalog.label);
    }

    bool InMemoryGraphStore::matchesFilters(const EntityId& entity, const QueryFilters& filters) const
    {
        if (filters.requiredType && !hasValue(entity, *filters.requiredType))
            return false;

        for (const PropertyValue& required : filters.required)
        {
            if (!hasValue(entity, required))
                return false;
        }

        for (const PropertyValue& excluded : filters.excluded)
        {
            if (hasValue(entity, excluded))
                return false;
        }

        if (filters.minYear || filters.maxYear)
        {
            const std::optional<int> year{ getYear(entity) };
            if (!year)
                return false;

            if (filters.minYear && *year < *filters.minYear)
                return false;
            if (filters.maxYear && *year > *filters.maxYear)
                return false;
        }

        if (filters.minRating)
        {
            const std::optional<double> rating{ getRating(entity) };
            if (!rating || *rating < *filters.minRating)
                return false;
        }

        return true;
    }

    bool InMemoryGraphStore::hasValue(const EntityId& entity, const PropertyValue& propertyValue) const
    {
        const EntitySet* values{ getValues(entity, propertyValue.property) };
        return values && values->contains(propertyValue.value);
    }

    const EntitySet* InMemoryGraphStore::getValues(const EntityId& entity, const PropertyRef& property) const
    {
        const auto itEntity{ _triples.find(entity) };
        if (itEntity == std::cend(_triples))
            return nullptr;

        const auto itProperty{ itEntity->second.find(property) };
        if (itProperty == std::cend(itEntity->second))
            return nullptr;

        return &itProperty->second;
    }

    std::optional<std::string> InMemoryGraphStore::getFirstValue(const EntityId& entity, const PropertyRef& property) const
    {
        const EntitySet* values{ getValues(entity, property) };
        if (!values || values->empty())
            return std::nullopt;

        return *values->begin();
    }

    std::optional<int> InMemoryGraphStore::getYear(const EntityId& entity) const
    {
        const std::optional<std::string> date{ getFirstValue(entity, _catalog.publicationDate) };
        if (!date)
            return std::nullopt;

        // "1999-03-31T00:00:00Z" or "1999"
        const std::vector<std::string_view> parts{ core::stringUtils::splitString(*date, '-') };
        return core::stringUtils::readAs<int>(parts.front());
    }

    std::optional<double> InMemoryGraphStore::getRating(const EntityId& entity) const
    {
        const std::optional<std::string> rating{ getFirstValue(entity, _catalog.rating) };
        if (!rating)
            return std::nullopt;

        return core::stringUtils::readAs<double>(*rating);
    }

    GraphRow InMemoryGraphStore::createRow(const EntityId& entity, const std::optional<EntityId>& matchedValue) const
    {
        GraphRow row;
        row.entity = entity;
        row.matchedValue = matchedValue;
        if (matchedValue)
            row.matchedValueLabel = getLabel(*matchedValue);
        row.qualitySignal = getRating(entity);

        return row;
    }
} // namespace cine::knowledge
