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

#include <map>
#include <unordered_map>

#include "services/knowledge/IInMemoryGraphStore.hpp"

namespace cine::knowledge
{
    class InMemoryGraphStore final : public IInMemoryGraphStore
    {
    public:
        explicit InMemoryGraphStore(const PropertyCatalog& catalog);
        ~InMemoryGraphStore() override = default;
        InMemoryGraphStore(const InMemoryGraphStore&) = delete;
        InMemoryGraphStore& operator=(const InMemoryGraphStore&) = delete;

    private:
        void load(const std::filesystem::path& triplesFile) override;
        void addTriple(std::string_view subject, std::string_view predicate, std::string_view object) override;
        std::size_t getTripleCount() const override;

        std::vector<GraphRow> query(const GraphPattern& pattern, const QueryFilters& filters, const EntitySet& exclude) const override;
        EntitySet verifyMembership(const EntitySet& ids, const QueryFilters& filters) const override;
        std::optional<std::string> getImage(const EntityId& id) const override;

        std::optional<std::string> getLabel(const EntityId& id) const override;

        std::vector<GraphRow> querySharedProperty(const SharedPropertyPattern& pattern, const QueryFilters& filters, const EntitySet& exclude) const;
        std::vector<GraphRow> queryPropertyMatch(const PropertyMatchPattern& pattern, const QueryFilters& filters, const EntitySet& exclude) const;

        bool matchesFilters(const EntityId& entity, const QueryFilters& filters) const;
        bool hasValue(const EntityId& entity, const PropertyValue& propertyValue) const;
        const EntitySet* getValues(const EntityId& entity, const PropertyRef& property) const;
        std::optional<std::string> getFirstValue(const EntityId& entity, const PropertyRef& property) const;
        std::optional<int> getYear(const EntityId& entity) const;
        std::optional<double> getRating(const EntityId& entity) const;
        GraphRow createRow(const EntityId& entity, const std::optional<EntityId>& matchedValue) const;

        const PropertyCatalog _catalog;

        using PropertyValues = std::map<PropertyRef, EntitySet>;
        std::unordered_map<EntityId, PropertyValues> _triples;             // subject -> predicate -> objects
        std::map<PropertyRef, std::map<EntityId, EntitySet>> _reverseIndex; // predicate -> object -> subjects
        std::size_t _tripleCount{};
    };
} // namespace cine::knowledge
