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

#include "services/session/Session.hpp"

#include "core/ILogger.hpp"

namespace cine::session
{
    Session::Session(const UserId& userId)
        : _userId{ userId }
    {
    }

    void Session::update(const ParsedIntent& intent)
    {
        _seedEntities.insert(std::cbegin(intent.seedEntities), std::cend(intent.seedEntities));

        for (const auto& [kind, entity] : intent.preferences)
            _preferences[kind] = entity;

        // keyed by the constraint value, the intent key is not trusted
        for (const auto& [kind, constraint] : intent.constraints)
            _constraints.insert_or_assign(getConstraintKind(constraint), constraint);

        for (const auto& [kind, entity] : intent.negations)
            _negations[kind] = entity;

        if (intent.isFollowUp && intent.seedEntities.empty() && !_recommendedEntities.empty())
        {
            CINE_LOG(SESSION, DEBUG, "User '" << _userId << "': promoting " << _recommendedEntities.size() << " recommended entities to seeds");

            _seedEntities.insert(std::cbegin(_recommendedEntities), std::cend(_recommendedEntities));
            _recommendedEntities.clear();
        }
    }

    void Session::addRecommendations(const knowledge::EntitySet& ids)
    {
        _recommendedEntities.insert(std::cbegin(ids), std::cend(ids));
    }

    knowledge::EntitySet Session::getExcludeList() const
    {
        knowledge::EntitySet excludeList{ _seedEntities };
        excludeList.insert(std::cbegin(_recommendedEntities), std::cend(_recommendedEntities));

        return excludeList;
    }

    void Session::addTurn(std::string request, std::string response)
    {
        _history.push_back(Turn{ std::move(request), std::move(response) });
    }

    void Session::clear()
    {
        CINE_LOG(SESSION, DEBUG, "Clearing session of user '" << _userId << "'");

        _seedEntities.clear();
        _preferences.clear();
        _constraints.clear();
        _negations.clear();
        _recommendedEntities.clear();
        _history.clear();
    }

    bool Session::hasSeedsOrPreferences() const
    {
        return !_seedEntities.empty() || !_preferences.empty();
    }
} // namespace cine::session
