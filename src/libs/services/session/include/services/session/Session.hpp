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

#include <string>
#include <vector>

#include "services/session/Types.hpp"

namespace cine::session
{
    // Conversation state of a single user
    class Session
    {
    public:
        explicit Session(const UserId& userId);

        const UserId& getUserId() const { return _userId; }
        const knowledge::EntitySet& getSeedEntities() const { return _seedEntities; }
        const Preferences& getPreferences() const { return _preferences; }
        const Constraints& getConstraints() const { return _constraints; }
        const Negations& getNegations() const { return _negations; }
        const knowledge::EntitySet& getRecommendedEntities() const { return _recommendedEntities; }
        const std::vector<Turn>& getHistory() const { return _history; }

        // Seeds are merged, other entries replace the previous ones of the same kind.
        // A follow-up without new seeds turns the previous recommendations into seeds.
        void update(const ParsedIntent& intent);

        void addRecommendations(const knowledge::EntitySet& ids);

        // seeds and already recommended entities, computed on each call
        knowledge::EntitySet getExcludeList() const;

        void addTurn(std::string request, std::string response);

        // resets everything but the user id
        void clear();

        bool hasSeedsOrPreferences() const;

    private:
        UserId _userId;
        knowledge::EntitySet _seedEntities;
        Preferences _preferences;
        Constraints _constraints;
        Negations _negations;
        knowledge::EntitySet _recommendedEntities;
        std::vector<Turn> _history;
    };
} // namespace cine::session
