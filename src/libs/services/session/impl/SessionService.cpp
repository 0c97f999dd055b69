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

#include "SessionService.hpp"

#include "core/ILogger.hpp"

namespace cine::session
{
    std::unique_ptr<ISessionService> createSessionService()
    {
        return std::make_unique<SessionService>();
    }

    LockedSession SessionService::acquireSession(const UserId& userId)
    {
        Entry* entry{ findEntry(userId) };
        if (!entry)
        {
            std::unique_lock lock{ _mutex };

            auto& newEntry{ _entries[userId] };
            if (!newEntry)
            {
                CINE_LOG(SESSION, DEBUG, "Creating session for user '" << userId << "'");
                newEntry = std::make_unique<Entry>(userId);
            }
            entry = newEntry.get();
        }

        return LockedSession{ std::unique_lock{ entry->mutex }, entry->session };
    }

    void SessionService::clearSession(const UserId& userId)
    {
        Entry* entry{ findEntry(userId) };
        if (!entry)
            return;

        const std::scoped_lock lock{ entry->mutex };
        entry->session.clear();
    }

    std::size_t SessionService::getSessionCount() const
    {
        std::shared_lock lock{ _mutex };
        return _entries.size();
    }

    SessionService::Entry* SessionService::findEntry(const UserId& userId) const
    {
        std::shared_lock lock{ _mutex };

        const auto it{ _entries.find(userId) };
        return it != std::cend(_entries) ? it->second.get() : nullptr;
    }
} // namespace cine::session
