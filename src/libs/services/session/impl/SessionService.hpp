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

#include <shared_mutex>
#include <unordered_map>

#include "services/session/ISessionService.hpp"

namespace cine::session
{
    class SessionService : public ISessionService
    {
    public:
        SessionService() = default;
        ~SessionService() override = default;
        SessionService(const SessionService&) = delete;
        SessionService& operator=(const SessionService&) = delete;

    private:
        LockedSession acquireSession(const UserId& userId) override;
        void clearSession(const UserId& userId) override;
        std::size_t getSessionCount() const override;

        struct Entry
        {
            Entry(const UserId& userId)
                : session{ userId } {}

            std::mutex mutex;
            Session session;
        };

        // entries are never erased, so that locked sessions stay valid
        Entry* findEntry(const UserId& userId) const;

        mutable std::shared_mutex _mutex;
        std::unordered_map<UserId, std::unique_ptr<Entry>> _entries;
    };
} // namespace cine::session
