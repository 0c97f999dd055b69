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

#include <cstddef>
#include <memory>
#include <mutex>

#include "services/session/Session.hpp"

namespace cine::session
{
    // Exclusive access to a session, released on destruction
    class LockedSession
    {
    public:
        LockedSession(std::unique_lock<std::mutex> lock, Session& session)
            : _lock{ std::move(lock) }
            , _session{ &session }
        {
        }

        Session& get() const { return *_session; }
        Session* operator->() const { return _session; }
        Session& operator*() const { return *_session; }

    private:
        std::unique_lock<std::mutex> _lock;
        Session* _session;
    };

    class ISessionService
    {
    public:
        virtual ~ISessionService() = default;

        // Creates the session on first use
        [[nodiscard]] virtual LockedSession acquireSession(const UserId& userId) = 0;

        // No effect if the user has no session
        virtual void clearSession(const UserId& userId) = 0;

        virtual std::size_t getSessionCount() const = 0;
    };

    std::unique_ptr<ISessionService> createSessionService();
} // namespace cine::session
