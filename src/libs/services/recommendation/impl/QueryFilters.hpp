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

#include "services/knowledge/PropertyCatalog.hpp"
#include "services/knowledge/Types.hpp"
#include "services/session/Types.hpp"

namespace cine::recommendation
{
    // Store filters for the session constraints and negations, used both to generate and to verify candidates
    knowledge::QueryFilters createQueryFilters(const session::Constraints& constraints, const session::Negations& negations, const knowledge::PropertyCatalog& catalog);
} // namespace cine::recommendation
