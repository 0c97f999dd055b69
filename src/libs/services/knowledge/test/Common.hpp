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

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <string_view>

namespace cine::knowledge::tests
{
    class ScopedFileDeleter final
    {
    public:
        ScopedFileDeleter(const std::filesystem::path& path)
            : _path{ path } {}
        ~ScopedFileDeleter() { std::filesystem::remove(_path); }

    private:
        ScopedFileDeleter(const ScopedFileDeleter&) = delete;
        ScopedFileDeleter(ScopedFileDeleter&&) = delete;
        ScopedFileDeleter operator=(const ScopedFileDeleter&) = delete;
        ScopedFileDeleter operator=(ScopedFileDeleter&&) = delete;

        const std::filesystem::path _path;
    };

    class TmpFile final
    {
    public:
        TmpFile(std::string_view content)
            : _path{ std::tmpnam(nullptr) }
            , _fileDeleter{ _path }
        {
            std::ofstream ofs{ _path };
            ofs << content;
        }

        const std::filesystem::path& getPath() const { return _path; }

    private:
        const std::filesystem::path _path;
        ScopedFileDeleter _fileDeleter;
    };
} // namespace cine::knowledge::tests
