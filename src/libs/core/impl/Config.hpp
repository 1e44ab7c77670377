/*
 * Copyright (C) 2016 Emeric Poupon
 *
 * This file is part of Guidkit.
 *
 * Guidkit is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * Guidkit is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with Guidkit.  If not, see <http://www.gnu.org/licenses/>.
 */
#pragma once

#include "core/IConfig.hpp"

#include <libconfig.h++>

namespace guidkit::core
{
    class Config final : public IConfig
    {
    public:
        Config(const std::filesystem::path& p);
        ~Config() override = default;

        Config(const Config&) = delete;
        Config& operator=(const Config&) = delete;
        Config(Config&&) = delete;
        Config& operator=(Config&&) = delete;

    private:
        std::string_view getString(std::string_view setting, std::string_view def) override;
        std::filesystem::path getPath(std::string_view setting, const std::filesystem::path& def) override;
        bool getBool(std::string_view setting, bool def) override;
        void visitNamedStrings(std::string_view setting, NamedStringVisitor func) override;

        libconfig::Config _config;
    };
} // namespace guidkit::core
