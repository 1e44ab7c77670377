/*
 * Copyright (C) 2024 Emeric Poupon
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

#include <filesystem>
#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>

#include "guid/Guid.hpp"

namespace guidkit::core
{
    class IConfig;
}

namespace guidkit::codegen
{
    struct GuidDefinition
    {
        std::string name;
        guid::Guid value;
    };

    struct HeaderParameters
    {
        static constexpr std::string_view defaultNamespace{ "guidkit::generated" };

        std::string namespaceName{ defaultNamespace };
        bool emitComments{ true };
        std::vector<GuidDefinition> definitions;
    };

    [[nodiscard]] bool isValidIdentifier(std::string_view name);
    // Nested namespaces are separated by "::"
    [[nodiscard]] bool isValidNamespace(std::string_view namespaceName);

    // Throws Exception if the name is not a usable identifier or if the value is not a canonical GUID
    GuidDefinition parseDefinition(std::string_view name, std::string_view value);

    // Reads the "guids" group, in file order
    // Throws Exception on invalid or duplicated entries
    std::vector<GuidDefinition> readDefinitions(core::IConfig& config);

    // Reads "namespace", "emit-comments" and the definitions
    HeaderParameters readHeaderParameters(core::IConfig& config);

    // Throws Exception if the namespace is invalid
    void writeHeader(std::ostream& os, const HeaderParameters& parameters);

    // Generates the whole header in memory, then replaces the file through a rename of "<path>.tmp"
    // On error, the existing file is left untouched
    void writeHeaderFile(const std::filesystem::path& path, const HeaderParameters& parameters);
} // namespace guidkit::codegen
