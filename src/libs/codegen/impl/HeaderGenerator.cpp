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

#include "codegen/HeaderGenerator.hpp"

#include <algorithm>
#include <fstream>
#include <ostream>
#include <regex>
#include <span>
#include <sstream>
#include <system_error>
#include <unordered_set>

#include "codegen/Exception.hpp"
#include "core/IConfig.hpp"
#include "core/ILogger.hpp"
#include "core/String.hpp"
#include "guid/GuidParser.hpp"

namespace guidkit::codegen
{
    namespace
    {
        constexpr std::string_view keywords[]{
            "alignas", "alignof", "and", "and_eq", "asm", "auto", "bitand", "bitor", "bool", "break", "case", "catch",
            "char", "char8_t", "char16_t", "char32_t", "class", "compl", "concept", "const", "consteval", "constexpr",
            "constinit", "const_cast", "continue", "co_await", "co_return", "co_yield", "decltype", "default", "delete",
            "do", "double", "dynamic_cast", "else", "enum", "explicit", "export", "extern", "false", "float", "for",
            "friend", "goto", "if", "inline", "int", "long", "mutable", "namespace", "new", "noexcept", "not", "not_eq",
            "nullptr", "operator", "or", "or_eq", "private", "protected", "public", "register", "reinterpret_cast",
            "requires", "return", "short", "signed", "sizeof", "static", "static_assert", "static_cast", "struct",
            "switch", "template", "this", "thread_local", "throw", "true", "try", "typedef", "typeid", "typename",
            "union", "unsigned", "using", "virtual", "void", "volatile", "wchar_t", "while", "xor", "xor_eq"
        };

        std::string toHexLiteral(std::span<const std::uint8_t> bytes)
        {
            return "0x" + core::stringUtils::toHexString(bytes);
        }

        void writeGuidInitializer(std::ostream& os, const guid::Guid& guid)
        {
            const guid::Guid::Bytes bytes{ guid.toBytes() };
            const std::span<const std::uint8_t> byteSpan{ bytes };

            os << toHexLiteral(byteSpan.subspan(0, 4)) << ", " << toHexLiteral(byteSpan.subspan(4, 2)) << ", " << toHexLiteral(byteSpan.subspan(6, 2)) << ", { ";
            for (std::size_t i{ 8 }; i < bytes.size(); ++i)
            {
                if (i != 8)
                    os << ", ";
                os << toHexLiteral(byteSpan.subspan(i, 1));
            }
            os << " }";
        }
    } // namespace

    bool isValidIdentifier(std::string_view name)
    {
        static const std::regex re{ R"([A-Za-z_][A-Za-z0-9_]*)" };

        if (!std::regex_match(std::cbegin(name), std::cend(name), re))
            return false;

        // reserved to the implementation
        if (name.starts_with("__") || (name.size() > 1 && name[0] == '_' && name[1] >= 'A' && name[1] <= 'Z'))
            return false;

        return std::find(std::cbegin(keywords), std::cend(keywords), name) == std::cend(keywords);
    }

    bool isValidNamespace(std::string_view namespaceName)
    {
        const std::vector<std::string_view> components{ core::stringUtils::splitString(namespaceName, "::") };
        return std::all_of(std::cbegin(components), std::cend(components), [](std::string_view component) { return isValidIdentifier(component); });
    }

    GuidDefinition parseDefinition(std::string_view name, std::string_view value)
    {
        if (!isValidIdentifier(name))
            throw Exception{ "Invalid GUID name '" + std::string{ name } + "': not a valid C++ identifier" };

        const guid::ParseResult result{ guid::parseGuid(value) };
        if (!result)
            throw Exception{ "Invalid GUID '" + std::string{ name } + "' = '" + std::string{ value } + "': " + guid::toString(result.error()) };

        return GuidDefinition{ std::string{ name }, result.value() };
    }

    std::vector<GuidDefinition> readDefinitions(core::IConfig& config)
    {
        std::vector<GuidDefinition> definitions;
        std::unordered_set<std::string> names;

        config.visitNamedStrings("guids", [&](std::string_view name, std::string_view value) {
            GuidDefinition definition{ parseDefinition(name, value) };
            if (!names.insert(definition.name).second)
                throw Exception{ "Duplicated GUID name '" + definition.name + "'" };

            GUIDKIT_LOG(CODEGEN, DEBUG, "Parsed GUID '" << definition.name << "' = " << definition.value);
            definitions.push_back(std::move(definition));
        });

        return definitions;
    }

    HeaderParameters readHeaderParameters(core::IConfig& config)
    {
        HeaderParameters parameters;
        parameters.namespaceName = config.getString("namespace", HeaderParameters::defaultNamespace);
        parameters.emitComments = config.getBool("emit-comments", true);
        parameters.definitions = readDefinitions(config);

        return parameters;
    }

    void writeHeader(std::ostream& os, const HeaderParameters& parameters)
    {
        if (!isValidNamespace(parameters.namespaceName))
            throw Exception{ "Invalid namespace '" + parameters.namespaceName + "'" };

        GUIDKIT_LOG_IF(CODEGEN, WARNING, parameters.definitions.empty(), "No GUID defined in namespace '" << parameters.namespaceName << "'");

        os << "// Generated by guidkit-embed, do not edit\n";
        os << "#pragma once\n";
        os << "\n";
        os << "#include \"guid/Guid.hpp\"\n";
        os << "\n";
        os << "namespace " << parameters.namespaceName << "\n";
        os << "{\n";
        for (const GuidDefinition& definition : parameters.definitions)
        {
            if (parameters.emitComments)
                os << "    // " << definition.value << "\n";

            os << "    inline constexpr ::guidkit::guid::Guid " << definition.name << "{ ";
            writeGuidInitializer(os, definition.value);
            os << " };\n";
        }
        os << "} // namespace " << parameters.namespaceName << "\n";
    }

    void writeHeaderFile(const std::filesystem::path& path, const HeaderParameters& parameters)
    {
        std::ostringstream oss;
        writeHeader(oss, parameters);

        std::filesystem::path tmpPath{ path };
        tmpPath += ".tmp";

        {
            std::ofstream file{ tmpPath, std::ios::out | std::ios::trunc };
            if (!file)
                throw Exception{ "Cannot open output file '" + tmpPath.string() + "'" };

            file << oss.str();
            file.close();
            if (!file)
            {
                std::error_code ec;
                std::filesystem::remove(tmpPath, ec);
                throw Exception{ "Cannot write output file '" + tmpPath.string() + "'" };
            }
        }

        std::error_code ec;
        std::filesystem::rename(tmpPath, path, ec);
        if (ec)
        {
            std::error_code removeEc;
            std::filesystem::remove(tmpPath, removeEc);
            throw Exception{ "Cannot rename '" + tmpPath.string() + "' to '" + path.string() + "': " + ec.message() };
        }

        GUIDKIT_LOG(CODEGEN, DEBUG, "Written " << oss.str().size() << " bytes to '" << path.string() << "'");
    }
} // namespace guidkit::codegen
