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

#include "Config.hpp"

#include "core/Exception.hpp"

namespace guidkit::core
{
    std::unique_ptr<IConfig> createConfig(const std::filesystem::path& p)
    {
        return std::make_unique<Config>(p);
    }

    Config::Config(const std::filesystem::path& p)
    {
        try
        {
            _config.readFile(p.c_str());
        }
        catch (libconfig::FileIOException&)
        {
            throw GuidkitException{ "Cannot open config file '" + p.string() + "'" };
        }
        catch (libconfig::ParseException& e)
        {
            throw GuidkitException{ "Cannot parse config file '" + p.string() + "', line = " + std::to_string(e.getLine()) + ", error = '" + e.getError() + "'" };
        }
        catch (libconfig::ConfigException& e)
        {
            throw GuidkitException{ "Cannot open config file '" + p.string() + "': " + e.what() };
        }
    }

    std::string_view Config::getString(std::string_view setting, std::string_view def)
    {
        try
        {
            return static_cast<const char*>(_config.lookup(std::string{ setting }));
        }
        catch (libconfig::ConfigException&)
        {
            return def;
        }
    }

    std::filesystem::path Config::getPath(std::string_view setting, const std::filesystem::path& path)
    {
        try
        {
            const char* res{ _config.lookup(std::string{ setting }) };
            return std::filesystem::path{ std::string(res) };
        }
        catch (libconfig::ConfigException&)
        {
            return path;
        }
    }

    bool Config::getBool(std::string_view setting, bool def)
    {
        try
        {
            return _config.lookup(std::string{ setting });
        }
        catch (libconfig::ConfigException&)
        {
            return def;
        }
    }

    void Config::visitNamedStrings(std::string_view setting, NamedStringVisitor func)
    {
        const std::string path{ setting };
        if (!_config.exists(path))
            return;

        const libconfig::Setting& group{ _config.lookup(path) };
        if (!group.isGroup())
            throw GuidkitException{ "Config setting '" + path + "' must be a group" };

        for (int i{}; i < group.getLength(); ++i)
        {
            const libconfig::Setting& entry{ group[i] };
            if (entry.getType() != libconfig::Setting::TypeString)
                throw GuidkitException{ "Config setting '" + entry.getPath() + "' must be a string" };

            func(entry.getName(), static_cast<const char*>(entry));
        }
    }
} // namespace guidkit::core
