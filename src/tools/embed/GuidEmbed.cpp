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

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

#include <boost/program_options.hpp>

#include "codegen/HeaderGenerator.hpp"
#include "core/Exception.hpp"
#include "core/IConfig.hpp"
#include "core/ILogger.hpp"
#include "core/Service.hpp"

namespace guidkit
{
    namespace
    {
        core::logging::Severity getLogMinSeverity(core::IConfig& config, bool verbose)
        {
            if (verbose)
                return core::logging::Severity::DEBUG;

            const std::string_view minSeverity{ config.getString("log-min-severity", "info") };
            if (const std::optional<core::logging::Severity> severity{ core::logging::parseSeverity(minSeverity) })
                return *severity;

            throw core::GuidkitException{ "Invalid config value for 'log-min-severity'" };
        }
    } // namespace
} // namespace guidkit

int main(int argc, char* argv[])
{
    try
    {
        using namespace guidkit;
        namespace po = boost::program_options;

        po::options_description desc{ "Generates a C++ header of GUID constants.\nAllowed options" };

        // clang-format off
        desc.add_options()
            ("help,h", "print usage message")
            ("conf,c", po::value<std::string>()->required(), "config file listing the GUIDs")
            ("output,o", po::value<std::string>()->required(), "generated header path")
            ("namespace,n", po::value<std::string>(), "namespace of the constants, overrides the config file")
            ("verbose,v", "enable debug logs");
        // clang-format on

        po::variables_map vm;
        po::store(po::parse_command_line(argc, argv, desc), vm);

        if (vm.count("help"))
        {
            std::cout << desc << std::endl;
            return EXIT_SUCCESS;
        }

        po::notify(vm);

        const std::filesystem::path configPath{ vm["conf"].as<std::string>() };
        const std::filesystem::path outputPath{ vm["output"].as<std::string>() };

        const std::unique_ptr<core::IConfig> config{ core::createConfig(configPath) };
        core::Service<core::logging::ILogger> logger{ core::logging::createLogger(getLogMinSeverity(*config, vm.count("verbose") > 0), config->getPath("log-file", {})) };

        codegen::HeaderParameters parameters{ codegen::readHeaderParameters(*config) };
        if (vm.count("namespace"))
            parameters.namespaceName = vm["namespace"].as<std::string>();

        codegen::writeHeaderFile(outputPath, parameters);

        GUIDKIT_LOG(MAIN, INFO, "Generated " << parameters.definitions.size() << " GUID constant(s) in '" << outputPath.string() << "' from '" << configPath.string() << "'");
    }
    catch (std::exception& e)
    {
        std::cerr << "guidkit-embed: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
