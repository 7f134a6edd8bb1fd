//------------------------------------------------------------------------------
/*
    This file is part of strata
    Copyright (c) 2026 The strata developers

    Permission to use, copy, modify, and/or distribute this software for any
    purpose  with  or without fee is hereby granted, provided that the above
    copyright notice and this permission notice appear in all copies.

    THE  SOFTWARE IS PROVIDED "AS IS" AND THE AUTHOR DISCLAIMS ALL WARRANTIES
    WITH  REGARD  TO  THIS  SOFTWARE  INCLUDING  ALL  IMPLIED  WARRANTIES  OF
    MERCHANTABILITY  AND  FITNESS. IN NO EVENT SHALL THE AUTHOR BE LIABLE FOR
    ANY  SPECIAL ,  DIRECT, INDIRECT, OR CONSEQUENTIAL DAMAGES OR ANY DAMAGES
    WHATSOEVER  RESULTING  FROM  LOSS  OF USE, DATA OR PROFITS, WHETHER IN AN
    ACTION  OF  CONTRACT, NEGLIGENCE OR OTHER TORTIOUS ACTION, ARISING OUT OF
    OR IN CONNECTION WITH THE USE OR PERFORMANCE OF THIS SOFTWARE.
*/
//==============================================================================

#include <strata/app/Replay.h>
#include <strata/basics/BasicConfig.h>
#include <strata/basics/Log.h>
#include <strata/ledger/LendingPool.h>
#include <strata/protocol/PoolConfig.h>

#include <boost/program_options.hpp>

#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <string>

namespace po = boost::program_options;

namespace strata {

static std::string const versionString = "strata 1.0.0";

void
printHelp(po::options_description const& desc)
{
    std::cerr << "stratad [options] <script>\n"
              << "Replays a pool event script and prints each result as "
                 "JSON.\n\n"
              << desc << std::endl;
}

int
run(int argc, char** argv)
{
    po::variables_map vm;

    // Set up option parsing.
    //
    po::options_description gen("General Options");
    gen.add_options()(
        "conf", po::value<std::string>(), "Specify the configuration file.")(
        "help,h", "Display this message.")(
        "severity",
        po::value<std::string>(),
        "Override the log severity: trace, debug, info, warning, error, "
        "fatal.")(
        "start",
        po::value<std::int64_t>()->default_value(0),
        "Ledger time, in seconds since the epoch, the replay starts at.")(
        "version", "Display the build version.");

    po::options_description hidden("Hidden Options");
    hidden.add_options()(
        "script", po::value<std::string>(), "Event script, or - for stdin.");

    po::positional_options_description p;
    p.add("script", 1);

    po::options_description all;
    all.add(gen).add(hidden);

    // Parse options, if no error.
    try
    {
        po::store(
            po::command_line_parser(argc, argv)
                .options(all)
                .positional(p)
                .run(),
            vm);
        po::notify(vm);
    }
    catch (std::exception const& ex)
    {
        std::cerr << "stratad: " << ex.what() << std::endl;
        std::cerr << "Try 'stratad --help' for a list of options." << std::endl;
        return EXIT_FAILURE;
    }

    if (vm.count("help"))
    {
        printHelp(gen);
        return EXIT_SUCCESS;
    }

    if (vm.count("version"))
    {
        std::cout << versionString << std::endl;
        return EXIT_SUCCESS;
    }

    if (!vm.count("conf") || !vm.count("script"))
    {
        printHelp(gen);
        return EXIT_FAILURE;
    }

    BasicConfig config;
    config.loadFromFile(vm["conf"].as<std::string>());

    auto severity = Logs::fromString(
        get<std::string>(config.section("logging"), "severity", "warning"));
    if (vm.count("severity"))
        severity = Logs::fromString(vm["severity"].as<std::string>());
    if (!severity)
    {
        std::cerr << "stratad: unknown log severity" << std::endl;
        return EXIT_FAILURE;
    }

    Logs logs(*severity, std::cerr);
    LendingPool pool(loadPoolConfig(config), logs);
    Replay replay(
        pool,
        std::cout,
        logs.journal("Replay"),
        fromSeconds(vm["start"].as<std::int64_t>()));

    auto const& scriptName = vm["script"].as<std::string>();
    bool ok = false;
    if (scriptName == "-")
    {
        ok = replay.run(std::cin);
    }
    else
    {
        std::ifstream script(scriptName);
        if (!script)
        {
            std::cerr << "stratad: cannot open " << scriptName << std::endl;
            return EXIT_FAILURE;
        }
        ok = replay.run(script);
    }

    Json::StreamWriterBuilder builder;
    std::cout << Json::writeString(builder, pool.getJson()) << std::endl;
    return ok ? EXIT_SUCCESS : EXIT_FAILURE;
}

}  // namespace strata

int
main(int argc, char** argv)
{
    try
    {
        return strata::run(argc, argv);
    }
    catch (std::exception const& e)
    {
        std::cerr << "stratad: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }
}
