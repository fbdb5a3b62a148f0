#include "capdisc/probe/probe_cli.hpp"

#include "capdisc/discovery/discovery_message.hpp"

#include <boost/program_options.hpp>
#include <cstdlib>
#include <iostream>
#include <limits>
#include <vector>

namespace capdisc
{

ProbeConfig parse_command_line(int argc, const char* const argv[])
{
    namespace po = boost::program_options;

    po::options_description desc("capdisc_probe Options");
    // clang-format off
    desc.add_options()
        ("help,h", "Show help message")
        ("probe,q", "Discover the features of a peer")
        ("respond,r", "Answer discovery requests for a peer")
        ("peer,p", po::value<std::string>()->required(), "Peer address (required)")
        ("host,H", po::value<std::string>()->default_value("127.0.0.1"), "Responder host (probe mode)")
        ("port,P", po::value<unsigned int>()->default_value(5347), "Responder UDP port")
        ("feature,f", po::value<std::vector<std::string>>()->composing(), "Advertised feature (respond mode, repeatable)")
        ("timeout,t", po::value<long long>(), "Reply timeout in milliseconds (probe mode)");
    // clang-format on

    std::vector<std::string> arguments;
    arguments.reserve(static_cast<size_t>(argc));
    for (int i = 1; i < argc; ++i)
    {
        arguments.emplace_back(argv[i]);
    }

    int verbosity = 0;
    std::vector<std::string> remaining;
    for (const std::string& argument : arguments)
    {
        if (argument.size() >= 2 && argument[0] == '-' && argument.find_first_not_of('v', 1) == std::string::npos)
        {
            verbosity = static_cast<int>(argument.size() - 1);
            continue;
        }
        remaining.push_back(argument);
    }

    po::variables_map variables;

    ProbeConfig config;

    try
    {
        po::store(po::command_line_parser(remaining).options(desc).run(), variables);

        if (variables.count("help") != 0U)
        {
            std::cout << desc << '\n';
            std::cout << "\nVerbosity levels:\n"
                      << "  (none)  : Info level  - shows ERROR, WARNING and INFO messages\n"
                      << "  -v      : Debug level - also shows DEBUG messages and full feature lists\n"
                      << "  -vv     : Trace level - shows all messages\n"
                      << "\nExamples:\n"
                      << "  capdisc_probe -r -p room@conf/alice -f urn:xmpp:jingle:apps:rtp:audio -P 5347\n"
                      << "  capdisc_probe -q -p room@conf/alice -H 127.0.0.1 -P 5347 -t 2000\n";
            std::exit(0);
        }

        po::notify(variables);

        const bool is_probe   = variables.count("probe") != 0U;
        const bool is_respond = variables.count("respond") != 0U;
        if (is_probe == is_respond)
        {
            throw po::error("Exactly one of --probe/--respond must be specified.");
        }

        config.mode = is_probe ? ProbeMode::probe : ProbeMode::respond;
        config.peer = variables["peer"].as<std::string>();
        if (!DiscoveryMessage::is_valid_peer(config.peer))
        {
            throw po::error("Peer address must not be empty or contain whitespace.");
        }

        config.host = variables["host"].as<std::string>();
        auto port   = variables["port"].as<unsigned int>();
        if (port > std::numeric_limits<unsigned short>::max() || (port == 0 && is_probe))
        {
            throw po::error("Invalid port: " + std::to_string(port));
        }
        config.port = static_cast<unsigned short>(port);

        if (variables.count("feature") != 0U)
        {
            config.features = variables["feature"].as<std::vector<std::string>>();
        }
        for (const auto& feature : config.features)
        {
            if (!DiscoveryMessage::is_valid_peer(feature))
            {
                throw po::error("Invalid feature token '" + feature + "'");
            }
        }

        if (variables.count("timeout") != 0U)
        {
            auto timeout_ms = variables["timeout"].as<long long>();
            if (timeout_ms <= 0)
            {
                throw po::error("Reply timeout must be positive.");
            }
            config.reply_timeout = std::chrono::milliseconds(timeout_ms);
        }

        if (verbosity == 0)
        {
            config.log_level = logging::LogLevel::Info;
        }
        else if (verbosity == 1)
        {
            config.log_level = logging::LogLevel::Debug;
        }
        else
        {
            config.log_level = logging::LogLevel::Trace;
        }

        CAPDISC_LOG_DEBUG("Verbosity level: " << verbosity);
        CAPDISC_LOG_DEBUG("Mode: " << (is_probe ? "probe" : "respond"));
        CAPDISC_LOG_TRACE("Command line arguments parsed successfully");
    }
    catch (const po::error& error)
    {
        CAPDISC_LOG_ERROR("Error parsing command line: " << error.what());
        std::cerr << "Error: " << error.what() << '\n';
        std::cerr << desc << '\n';
        throw;
    }

    return config;
}

} // namespace capdisc
