#include "capdisc/discovery/discovery_client.hpp"
#include "capdisc/discovery/payload_registry.hpp"
#include "capdisc/logging/capdisc_logging.hpp"
#include "capdisc/net/capability_responder.hpp"
#include "capdisc/net/udp_discovery_transport.hpp"
#include "capdisc/probe/probe_cli.hpp"

#include <boost/asio.hpp>
#include <boost/program_options.hpp>
#include <csignal>
#include <iostream>

namespace
{

int run_responder(const capdisc::ProbeConfig& config)
{
    boost::asio::io_context io_context;
    capdisc::CapabilityResponder responder(io_context, config.port);
    responder.add_peer(config.peer, config.features);

    boost::asio::signal_set signals(io_context, SIGINT, SIGTERM);
    signals.async_wait(
        [&responder, &io_context](const boost::system::error_code& error_code, int /*signal_number*/)
        {
            if (!error_code)
            {
                CAPDISC_LOG_INFO("Signal received, stopping responder");
                responder.async_stop([&io_context]() { io_context.stop(); });
            }
        });

    responder.async_start();
    io_context.run();
    return 0;
}

int run_probe(const capdisc::ProbeConfig& config)
{
    capdisc::UdpDiscoveryTransport transport(config.host, config.port, config.reply_timeout);
    capdisc::DiscoveryClient client(config.log_level);

    for (const auto& feature : client.discover(&transport, config.peer))
    {
        std::cout << feature << '\n';
    }
    return 0;
}

} // namespace

int main(int argc, char* argv[])
{
    capdisc::ProbeConfig config;
    try
    {
        config = capdisc::parse_command_line(argc, argv);
    }
    catch (const boost::program_options::error&)
    {
        return 1;
    }

    capdisc::logging::current_log_level = config.log_level;
    capdisc::initialize_protocol();

    try
    {
        return config.mode == capdisc::ProbeMode::probe ? run_probe(config) : run_responder(config);
    }
    catch (const boost::system::system_error& error)
    {
        CAPDISC_LOG_ERROR("Network error: " << error.what());
        return 1;
    }
}
