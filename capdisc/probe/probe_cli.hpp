#pragma once

#include "capdisc/probe/probe_config.hpp"

namespace capdisc
{

/**
 * Parses the capdisc_probe command line. Prints usage and exits on --help.
 * Throws boost::program_options::error on invalid arguments.
 */
ProbeConfig parse_command_line(int argc, const char* const argv[]);

} // namespace capdisc
