#pragma once

#include <iosfwd>

#include "pos_client.h"

/**
 * @brief Position monitor loop used by pos_cli_monitor.
 *
 * Waits for the motor process socket, polls the position until cli.stop()
 * is called and prints the sample counters and round-trip statistics to out.
 * A stop() during the socket wait is a clean exit.
 *
 * @return EXIT_SUCCESS, or EXIT_FAILURE after reporting the error on err
 */
int run_monitor(PosCli& cli, std::ostream& out, std::ostream& err);
