// pos_monitor.cpp

#ifdef DEBUG
#define POSCLI_LOG(x) do { std::cerr << x << std::endl; } while(0)
#else
#define POSCLI_LOG(x) do {} while(0)
#endif

#include "pos_monitor.h"

#include <cstdint>
#include <cstdlib>
#include <exception>
#include <iostream>

int run_monitor(PosCli& cli, std::ostream& out, std::ostream& err) {
    int rv = EXIT_SUCCESS;
    uint64_t samples = 0;

    try {
        out << "Waiting for " << cli.config().socket_path << std::endl;
        cli.connect();
        out << "Connected" << std::endl;

        cli.run([&samples](const PositionSample &s) {
            ++samples;
            POSCLI_LOG("pos=" << s.position << " t=" << s.timestamp_ns << " ns");
        });
    } catch (const ConnectionError &ex) {
        // a cancelled wait is how a stop during connect() surfaces
        if (!cli.stop_requested()) {
            err << "Error connecting to motors process - " << ex.what() << std::endl;
            rv = EXIT_FAILURE;
        }
    } catch (const std::exception &ex) {
        err << "Error during execution: " << ex.what() << std::endl;
        rv = EXIT_FAILURE;
    }

    out << "samples=" << samples
        << " requests=" << cli.requests()
        << " protocol_errors=" << cli.protocol_errors() << std::endl;
    cli.round_trip().print_statistics(out);

    return rv;
}
