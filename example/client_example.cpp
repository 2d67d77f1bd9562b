// client_example.cpp
//
// Position monitor built on the C++ position client.
// Waits for the motor process socket, then polls the motor position every
// request_period_ms until SIGINT / SIGTERM, and prints round-trip statistics.

#ifdef DEBUG
#define POSCLI_LOG(x) do { std::cerr << x << std::endl; } while(0)
#else
#define POSCLI_LOG(x) do {} while(0)
#endif

#include "pos_client.h"
#include "pos_monitor.h"
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <pthread.h>
#include <thread>

int main() {
    // Block the stop signals before any thread starts so only sigwait() sees them.
    sigset_t stop_signals;
    sigemptyset(&stop_signals);
    sigaddset(&stop_signals, SIGINT);
    sigaddset(&stop_signals, SIGTERM);
    if (pthread_sigmask(SIG_BLOCK, &stop_signals, nullptr) != 0) {
        std::cerr << "Failed to block stop signals" << std::endl;
        return EXIT_FAILURE;
    }

    PosCli cli;  // default socket path of the motor process

    std::thread signal_thread([&cli, &stop_signals] {
        int sig = 0;
        if (sigwait(&stop_signals, &sig) == 0) {
            POSCLI_LOG("[monitor] signal " << sig << " received, stopping");
        }
        cli.stop();
    });

    const int rv = run_monitor(cli, std::cout, std::cerr);

    // Wake the signal thread if we are leaving on an error.
    if (!cli.stop_requested()) {
        cli.stop();
        pthread_kill(signal_thread.native_handle(), SIGTERM);
    }
    signal_thread.join();

    return rv;
}
