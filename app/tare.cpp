#include "modules.hpp"

#include <chrono>
#include <csignal>
#include <exception>
#include <iostream>
#include <stop_token>
#include <thread>

namespace {

    volatile std::sig_atomic_t interrupted = 0;

    extern "C" void on_interrupt(int) {
        interrupted = 1;
    }

    // The handler only raises a flag; this thread turns it into a stop request
    std::jthread watch_interrupts(std::stop_source target) {
        return std::jthread{[target](std::stop_token self) {
            while (!self.stop_requested()) {
                if (interrupted != 0) {
                    target.request_stop();
                    return;
                }
                std::this_thread::sleep_for(std::chrono::milliseconds{50});
            }
        }};
    }

}  // namespace

int main(int argc, char** argv) {
    try {
        tare::registry ops{};
        tare::demo::register_modules(ops);
        ops.validate();

        std::stop_source cancel{};
        std::signal(SIGINT, on_interrupt);
        auto watcher = watch_interrupts(cancel);

        return tare::cli::execute(
                argc,
                argv,
                ops.specs(),
                tare::make_memory_sandbox_factory(ops, tare::demo::genesis(), tare::demo::whitelisted_keys()),
                cancel.get_token());
    } catch (std::exception& e) {
        std::cerr << "fatal: " << e.what() << '\n';
        return 1;
    } catch (...) {
        std::cerr << "fatal: unknown exception\n";
        return 1;
    }
}
