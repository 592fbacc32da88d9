#include "platform_factory.hpp"
#include "pid_resolver.hpp"
#include "reporter.hpp"
#include "role.hpp"
#include "run_context.hpp"
#include "run_lock.hpp"
#include "shutdown_orchestrator.hpp"
#include "steady_clock.hpp"
#include "termination_controller.hpp"
#include <getopt.h>
#include <unistd.h>
#include <format>
#include <iostream>
#include <memory>

namespace {

struct option longopts[] = {
    { "help", no_argument, nullptr, 'h' },
    { "verbose", no_argument, nullptr, 'v' },
    { "no-color", no_argument, nullptr, 'n' },
    { nullptr, 0, nullptr, 0 }
};

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [options] [BENCH_DIR]\n"
              << "Gracefully stop every process of a bench (default BENCH_DIR: current directory).\n\n"
              << "  -v, --verbose    show how each process was looked up\n"
              << "      --no-color   plain output\n"
              << "  -h, --help       show this help\n";
}

} // namespace

int main(int argc, char* argv[]) {
    bool verbose = false;
    bool color = true;

    int opt = 0;
    while ((opt = getopt_long(argc, argv, "hv", longopts, nullptr)) != -1) {
        switch (opt) {
            case 'h':
                print_usage(argv[0]);
                return stackstop::kExitSuccess;
            case 'v':
                verbose = true;
                break;
            case 'n':
                color = false;
                break;
            default:
                print_usage(argv[0]);
                return stackstop::kExitError;
        }
    }

    if (argc - optind > 1) {
        print_usage(argv[0]);
        return stackstop::kExitError;
    }

    try {
        auto context = stackstop::RunContext::from_bench_dir(optind < argc ? argv[optind] : ".");
        context.verbose = verbose;
        context.color = color;

        stackstop::Reporter reporter(std::cout,
                                     context.color ? stackstop::Reporter::detect_colors(STDOUT_FILENO)
                                                   : stackstop::Reporter::Colors{},
                                     context.verbose);

        stackstop::RunLock lock(context.bench_dir);
        if (!lock.try_acquire()) {
            reporter.error(std::format("Another shutdown of {} is already in progress", context.bench_dir.string()));
            return stackstop::kExitError;
        }

        // Create platform-specific backends (owned here in main)
        auto process_table = stackstop::make_process_table();
        auto port_lookup = stackstop::make_port_lookup();
        auto killer = stackstop::make_process_killer();
        stackstop::SteadyClock clock;

        reporter.debug(std::format("Port lookup: {}", port_lookup->name()));

        stackstop::PidResolver resolver(process_table.get(), port_lookup.get(), killer.get(), &reporter);
        stackstop::TerminationController controller(killer.get(), &clock, &reporter);
        stackstop::ShutdownOrchestrator orchestrator(&context, &resolver, &controller, &reporter);

        const auto summary = orchestrator.run(stackstop::default_roles(context));
        return summary.exit_code();
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return stackstop::kExitError;
    }
}
