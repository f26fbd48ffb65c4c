// Copyright (c) 2026 changcheng967. All rights reserved.

#include <relay/cli/commands.hpp>
#include <relay/core/http_client.hpp>
#include <relay/core/log.hpp>
#include <iostream>
#include <exception>
#include <cstdlib>

using namespace relay::cli;

// Terminate handler to report exceptions escaping noexcept functions
static void relay_terminate_handler() {
    static bool in_terminate = false;
    if (in_terminate) {
        std::abort();
    }
    in_terminate = true;

    std::cerr << "FATAL: std::terminate called!" << std::endl;
    if (auto current = std::current_exception()) {
        try {
            std::rethrow_exception(current);
        } catch (const std::exception& e) {
            std::cerr << "Exception: " << e.what() << std::endl;
        } catch (...) {
            std::cerr << "Unknown exception in noexcept context" << std::endl;
        }
    }
    std::abort();
}

int main(int argc, char* argv[]) {
    std::set_terminate(relay_terminate_handler);

    CliArgs args = parse_args(argc, argv);

    if (args.help) {
        print_help(argv[0]);
        return 0;
    }

    if (args.version) {
        print_version();
        return 0;
    }

    if (!args.error.empty()) {
        std::cerr << "Error: " << args.error << std::endl;
        std::cerr << "Use -h for help" << std::endl;
        return 2;
    }

    if (args.verbose) {
        relay::core::init_logging(spdlog::level::debug);
    } else if (args.quiet) {
        relay::core::init_logging(spdlog::level::warn);
    } else {
        relay::core::init_logging(spdlog::level::info);
    }

    relay::core::HttpClient::global_init();
    auto result = run(args);
    relay::core::HttpClient::global_cleanup();

    if (!result) {
        return 1;
    }
    return *result;
}
