#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

#include "cli.hpp"
#include "commands.hpp"
#include "KeyManager.hpp"

using namespace codesync;

namespace {

bool env_verbose() {
    const char* value = std::getenv("CODESYNC_VERBOSE");
    if (!value) return false;
    std::string v(value);
    return !v.empty() && v != "0" && v != "false";
}

} // namespace

int main(int argc, char* argv[]) {
    // stdout carries results; logs go to stderr.
    spdlog::set_default_logger(spdlog::stderr_color_mt("codesync"));
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");
    spdlog::set_level(spdlog::level::info);

    Args args;
    try {
        args = parse_cli(argc, argv);
    } catch (const UsageError& e) {
        std::cerr << e.what() << "\n" << usage();
        return kExitUsage;
    }
    if (args.help) {
        std::cout << usage();
        return kExitOk;
    }
    if (args.verbose || env_verbose()) spdlog::set_level(spdlog::level::debug);

    return run_command(args, [](const Args& a) {
        return make_runtime(a, std::make_shared<KeyManager>());
    }, std::cout);
}
