// Permitter hook entry point: PermissionRequest JSON on stdin, decision line on stdout
#include <permitter/hook/config.hpp>
#include <permitter/hook/hook.hpp>
#include <permitter/hook/settings.hpp>
#include <permitter/decide/engine.hpp>
#include <permitter/trace/trace.hpp>

#include <filesystem>
#include <iostream>
#include <iterator>
#include <utility>
#include <string>
namespace fs = std::filesystem;

static std::string current_dir() {
    std::error_code ec;
    auto p = fs::current_path(ec);
    return ec ? std::string(".") : p.string();
}

static void usage() {
    std::cerr << "usage: permitter-hook [-d|--debug]            (reads a PermissionRequest event on stdin)\n"
              << "       permitter-hook --explain '<command>'  (traces one decision against the current settings)\n";
}

// Traces one command against the settings of the current directory.
static int explain(const std::string& command, const std::string& cwd, const std::string& home) {
    permitter::StreamTrace trace(std::cout);
    auto perms = permitter::hook::load_permission_set(cwd, home, &std::cout);
    trace.note("rules: " + std::to_string(perms.allow.size()) + " allow, " + std::to_string(perms.deny.size()) + " deny");
    permitter::Engine engine(std::move(perms), &trace);
    auto v = engine.decide(command);
    std::cout << (v.allowed() ? "allow" : "ask") << '\n';
    return 0;
}

int main(int argc, char* argv[]) {
    auto env = permitter::hook::process_env();
    std::string home = env("HOME").value_or("");
    std::string cwd = current_dir();
    auto cfg = permitter::hook::load_config(home, env);

    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "-d" || a == "--debug") cfg.debug = true;
        else if (a == "--explain") {
            if (i + 1 >= argc) { usage(); return 2; }
            return explain(argv[i + 1], cwd, home);
        } else if (a == "-h" || a == "--help") { usage(); return 0; }
        else { usage(); return 2; }
    }

    std::string input((std::istreambuf_iterator<char>(std::cin)), std::istreambuf_iterator<char>());
    auto outcome = permitter::hook::run_hook(input, cfg, permitter::hook::HookEnv{cwd, home}, std::cerr);
    std::cout << outcome.output << std::flush;
    return outcome.exit_code;
}
