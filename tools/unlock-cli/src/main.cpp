#include "commands.hpp"
#include <iostream>
#include <string>
#include <vector>
#include <cstring>

using namespace unlock::cli;

void print_version() {
    std::cout << "Unlock CLI v0.1.0\n";
}

namespace {

bool parse_double(const std::string& text, double& out) {
    try {
        size_t used = 0;
        out = std::stod(text, &used);
        return used == text.size();
    } catch (const std::exception&) {
        return false;
    }
}

Result usage_error(const char* message, const char* usage) {
    std::cerr << "Error: " << message << "\n";
    std::cerr << "Usage: " << usage << "\n";
    return Result::InvalidArgs;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        cmd_help();
        return static_cast<int>(Result::InvalidArgs);
    }

    // Split options from positional arguments
    Options options;
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--sites") == 0 && i + 1 < argc) {
            options.sites_path = argv[++i];
        } else if (std::strcmp(argv[i], "--store") == 0 && i + 1 < argc) {
            options.store_path = argv[++i];
        } else if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            options.config_path = argv[++i];
        } else {
            args.emplace_back(argv[i]);
        }
    }

    if (args.empty()) {
        cmd_help();
        return static_cast<int>(Result::InvalidArgs);
    }

    const std::string& command = args[0];

    // Handle version flag
    if (command == "--version" || command == "-v") {
        print_version();
        return 0;
    }

    // Handle help
    if (command == "help" || command == "--help" || command == "-h") {
        cmd_help();
        return 0;
    }

    Session session;
    Result opened = open_session(options, session);
    if (opened != Result::Success) {
        return static_cast<int>(opened);
    }
    auto& engine = *session.engine;

    if (command == "status") {
        return static_cast<int>(cmd_status(engine));
    }

    if (command == "scholar") {
        if (args.size() < 2) {
            return static_cast<int>(usage_error("'scholar' requires a sub-location id", "unlock-cli scholar <sub-location>"));
        }
        return static_cast<int>(cmd_scholar(engine, args[1]));
    }

    if (command == "quiz") {
        if (args.size() < 2) {
            return static_cast<int>(usage_error("'quiz' requires a quiz id", "unlock-cli quiz <quiz-id>"));
        }
        return static_cast<int>(cmd_quiz(engine, args[1]));
    }

    if (command == "discover") {
        if (args.size() < 2) {
            return static_cast<int>(usage_error("'discover' requires a place id", "unlock-cli discover <place-id>"));
        }
        return static_cast<int>(cmd_discover(engine, args[1]));
    }

    if (command == "verify") {
        const char* usage = "unlock-cli verify <site> <lat> <lon> [accuracy-m]";
        if (args.size() < 4) {
            return static_cast<int>(usage_error("'verify' requires a site id and a position", usage));
        }

        double latitude = 0.0;
        double longitude = 0.0;
        double accuracy = 10.0;
        if (!parse_double(args[2], latitude) || !parse_double(args[3], longitude) ||
            (args.size() > 4 && !parse_double(args[4], accuracy))) {
            return static_cast<int>(usage_error("coordinates must be numbers", usage));
        }
        return static_cast<int>(cmd_verify(engine, args[1], latitude, longitude, accuracy));
    }

    if (command == "self-report") {
        if (args.size() < 2) {
            return static_cast<int>(usage_error("'self-report' requires a site id", "unlock-cli self-report <site>"));
        }
        return static_cast<int>(cmd_self_report(engine, args[1]));
    }

    if (command == "favorite") {
        if (args.size() < 2) {
            return static_cast<int>(usage_error("'favorite' requires a site id", "unlock-cli favorite <site>"));
        }
        return static_cast<int>(cmd_favorite(engine, args[1]));
    }

    if (command == "achievements") {
        return static_cast<int>(cmd_achievements(engine));
    }

    if (command == "reset") {
        return static_cast<int>(cmd_reset(engine));
    }

    std::cerr << "Unknown command: " << command << "\n";
    std::cerr << "Run 'unlock-cli help' for usage information.\n";
    return static_cast<int>(Result::InvalidArgs);
}
