/*
 * dagpool - Gang-scheduled Workflow Core
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "dagpool/logger.hpp"
#include "dagpool/submission.hpp"
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <iterator>
#include <string>
#include <unistd.h>

using namespace dagpool;

constexpr const char* VERSION = "0.1.0";

void printUsage(const char* progName) {
    std::cout << "dagpool Workflow Submission Tool v" << VERSION << "\n\n";
    std::cout << "Usage: " << progName << " <workspace> <workflow.yaml> [--user <name>]\n";
    std::cout << "       " << progName << " <workspace> -     (read definition from stdin)\n";
    std::cout << "       " << progName << " --help | --version\n\n";
    std::cout << "Arguments:\n";
    std::cout << "  workspace       Daemon workspace directory\n";
    std::cout << "  workflow.yaml   Workflow definition\n";
    std::cout << "  -               Read the definition from stdin\n\n";
    std::cout << "Options:\n";
    std::cout << "  -u, --user <name>  Submit on behalf of <name> (default: $USER)\n";
    std::cout << "  -h, --help         Show this help message\n";
    std::cout << "  -v, --version      Show version\n\n";
    std::cout << "Environment Variables:\n";
    std::cout << "  DAGPOOL_LOG_LEVEL    Log level (ERROR, WARN, INFO, DEBUG, TRACE)\n\n";
    std::cout << "Examples:\n";
    std::cout << "  " << progName << " ./workspace train.yaml\n";
    std::cout << "  " << progName << " ./workspace train.yaml --user alice\n";
    std::cout << "  cat train.yaml | " << progName << " ./workspace -\n";
}

int main(int argc, char* argv[]) {
    // Default to WARN for clean piping; DAGPOOL_LOG_LEVEL overrides
    if (!std::getenv("DAGPOOL_LOG_LEVEL"))
        Logger::setLevel(LogLevel::WARN);

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        }
        if (arg == "-v" || arg == "--version") {
            std::cout << VERSION << "\n";
            return 0;
        }
    }

    if (argc < 2) {
        printUsage(argv[0]);
        return 1;
    }

    std::string workspace = argv[1];
    std::string source;
    std::string user;

    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--user" || arg == "-u") {
            if (i + 1 >= argc) {
                std::cerr << "Error: --user requires a name\n";
                return 1;
            }
            user = argv[++i];
        } else if (source.empty()) {
            source = arg;
        } else {
            std::cerr << "Error: Unexpected argument: " << arg << "\n";
            return 1;
        }
    }

    bool readStdin = source == "-" || (source.empty() && !isatty(fileno(stdin)));
    if (source.empty() && !readStdin) {
        printUsage(argv[0]);
        return 1;
    }

    try {
        Submitter submitter(workspace, true);

        SubmitResult result;
        if (readStdin) {
            std::string yaml((std::istreambuf_iterator<char>(std::cin)),
                             std::istreambuf_iterator<char>());
            result = submitter.submit(yaml, user);
        } else {
            result = submitter.submitFile(source, user);
        }

        if (result) {
            // Just the workflow ID - clean for piping
            std::cout << result.id << std::endl;
            return 0;
        }
        std::cerr << "Error: " << toString(result.error) << ": " << result.message << std::endl;
        return 1;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
