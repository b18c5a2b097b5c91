#include <iostream>
#include <string>
#include <cxxopts.hpp>
#include <spdlog/spdlog.h>
#include "analyzer_config.h"
#include "conversation_analyzer.h"
#include "conversation_explorer.h"
#include "conversation_printer.h"
#include "selection.h"

using namespace chatmine;

namespace {

constexpr int EXIT_FILE_NOT_FOUND = 2;

void explain_empty_result(const AnalysisReport& report) {
    std::cout << "\nNo conversations could be reconstructed.\n"
              << "Possible causes:\n"
              << "- HISTORY blocks are missing or lack a leading timestamp (" << report.untimed_marker_lines
              << " marker lines without one)\n"
              << "- JSON in HISTORY blocks is malformed (" << report.skipped_blocks() << " of "
              << report.history_blocks << " blocks could not be decoded)\n"
              << "- Unexpected log file format\n";
}

} // namespace

int main(int argc, char* argv[]) {
    cxxopts::Options options("chatmine", "Reconstructs chat conversations from RAG server logs");

    options.add_options()
        ("logfile", "Path to the server log", cxxopts::value<std::string>()->default_value(DEFAULT_LOG_PATH))
        ("e,env-file", "Load settings from a .env file", cxxopts::value<std::string>())
        ("l,list", "Print the conversation overview and exit")
        ("c,conversation", "Show one conversation (number from the overview)", cxxopts::value<size_t>())
        ("m,message", "With --conversation, show one message", cxxopts::value<size_t>())
        ("d,document", "With --message, show one context document", cxxopts::value<size_t>())
        ("i,interactive", "Browse conversations interactively")
        ("r,resolve-late-responses", "Look for missing replies in later HISTORY blocks")
        ("v,verbose", "Debug logging")
        ("q,quiet", "Only log warnings and errors")
        ("h,help", "Print usage");
    options.parse_positional({"logfile"});
    options.positional_help("[logfile]");

    try {
        auto result = options.parse(argc, argv);

        if (result.count("help")) {
            std::cout << options.help() << std::endl;
            return 0;
        }

        Selection selection;
        if (result.count("conversation")) {
            selection.conversation = result["conversation"].as<size_t>();
        }
        if (result.count("message")) {
            selection.message = result["message"].as<size_t>();
        }
        if (result.count("document")) {
            selection.document = result["document"].as<size_t>();
        }
        if (auto usage_error = selection_error(selection)) {
            std::cerr << "Error: " << *usage_error << std::endl;
            return 1;
        }

        if (result.count("env-file")) {
            const std::string env_file = result["env-file"].as<std::string>();
            if (!EnvFile::load(env_file)) {
                std::cerr << "Error: could not read " << env_file << std::endl;
                return 1;
            }
            spdlog::info("Loaded {} settings from {}", EnvFile::loaded().size(), env_file);
        }

        AnalyzerConfig config = AnalyzerConfig::from_env();
        if (result.count("verbose")) {
            config.log_level = "debug";
        } else if (result.count("quiet")) {
            config.log_level = "warn";
        }
        if (result.count("resolve-late-responses")) {
            config.resolve_late_responses = true;
        }
        apply_log_level(config);

        const std::string log_path = result["logfile"].as<std::string>();
        std::cout << "Log file: " << log_path << std::endl;

        ConversationAnalyzer analyzer(config);
        AnalysisStatus status = analyzer.analyze(log_path);

        if (status == AnalysisStatus::FILE_NOT_FOUND) {
            std::cerr << "File not found or unreadable: " << log_path << std::endl;
            return EXIT_FILE_NOT_FOUND;
        }
        if (status == AnalysisStatus::NO_CONVERSATIONS) {
            explain_empty_result(analyzer.report());
            return 0;
        }

        const auto& conversations = analyzer.conversations();
        ConversationPrinter printer(config.missing_response_text);

        if (!selection.empty()) {
            ResolvedSelection resolved = resolve_selection(conversations, selection);
            if (!resolved.error.empty()) {
                std::cerr << resolved.error << std::endl;
                return 1;
            }
            if (resolved.document) {
                printer.print_document(std::cout, *resolved.document);
            } else if (resolved.message) {
                printer.print_message(std::cout, *resolved.message);
            } else {
                printer.print_conversation(std::cout, *resolved.conversation);
            }
            return 0;
        }

        if (result.count("interactive") && !result.count("list")) {
            ConversationExplorer explorer(conversations, printer, std::cin, std::cout);
            explorer.run();
            return 0;
        }

        printer.print_overview(std::cout, conversations);
    }
    catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
