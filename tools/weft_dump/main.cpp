/**
 * Markup dump tool
 * Usage: weft-dump [options] [file] or pipe source to stdin
 *
 *   --flat              flatten the tree
 *   --strict            stop at the first diagnostic
 *   --recover-blocks    keep blocks that fail to parse
 *   --self-closing=a,b  elements without children
 *   --raw-text=a,b      elements whose content is kept verbatim
 *   --log=level         trace, debug, info, warn, error, off
 *   --log-file=path     also append log records to a file
 */

#include "weft/markup/parser.hpp"
#include "weft/tokens/lexer.hpp"
#include "weft/tokens/source.hpp"
#include "weft/core/logger.hpp"
#include <fstream>
#include <iostream>
#include <set>
#include <sstream>
#include <string_view>

using namespace weft;

namespace {

void add_names(std::set<String>& names, std::string_view list) {
    for (const auto& name : String(list).split(',')) {
        String trimmed = name.trim();
        if (!trimmed.empty()) {
            names.insert(trimmed);
        }
    }
}

void print_raw_texts(std::ostream& out, const std::vector<markup::Node>& nodes,
                     const tokens::SourceMap& source) {
    for (const auto& node : nodes) {
        if (const auto* raw = node.as_raw_text()) {
            out << "  " << raw->span().line << ":" << raw->span().column << " \""
                << raw->to_string_best(&source).c_str() << "\"\n";
        } else if (const auto* children = node.children()) {
            print_raw_texts(out, *children, source);
        }
    }
}

int run(int argc, char* argv[]) {
    markup::ParserConfig config;
    const char* path = nullptr;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];
        if (arg == "--flat") {
            config.flatten_tree = true;
        } else if (arg == "--strict") {
            config.strict_mode = true;
        } else if (arg == "--recover-blocks") {
            config.recover_invalid_blocks = true;
        } else if (arg.starts_with("--self-closing=")) {
            add_names(config.self_closing_names, arg.substr(15));
        } else if (arg.starts_with("--raw-text=")) {
            add_names(config.raw_text_names, arg.substr(11));
        } else if (arg.starts_with("--log=")) {
            auto level = parse_log_level(arg.substr(6));
            if (!level) {
                std::cerr << "Error: Unknown log level: " << arg.substr(6) << "\n";
                return 1;
            }
            logging::set_level(*level);
        } else if (arg.starts_with("--log-file=")) {
            auto sink = std::make_unique<FileSink>(String(arg.substr(11)));
            if (!sink->is_open()) {
                std::cerr << "Error: Cannot open log file: " << arg.substr(11) << "\n";
                return 1;
            }
            logging::add_sink(std::move(sink));
        } else if (arg.starts_with("--")) {
            std::cerr << "Error: Unknown option: " << arg << "\n";
            return 1;
        } else {
            path = argv[i];
        }
    }

    String source;
    if (path) {
        std::ifstream file(path, std::ios::in | std::ios::binary);
        if (!file) {
            std::cerr << "Error: Cannot open file: " << path << "\n";
            return 1;
        }
        std::stringstream buffer;
        buffer << file.rdbuf();
        source = String(buffer.str());
    } else {
        std::stringstream buffer;
        buffer << std::cin.rdbuf();
        source = String(buffer.str());
    }

    auto lexed = tokens::tokenize(source.view());
    if (lexed.is_err()) {
        std::cerr << "Error: " << lexed.error().to_string().c_str() << "\n";
        return 1;
    }

    tokens::SourceMap source_map(source);
    auto outcome = markup::parse_recoverable(lexed.value(), config);

    if (outcome.value()) {
        std::cout << "=== Nodes ===\n";
        std::cout << markup::debug_string(*outcome.value()).c_str();

        std::ostringstream raw;
        print_raw_texts(raw, *outcome.value(), source_map);
        if (!raw.str().empty()) {
            std::cout << "\n=== Raw Text ===\n" << raw.str();
        }
    }

    if (!outcome.diagnostics().empty()) {
        std::cout << "\n=== Diagnostics ===\n";
        for (const auto& diagnostic : outcome.diagnostics()) {
            std::cout << "  - " << diagnostic.to_string().c_str() << "\n";
            for (const auto& secondary : diagnostic.secondary_spans) {
                std::cout << "    " << secondary.span.line << ":" << secondary.span.column
                          << ": " << secondary.label.c_str() << "\n";
            }
        }
    }

    return outcome.is_failed() ? 1 : 0;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    logging::init();
    logging::set_level(LogLevel::Warn);

    int code = run(argc, argv);

    logging::shutdown();
    return code;
}
