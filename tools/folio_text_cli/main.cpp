/**
 * Storage-format text extraction CLI
 * Usage: folio-text [--lenient] [--outline] [--log-level <level>] [--log-file <path>] [file]
 *        or pipe markup to stdin
 */

#include "folio/parser/parser.hpp"
#include "folio/nodes/payloads.hpp"
#include "folio/nodes/text_renderer.hpp"
#include "folio/core/logger.hpp"
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>

using namespace folio;

namespace {

void print_usage() {
    std::cerr << "Usage: folio-text [--lenient] [--outline] [--log-level <level>] [--log-file <path>] [file]\n";
}

// Short per-kind detail shown next to the kind name
String describe(const nodes::Node& node) {
    if (auto text = node.as<nodes::Text>()) {
        return "\""_s + nodes::flatten_text(text->text.view()) + "\""_s;
    }
    if (auto heading = node.as<nodes::Heading>()) {
        StringBuilder builder;
        builder.append_format("level={}", static_cast<int>(heading->level));
        return builder.build();
    }
    if (auto text_break = node.as<nodes::TextBreak>()) {
        return String(nodes::break_kind_name(text_break->kind));
    }
    if (auto effect = node.as<nodes::TextEffect>()) {
        return String(nodes::text_effect_kind_name(effect->effect));
    }
    if (auto list = node.as<nodes::List>()) {
        return String(nodes::list_kind_name(list->kind));
    }
    if (auto panel = node.as<nodes::PanelMacro>()) {
        return String(nodes::panel_kind_name(panel->kind));
    }
    if (auto link = node.as<nodes::Link>()) {
        return String(nodes::link_kind_name(link->kind));
    }
    if (auto resource = node.as<nodes::ResourceIdentifier>()) {
        return resource->canonical_uri().value_or(String(nodes::resource_kind_name(resource->kind)));
    }
    if (auto container = node.as<nodes::Container>()) {
        return container->tag;
    }
    return String();
}

void print_outline(const nodes::Node* node, int indent = 0) {
    if (!node) return;

    std::string prefix(indent * 2, ' ');
    std::cout << prefix << node->kind_name();

    auto detail = describe(*node);
    if (!detail.empty()) {
        std::cout << " " << detail;
    }
    std::cout << "\n";

    for (const auto& child : node->children()) {
        print_outline(child.get(), indent + 1);
    }
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    logging::init();
    logging::set_level(LogLevel::Warn);

    parser::ParserOptions options;
    bool outline = false;
    const char* path = nullptr;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];
        if (arg == "--lenient") {
            options.strict = false;
        } else if (arg == "--outline") {
            outline = true;
        } else if (arg == "--log-level") {
            if (i + 1 >= argc) {
                print_usage();
                return 1;
            }
            auto level = parse_log_level(argv[++i]);
            if (!level) {
                std::cerr << "Error: Unknown log level: " << argv[i] << "\n";
                return 1;
            }
            logging::set_level(*level);
        } else if (arg == "--log-file") {
            if (i + 1 >= argc) {
                print_usage();
                return 1;
            }
            auto sink = std::make_unique<FileSink>(argv[++i]);
            if (!sink->is_open()) {
                std::cerr << "Error: Cannot open log file: " << argv[i] << "\n";
                return 1;
            }
            logging::add_sink(std::move(sink));
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            return 0;
        } else if (!arg.empty() && arg.front() == '-') {
            std::cerr << "Error: Unknown option: " << arg << "\n";
            print_usage();
            return 1;
        } else {
            path = argv[i];
        }
    }

    String markup;

    if (path) {
        // Read from file
        std::ifstream file(path, std::ios::binary);
        if (!file) {
            std::cerr << "Error: Cannot open file: " << path << "\n";
            return 1;
        }
        std::stringstream buffer;
        buffer << file.rdbuf();
        markup = String(buffer.str());
    } else {
        // Read from stdin
        std::stringstream buffer;
        buffer << std::cin.rdbuf();
        markup = String(buffer.str());
    }

    parser::Parser parser(options);
    auto result = parser.parse(markup.view());

    if (result.is_err()) {
        const auto& error = result.error();
        std::cerr << "Error: " << error.message << "\n";
        for (const auto& diagnostic : error.diagnostics) {
            std::cerr << "  - " << diagnostic << "\n";
        }
        logging::shutdown();
        return 2;
    }

    const auto& document = result.value();
    std::cout << document.text() << "\n";

    if (outline) {
        std::cout << "\n=== Outline ===\n";
        print_outline(document.root());
    }

    const auto& metadata = document.metadata();
    if (!metadata.diagnostics.empty()) {
        std::cout << "\n=== Diagnostics ===\n";
        for (const auto& diagnostic : metadata.diagnostics) {
            std::cout << "  - " << diagnostic << "\n";
        }
    }
    if (!metadata.recoveries.empty()) {
        std::cout << "\n=== Recovered Markup ===\n";
        for (const auto& recovery : metadata.recoveries) {
            std::cout << "  - " << recovery << "\n";
        }
    }

    logging::shutdown();
    return 0;
}
