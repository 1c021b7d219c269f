/**
 * Parser implementation
 */

#include "folio/parser/parser.hpp"
#include "folio/parser/dispatcher.hpp"
#include "folio/markup/forest.hpp"
#include "folio/nodes/payloads.hpp"
#include "folio/core/logger.hpp"

namespace folio::parser {

namespace {

// Whitespace-only text between top-level elements is not content
markup::Forest significant_elements(markup::Forest forest) {
    markup::Forest result;
    result.reserve(forest.size());
    for (auto& element : forest) {
        if (element.is_text() && !element.is_cdata() && element.data().is_blank()) {
            continue;
        }
        result.push_back(std::move(element));
    }
    return result;
}

nodes::NodePtr consolidate_root(nodes::NodeList nodes) {
    if (nodes.empty()) {
        return nullptr;
    }
    if (nodes.size() == 1) {
        return std::move(nodes.front());
    }
    return nodes::Node::create(nodes::Fragment{}, std::move(nodes));
}

String summarize(const std::vector<String>& diagnostics) {
    StringBuilder builder;
    builder.append_format("{} diagnostic(s) recorded while parsing: ", diagnostics.size());
    for (usize i = 0; i < diagnostics.size(); ++i) {
        if (i > 0) {
            builder.append(", ");
        }
        builder.append(diagnostics[i]);
    }
    return builder.build();
}

} // anonymous namespace

std::string_view parse_error_kind_name(ParseErrorKind kind) {
    switch (kind) {
        case ParseErrorKind::Tokenize: return "tokenize";
        case ParseErrorKind::Diagnostics: return "diagnostics";
    }
    return "unknown";
}

Result<nodes::Document, ParseError> Parser::parse(std::string_view input) const {
    auto& log = logging::get("folio.parser");

    markup::ForestOptions forest_options;
    forest_options.max_depth = m_options.max_depth;

    auto forest = markup::parse_forest(input, forest_options);
    if (forest.is_err()) {
        const auto& error = forest.error();
        log.warn_fmt("cannot tokenize markup ({}): {}", markup::markup_error_kind_name(error.kind), error.message);
        return make_error(ParseError{ParseErrorKind::Tokenize, error.message, {}});
    }

    auto parsed = std::move(forest).value();

    Diagnostics diagnostics;
    auto elements = significant_elements(std::move(parsed.elements));
    auto root = consolidate_root(Dispatcher::dispatch_all(elements, diagnostics));

    nodes::DocumentMetadata metadata;
    metadata.diagnostics = diagnostics.take();
    metadata.recoveries = std::move(parsed.recoveries);

    nodes::Document document(std::move(root), std::move(metadata));
    log.debug_fmt("parsed {} bytes into {} nodes ({} diagnostics, {} recoveries)",
                  input.size(), document.metadata().node_count,
                  document.metadata().diagnostics.size(), document.metadata().recoveries.size());

    if (m_options.strict && !document.diagnostics().empty()) {
        auto message = summarize(document.diagnostics());
        log.warn(message.view());
        return make_error(ParseError{ParseErrorKind::Diagnostics, std::move(message), document.diagnostics()});
    }

    return document;
}

Result<nodes::Document, ParseError> parse(std::string_view input, const ParserOptions& options) {
    Parser parser(options);
    return parser.parse(input);
}

} // namespace folio::parser
