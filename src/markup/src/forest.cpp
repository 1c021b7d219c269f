/**
 * Element forest construction
 */

#include "folio/markup/forest.hpp"
#include "folio/core/logger.hpp"

namespace folio::markup {

namespace {

std::string_view strip_utf8_bom(std::string_view input) {
    if (input.size() >= 3 && static_cast<unsigned char>(input[0]) == 0xEF &&
        static_cast<unsigned char>(input[1]) == 0xBB &&
        static_cast<unsigned char>(input[2]) == 0xBF) {
        return input.substr(3);
    }
    return input;
}

} // anonymous namespace

Result<ParsedForest, MarkupError> parse_forest(std::string_view input, const ForestOptions& options) {
    auto& log = logging::get("folio.markup");

    if (auto invalid = unicode::utf8_find_invalid(input)) {
        StringBuilder message;
        message.append_format("malformed UTF-8 sequence at byte {}", *invalid);
        return make_error(MarkupError{MarkupErrorKind::InvalidUtf8, message.build(), *invalid});
    }

    if (auto nul = input.find('\0'); nul != std::string_view::npos) {
        StringBuilder message;
        message.append_format("NUL character at byte {}", nul);
        return make_error(MarkupError{MarkupErrorKind::NullCharacter, message.build(), nul});
    }

    auto body = strip_utf8_bom(input);
    usize bom_length = input.size() - body.size();

    ParsedForest result;
    auto record = [&result, &log](const String& message) {
        log.debug_fmt("recovered from irregular markup: {}", message);
        result.recoveries.push_back(message);
    };

    Tokenizer tokenizer;
    tokenizer.set_input(body);
    tokenizer.set_error_callback(record);

    TreeBuilder builder(options.max_depth);
    builder.set_error_callback(record);

    while (!builder.finished() && !builder.fatal_error()) {
        auto token = tokenizer.next_token();
        if (!token) {
            break;
        }
        builder.process_token(*token);
    }

    if (auto& fatal = builder.fatal_error()) {
        MarkupError error = *fatal;
        error.offset += bom_length;
        log.debug_fmt("markup rejected: {}", error.message);
        return make_error(std::move(error));
    }

    result.elements = builder.take_forest();
    log.trace_fmt("built element forest with {} top-level items and {} recoveries",
                  result.elements.size(), result.recoveries.size());
    return result;
}

} // namespace folio::markup
