#include "folio/nodes/payloads.hpp"

namespace folio::nodes {

namespace {

String or_empty(const std::optional<String>& value) {
    return value.value_or(String());
}

void append_version(StringBuilder& builder, const std::optional<i32>& version) {
    if (version) {
        builder.append_format("@v{}", *version);
    }
}

} // anonymous namespace

std::optional<String> ResourceIdentifier::canonical_uri() const {
    StringBuilder builder;

    switch (kind) {
        case ResourceKind::User:
            if (!account_id) {
                return std::nullopt;
            }
            builder.append_format("user://{}", *account_id);
            break;

        case ResourceKind::Page:
            if (!content_title) {
                return std::nullopt;
            }
            builder.append_format("page://{}/{}", or_empty(space_key), *content_title);
            append_version(builder, version_at_save);
            break;

        case ResourceKind::BlogPost:
            if (!content_title) {
                return std::nullopt;
            }
            builder.append_format("blog://{}/{}@{}", or_empty(space_key), *content_title, or_empty(posting_day));
            break;

        case ResourceKind::Space:
            if (!space_key) {
                return std::nullopt;
            }
            builder.append_format("space://{}", *space_key);
            break;

        case ResourceKind::Attachment:
            if (!filename) {
                return std::nullopt;
            }
            builder.append_format("attach://{}", *filename);
            append_version(builder, version_at_save);
            break;

        case ResourceKind::ContentEntity:
            if (!content_id) {
                return std::nullopt;
            }
            builder.append_format("contentid://{}", *content_id);
            break;

        case ResourceKind::Shortcut:
            if (!shortcut_key || !shortcut_parameter) {
                return std::nullopt;
            }
            builder.append_format("shortcut://{}/{}", *shortcut_key, *shortcut_parameter);
            break;

        case ResourceKind::Url:
            if (!value || value->empty()) {
                return std::nullopt;
            }
            return *value;
    }

    return builder.build();
}

} // namespace folio::nodes
