#ifndef MIRRORRANK_STATUS_HPP
#define MIRRORRANK_STATUS_HPP

#include <optional>
#include <string>

#include <nlohmann/json.hpp>
#include <tl/expected.hpp>

#include <mirrorrank/export.hpp>
#include <mirrorrank/directory.hpp>
#include <mirrorrank/errors.hpp>

namespace mirrorrank
{
    class Context;

    // Decodes one entry of the `urls` array of a mirror status document.
    MIRRORRANK_API tl::expected<Endpoint, MirrorError> endpoint_from_json(
        const nlohmann::json& entry);

    // Decodes a whole mirror status document (`{"urls": [...], ...}`).
    // `source` overrides the `source` field of the document if any.
    // Any malformed entry makes the whole document fail: no partial directory is returned.
    MIRRORRANK_API tl::expected<Directory, MirrorError> directory_from_json(
        const nlohmann::json& document, std::optional<std::string> source = std::nullopt);

    MIRRORRANK_API tl::expected<Directory, MirrorError> parse_directory(
        const std::string& body, std::optional<std::string> source = std::nullopt);

    // Downloads and decodes the mirror status document found at `url`. The url becomes the
    // source of the returned directory.
    MIRRORRANK_API tl::expected<Directory, MirrorError> fetch_directory(const Context& ctx,
                                                                        const std::string& url);

    // Same as above, from `ctx.status_url`.
    MIRRORRANK_API tl::expected<Directory, MirrorError> fetch_directory(const Context& ctx);
}

#endif
