// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace icnx::core {

// Extension for a Content-Type value, empty when unrecognised
[[nodiscard]] std::string extension_from_content_type(std::string_view content_type);

// Extension for an item's declared type ("png", "jpeg", "image/webp"), "bin" when unrecognised
[[nodiscard]] std::string extension_from_type(std::string_view declared_type);

// Last URL path segment without query or fragment
[[nodiscard]] std::string url_filename(std::string_view url);

// Explicit name, else the URL's last segment when it carries an extension,
// else that segment plus an extension from the content-type or declared type.
[[nodiscard]] std::string resolve_filename(const std::optional<std::string>& explicit_name,
                                           std::string_view url,
                                           std::string_view content_type,
                                           const std::optional<std::string>& declared_type);

} // namespace icnx::core
