#pragma once

#include <string_view>

namespace ViewMapper
{

// Well-known directory where views are placed by convention. Always scanned.
inline constexpr std::string_view kDefaultViewsRoot = "/WEB-INF/faces-views/";

// Comma separated list of additional root paths to scan. A root may restrict scanning
// to one extension with a "*" suffix, e.g. "/templates/*.xhtml".
inline constexpr std::string_view kScanPathsParam = "viewmapper.SCAN_PATHS";

// Set to "false" to switch scanning off completely
inline constexpr std::string_view kEnabledParam = "viewmapper.ENABLED";

// When "true", scanned views are always rendered extensionless in generated links. Otherwise
// this follows whether the request URI itself used an extension.
inline constexpr std::string_view kScannedViewsExtensionlessParam = "viewmapper.SCANNED_VIEWS_ALWAYS_EXTENSIONLESS";

} // namespace ViewMapper
