#pragma once

#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "ApplicationContext.h"
#include "Export.h"
#include "ViewTypes.h"

namespace ViewMapper
{

// A configured root path split into the directory to scan and its optional extension filter.
// "/templates/*.xhtml" becomes {"/templates/", ".xhtml"}.
struct VIEWMAPPER_API RootPath
{
    std::string Directory;
    std::optional<std::string> ExtensionFilter;

    bool operator==(const RootPath&) const = default;
};

// Fails if the value holds more than one '*' or nothing after it.
// A directory without trailing '/' gets one appended.
VIEWMAPPER_API std::expected<RootPath, std::string> ParseRootPath(std::string_view Configured);

class VIEWMAPPER_API RootPathRegistry
{
public:
    // Configured scan paths plus kDefaultViewsRoot, read from the init parameters on first
    // call and cached in the context afterwards
    static std::shared_ptr<const RootPathSet> GetRootPaths(ApplicationContext& Context);

    // GetRootPaths() parsed into RootPath values, in set order. Fails on the first malformed entry.
    static std::expected<std::vector<RootPath>, std::string> ResolveRootPaths(ApplicationContext& Context);
};

} // namespace ViewMapper
