#pragma once

#include <cstddef>
#include <expected>
#include <string>

#include "ApplicationContext.h"
#include "Export.h"
#include "ViewTypes.h"

namespace ViewMapper
{

struct VIEWMAPPER_API InitializeSummary
{
    bool bEnabled = false;
    bool bStored = false; // False when nothing was found; the next lookup may scan again
    std::size_t ViewCount = 0;
    ExtensionSet Extensions;
};

// Application startup hook: validates the scan paths, scans and stores the views and
// maps the dispatcher to every extension found
class VIEWMAPPER_API ViewMapperInitializer
{
public:
    // Fails only on malformed scan path configuration
    static std::expected<InitializeSummary, std::string> Initialize(ApplicationContext& Context);

    // False only if kEnabledParam is "false" (any case)
    static bool IsEnabled(const ApplicationContext& Context);
};

} // namespace ViewMapper
