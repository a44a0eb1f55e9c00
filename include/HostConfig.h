#pragma once

#include <string>
#include <unordered_map>
#include <vector>

#include "Export.h"

namespace ViewMapper
{

// Configuration for the built-in host (filesystem resource tree + in-process dispatcher)
struct VIEWMAPPER_API HostConfig
{
    // Directory on disk that backs the resource tree root "/"
    std::string WebRoot;

    // Init parameters, see ViewMapperParams.h for recognized names
    std::unordered_map<std::string, std::string> InitParameters;

    // Patterns the dispatcher is already mapped to before scanning
    std::vector<std::string> DispatcherMappings;

    // Without a dispatcher, route registration is skipped
    bool bEnableDispatcher = true;

    // Print [INFO] messages
    bool bVerbose = false;
};

} // namespace ViewMapper
