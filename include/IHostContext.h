#pragma once

#include <cstdarg>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "Export.h"
#include "HostConfig.h"
#include "IDispatchRegistration.h"
#include "IResourceTree.h"

namespace ViewMapper
{

// The hosting environment as seen by the view scanning code
class VIEWMAPPER_API IHostContext
{
public:
    virtual ~IHostContext() = default;

    // Logging
    virtual void LogInfo(const char* Fmt, ...) = 0;
    virtual void LogWarn(const char* Fmt, ...) = 0;
    virtual void LogError(const char* Fmt, ...) = 0;

    // Configuration
    virtual std::optional<std::string> GetInitParameter(std::string_view Name) const = 0;

    // Resource tree
    virtual const IResourceTree& GetResourceTree() const = 0;

    // Dispatcher registration, or nullptr if the host has none
    virtual IDispatchRegistration* FindDispatcher() = 0;
};

// Creates a console-logging host over a FileSystemResourceTree rooted at Config.WebRoot
VIEWMAPPER_API std::unique_ptr<IHostContext> CreateHostContext(const HostConfig& Config);

} // namespace ViewMapper
