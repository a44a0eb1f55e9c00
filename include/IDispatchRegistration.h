#pragma once

#include <string>
#include <vector>

#include "Export.h"

namespace ViewMapper
{

// Registration of the request-dispatching component with the host's router
class VIEWMAPPER_API IDispatchRegistration
{
public:
    virtual ~IDispatchRegistration() = default;

    virtual const char* GetName() const = 0;

    // Currently registered URL patterns, e.g. "*.xhtml" or "/app/*"
    virtual std::vector<std::string> GetMappings() const = 0;

    virtual void AddMapping(const std::string& Pattern) = 0;
};

} // namespace ViewMapper
