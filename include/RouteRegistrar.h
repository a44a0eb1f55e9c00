#pragma once

#include "ApplicationContext.h"
#include "Export.h"
#include "ViewTypes.h"

namespace ViewMapper
{

class VIEWMAPPER_API RouteRegistrar
{
public:
    // Maps the host's dispatcher to each extension pattern it isn't mapped to yet.
    // Does nothing if the host has no dispatcher.
    static void MapDispatcher(ApplicationContext& Context, const ExtensionSet& Extensions);
};

} // namespace ViewMapper
