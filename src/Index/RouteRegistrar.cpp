#include "RouteRegistrar.h"

#include <algorithm>

namespace ViewMapper
{

  void RouteRegistrar::MapDispatcher(ApplicationContext& Context, const ExtensionSet& Extensions)
  {
    IHostContext& Host = Context.GetHost();

    IDispatchRegistration* Dispatcher = Host.FindDispatcher();
    if (!Dispatcher)
    {
      Host.LogInfo("No dispatcher registered, skipping mapping of %zu extensions", Extensions.size());
      return;
    }

    auto Mappings = Dispatcher->GetMappings();
    for (const auto& Extension : Extensions)
    {
      if (std::find(Mappings.begin(), Mappings.end(), Extension) == Mappings.end())
      {
        Dispatcher->AddMapping(Extension);
        Mappings.push_back(Extension);
        Host.LogInfo("Mapped %s to %s", Dispatcher->GetName(), Extension.c_str());
      }
    }
  }

} // namespace ViewMapper
