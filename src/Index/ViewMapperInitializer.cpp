#include "ViewMapperInitializer.h"
#include "RootPathRegistry.h"
#include "RouteRegistrar.h"
#include "ViewIndex.h"
#include "ViewMapperParams.h"

#include "Core/StringUtils.h"

namespace ViewMapper
{

  std::expected<InitializeSummary, std::string> ViewMapperInitializer::Initialize(ApplicationContext& Context)
  {
    IHostContext& Host = Context.GetHost();
    InitializeSummary Summary;

    if (!IsEnabled(Context))
    {
      Host.LogInfo("View scanning disabled by %s", std::string(kEnabledParam).c_str());
      return Summary;
    }
    Summary.bEnabled = true;

    // Configuration errors surface here rather than at scan time
    auto Roots = RootPathRegistry::ResolveRootPaths(Context);
    if (!Roots.has_value())
    {
      Host.LogError("%s", Roots.error().c_str());
      return std::unexpected(Roots.error());
    }

    auto Views = ViewIndex::ScanAndStoreViews(Context, &Summary.Extensions);
    Summary.ViewCount = Views->size();
    Summary.bStored = !Views->empty();

    if (!Summary.Extensions.empty())
    {
      RouteRegistrar::MapDispatcher(Context, Summary.Extensions);
    }

    Host.LogInfo("Scanned %zu root paths: %zu views, %zu extensions", Roots->size(), Summary.ViewCount, Summary.Extensions.size());
    return Summary;
  }

  bool ViewMapperInitializer::IsEnabled(const ApplicationContext& Context)
  {
    auto Value = Context.GetHost().GetInitParameter(kEnabledParam);
    return !(Value.has_value() && StringUtils::IsFlag(*Value, "false"));
  }

} // namespace ViewMapper
