#include "ViewIndex.h"
#include "ResourcePaths.h"
#include "RootPathRegistry.h"
#include "ViewIndexSnapshot.h"
#include "ViewMapperParams.h"

#include "Core/StringUtils.h"
#include "Scan/ResourceScanner.h"

namespace ViewMapper
{

  void ViewIndex::ScanViewsFromRootPaths(ApplicationContext& Context, ViewMap& CollectedViews, ExtensionSet* CollectedExtensions)
  {
    IHostContext& Host = Context.GetHost();
    const IResourceTree& Tree = Host.GetResourceTree();
    ResourceScanner Scanner(Tree);

    for (const auto& Configured : *RootPathRegistry::GetRootPaths(Context))
    {
      auto Root = ParseRootPath(Configured);
      if (!Root.has_value())
      {
        Host.LogError("Skipping scan path: %s", Root.error().c_str());
        continue;
      }

      auto Listing = Tree.ListChildren(Root->Directory);
      if (!Listing.has_value())
      {
        Host.LogInfo("Scan path %s does not exist", Root->Directory.c_str());
        continue;
      }

      Scanner.Scan(Root->Directory, std::move(*Listing), Root->ExtensionFilter, CollectedViews, CollectedExtensions);
    }
  }

  ViewMap ViewIndex::ScanViews(ApplicationContext& Context)
  {
    ViewMap CollectedViews;
    ScanViewsFromRootPaths(Context, CollectedViews, nullptr);
    return CollectedViews;
  }

  void ViewIndex::TryScanAndStoreViews(ApplicationContext& Context)
  {
    if (!Context.HasViews())
    {
      ScanAndStoreViews(Context);
    }
  }

  std::shared_ptr<const ViewMap> ViewIndex::ScanAndStoreViews(ApplicationContext& Context, ExtensionSet* CollectedExtensions)
  {
    ViewMap CollectedViews;
    ScanViewsFromRootPaths(Context, CollectedViews, CollectedExtensions);

    auto Views = std::make_shared<const ViewMap>(std::move(CollectedViews));
    if (!Views->empty())
    {
      Context.StoreViews(Views);
      Context.GetHost().LogInfo("Stored %zu view mappings", Views->size());
    }
    else
    {
      // Possibly scanned before any views were deployed; allow a later retry
      Context.GetHost().LogWarn("No views found in any scan path");
    }

    return Views;
  }

  void ViewIndex::StoreSnapshot(ApplicationContext& Context, const ViewIndexSnapshot& Snapshot)
  {
    if (Snapshot.Views.empty())
    {
      return;
    }

    ViewMap Views;
    Views.reserve(Snapshot.Views.size());
    for (const auto& [Key, Path] : Snapshot.Views)
    {
      Views[Key] = Path;
    }

    Context.StoreViews(std::make_shared<const ViewMap>(std::move(Views)));
  }

  std::shared_ptr<const ViewMap> ViewIndex::GetViews(const ApplicationContext& Context)
  {
    return Context.GetViews();
  }

  std::string ViewIndex::GetMappedPath(const ApplicationContext& Context, const std::string& Path)
  {
    auto Views = Context.GetViews();
    if (Views)
    {
      auto It = Views->find(Path);
      if (It != Views->end())
      {
        return It->second;
      }
    }
    return Path;
  }

  std::string ViewIndex::StripViewsPrefix(std::string_view Resource)
  {
    return ResourcePaths::StripPrefixPath(kDefaultViewsRoot, Resource);
  }

  bool ViewIndex::IsScannedViewsAlwaysExtensionless(ApplicationContext& Context)
  {
    if (auto Cached = Context.GetScannedViewsExtensionless())
    {
      return *Cached;
    }

    auto Value = Context.GetHost().GetInitParameter(kScannedViewsExtensionlessParam);
    return Context.SetScannedViewsExtensionlessOnce(Value.has_value() && StringUtils::IsFlag(*Value, "true"));
  }

} // namespace ViewMapper
