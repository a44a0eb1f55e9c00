#pragma once

#include <memory>
#include <string>
#include <string_view>

#include "ApplicationContext.h"
#include "Export.h"
#include "ViewTypes.h"

namespace ViewMapper
{

struct ViewIndexSnapshot;

// Scans the configured root paths for views and keeps the resulting index in the
// application context
class VIEWMAPPER_API ViewIndex
{
public:
    // Scans every root path into CollectedViews. Extensions are collected into
    // CollectedExtensions unless it is null.
    static void ScanViewsFromRootPaths(ApplicationContext& Context, ViewMap& CollectedViews, ExtensionSet* CollectedExtensions);

    // Scans all root paths without touching the stored index
    static ViewMap ScanViews(ApplicationContext& Context);

    // Scans and stores the views unless an index is stored already
    static void TryScanAndStoreViews(ApplicationContext& Context);

    // Scans and stores the views. An empty result is returned but not stored, so a later
    // call scans again. Never returns nullptr.
    static std::shared_ptr<const ViewMap> ScanAndStoreViews(ApplicationContext& Context, ExtensionSet* CollectedExtensions = nullptr);

    // Stores the views of a previously saved snapshot. Empty snapshots are ignored.
    static void StoreSnapshot(ApplicationContext& Context, const ViewIndexSnapshot& Snapshot);

    // The stored index, or nullptr
    static std::shared_ptr<const ViewMap> GetViews(const ApplicationContext& Context);

    // Resource path mapped to Path, or Path itself if there is no mapping
    static std::string GetMappedPath(const ApplicationContext& Context, const std::string& Path);

    // Strips kDefaultViewsRoot from the start of Resource, if present
    static std::string StripViewsPrefix(std::string_view Resource);

    static bool IsScannedViewsAlwaysExtensionless(ApplicationContext& Context);
};

} // namespace ViewMapper
