#pragma once

#include <memory>
#include <optional>

#include "Export.h"
#include "IHostContext.h"
#include "ViewTypes.h"

namespace ViewMapper
{

// Application-wide state of the view mapping feature. One instance lives as long as the
// hosting application and is shared by all request threads.
//
// Each slot is initialized lazily and independently. Stored values are immutable snapshots,
// so readers may keep using a returned pointer without further locking.
class VIEWMAPPER_API ApplicationContext
{
public:
    explicit ApplicationContext(IHostContext& Host);
    ~ApplicationContext();

    IHostContext& GetHost() const;

    // ========== Root Paths ==========

    // Returns nullptr until SetRootPathsOnce() has been called
    std::shared_ptr<const RootPathSet> GetRootPaths() const;

    // Stores Paths unless a set is already present. Returns the stored set either way.
    std::shared_ptr<const RootPathSet> SetRootPathsOnce(RootPathSet Paths);

    // ========== Extensionless Flag ==========

    std::optional<bool> GetScannedViewsExtensionless() const;

    // Stores the flag unless already present. Returns the stored flag either way.
    bool SetScannedViewsExtensionlessOnce(bool bValue);

    // ========== View Index ==========

    // Returns nullptr if no index has been stored
    std::shared_ptr<const ViewMap> GetViews() const;

    bool HasViews() const;

    // Replaces any previously stored index
    void StoreViews(std::shared_ptr<const ViewMap> Views);

    // Non-copyable
    ApplicationContext(const ApplicationContext&) = delete;
    ApplicationContext& operator=(const ApplicationContext&) = delete;

private:
    struct Impl;
    std::unique_ptr<Impl> m_Impl;
};

} // namespace ViewMapper
