#include "ApplicationContext.h"

#include <mutex>
#include <shared_mutex>

namespace ViewMapper
{

  struct ApplicationContext::Impl
  {
      explicit Impl(IHostContext& InHost) : Host(InHost) {}

      IHostContext& Host;

      mutable std::shared_mutex Mutex;
      std::shared_ptr<const RootPathSet> RootPaths;
      std::optional<bool> bScannedViewsExtensionless;
      std::shared_ptr<const ViewMap> Views;
  };

  ApplicationContext::ApplicationContext(IHostContext& Host) : m_Impl(std::make_unique<Impl>(Host)) {}

  ApplicationContext::~ApplicationContext() = default;

  IHostContext& ApplicationContext::GetHost() const
  {
    return m_Impl->Host;
  }

  std::shared_ptr<const RootPathSet> ApplicationContext::GetRootPaths() const
  {
    std::shared_lock Lock(m_Impl->Mutex);
    return m_Impl->RootPaths;
  }

  std::shared_ptr<const RootPathSet> ApplicationContext::SetRootPathsOnce(RootPathSet Paths)
  {
    std::unique_lock Lock(m_Impl->Mutex);
    if (!m_Impl->RootPaths)
    {
      m_Impl->RootPaths = std::make_shared<const RootPathSet>(std::move(Paths));
    }
    return m_Impl->RootPaths;
  }

  std::optional<bool> ApplicationContext::GetScannedViewsExtensionless() const
  {
    std::shared_lock Lock(m_Impl->Mutex);
    return m_Impl->bScannedViewsExtensionless;
  }

  bool ApplicationContext::SetScannedViewsExtensionlessOnce(bool bValue)
  {
    std::unique_lock Lock(m_Impl->Mutex);
    if (!m_Impl->bScannedViewsExtensionless.has_value())
    {
      m_Impl->bScannedViewsExtensionless = bValue;
    }
    return *m_Impl->bScannedViewsExtensionless;
  }

  std::shared_ptr<const ViewMap> ApplicationContext::GetViews() const
  {
    std::shared_lock Lock(m_Impl->Mutex);
    return m_Impl->Views;
  }

  bool ApplicationContext::HasViews() const
  {
    std::shared_lock Lock(m_Impl->Mutex);
    return m_Impl->Views != nullptr;
  }

  void ApplicationContext::StoreViews(std::shared_ptr<const ViewMap> Views)
  {
    std::unique_lock Lock(m_Impl->Mutex);
    m_Impl->Views = std::move(Views);
  }

} // namespace ViewMapper
