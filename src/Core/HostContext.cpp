#include "IHostContext.h"
#include "FileSystemResourceTree.h"

#include "Host/DispatchRegistration.h"

#include <cstdio>
#include <cstdarg>
#include <mutex>

namespace ViewMapper
{

  namespace
  {
    constexpr const char* kDispatcherName = "ViewDispatcher";
  }

  class HostContextImpl : public IHostContext
  {
    public:
      explicit HostContextImpl(const HostConfig& Config)
          : m_Config(Config), m_Tree(Config.WebRoot)
      {
        if (Config.bEnableDispatcher)
        {
          m_Dispatcher = std::make_unique<DispatchRegistration>(kDispatcherName, Config.DispatcherMappings);
        }
      }

      void LogInfo(const char* Fmt, ...) override
      {
        if (!m_Config.bVerbose)
        {
          return;
        }

        std::lock_guard Lock(m_LogMutex);
        va_list Args;
        va_start(Args, Fmt);
        std::printf("[INFO] ");
        std::vprintf(Fmt, Args);
        std::printf("\n");
        va_end(Args);
      }

      void LogWarn(const char* Fmt, ...) override
      {
        std::lock_guard Lock(m_LogMutex);
        va_list Args;
        va_start(Args, Fmt);
        std::printf("[WARN] ");
        std::vprintf(Fmt, Args);
        std::printf("\n");
        va_end(Args);
      }

      void LogError(const char* Fmt, ...) override
      {
        std::lock_guard Lock(m_LogMutex);
        va_list Args;
        va_start(Args, Fmt);
        std::fprintf(stderr, "[ERROR] ");
        std::vfprintf(stderr, Fmt, Args);
        std::fprintf(stderr, "\n");
        va_end(Args);
      }

      std::optional<std::string> GetInitParameter(std::string_view Name) const override
      {
        auto It = m_Config.InitParameters.find(std::string(Name));
        if (It != m_Config.InitParameters.end())
        {
          return It->second;
        }
        return std::nullopt;
      }

      const IResourceTree& GetResourceTree() const override
      {
        return m_Tree;
      }

      IDispatchRegistration* FindDispatcher() override
      {
        return m_Dispatcher.get();
      }

    private:
      HostConfig m_Config;
      FileSystemResourceTree m_Tree;
      std::unique_ptr<DispatchRegistration> m_Dispatcher;
      std::mutex m_LogMutex;
  };

  std::unique_ptr<IHostContext> CreateHostContext(const HostConfig& Config)
  {
    return std::make_unique<HostContextImpl>(Config);
  }

} // namespace ViewMapper
