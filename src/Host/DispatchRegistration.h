#pragma once

#include "IDispatchRegistration.h"

#include <mutex>
#include <string>
#include <vector>

namespace ViewMapper
{

// In-process dispatcher registration; remembers the patterns it is mapped to
class DispatchRegistration final : public IDispatchRegistration
{
  public:
    DispatchRegistration(std::string Name, std::vector<std::string> Mappings);

    const char* GetName() const override;
    std::vector<std::string> GetMappings() const override;
    void AddMapping(const std::string& Pattern) override;

  private:
    std::string m_Name;
    mutable std::mutex m_Mutex;
    std::vector<std::string> m_Mappings;
};

} // namespace ViewMapper
