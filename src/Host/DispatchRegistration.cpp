#include "Host/DispatchRegistration.h"

#include <algorithm>

namespace ViewMapper
{

  DispatchRegistration::DispatchRegistration(std::string Name, std::vector<std::string> Mappings)
      : m_Name(std::move(Name)), m_Mappings(std::move(Mappings))
  {
  }

  const char* DispatchRegistration::GetName() const
  {
    return m_Name.c_str();
  }

  std::vector<std::string> DispatchRegistration::GetMappings() const
  {
    std::lock_guard Lock(m_Mutex);
    return m_Mappings;
  }

  void DispatchRegistration::AddMapping(const std::string& Pattern)
  {
    std::lock_guard Lock(m_Mutex);
    if (std::find(m_Mappings.begin(), m_Mappings.end(), Pattern) == m_Mappings.end())
    {
      m_Mappings.push_back(Pattern);
    }
  }

} // namespace ViewMapper
