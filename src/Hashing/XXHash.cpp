#include "Hashing/XXHash.h"

#include <new>

#define XXH_INLINE_ALL
#include <xxhash.h>

namespace ViewMapper::Hashing
{

  struct StreamingHasher64::Impl
  {
      XXH3_state_t* State = nullptr;
  };

  StreamingHasher64::StreamingHasher64() : m_Impl(std::make_unique<Impl>())
  {
    m_Impl->State = XXH3_createState();
    if (!m_Impl->State)
    {
      throw std::bad_alloc();
    }
    XXH3_64bits_reset(m_Impl->State);
  }

  StreamingHasher64::~StreamingHasher64()
  {
    XXH3_freeState(m_Impl->State);
  }

  void StreamingHasher64::Update(const void* Data, std::size_t Size)
  {
    XXH3_64bits_update(m_Impl->State, Data, Size);
  }

  void StreamingHasher64::UpdateString(std::string_view Value)
  {
    const char Terminator = '\0';
    XXH3_64bits_update(m_Impl->State, Value.data(), Value.size());
    XXH3_64bits_update(m_Impl->State, &Terminator, 1);
  }

  uint64_t StreamingHasher64::Finish() const
  {
    return XXH3_64bits_digest(m_Impl->State);
  }

  void StreamingHasher64::Reset()
  {
    XXH3_64bits_reset(m_Impl->State);
  }

} // namespace ViewMapper::Hashing
