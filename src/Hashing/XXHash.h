#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string_view>

namespace ViewMapper::Hashing
{

  // Streaming XXH3-64 hash
  class StreamingHasher64
  {
    public:
      StreamingHasher64();
      ~StreamingHasher64();

      void Update(const void* Data, std::size_t Size);

      // Hashes the characters followed by a terminating '\0', so that ("ab", "c") and
      // ("a", "bc") hash differently
      void UpdateString(std::string_view Value);

      uint64_t Finish() const;

      void Reset();

      StreamingHasher64(const StreamingHasher64&) = delete;
      StreamingHasher64& operator=(const StreamingHasher64&) = delete;

    private:
      struct Impl;
      std::unique_ptr<Impl> m_Impl;
  };

} // namespace ViewMapper::Hashing
