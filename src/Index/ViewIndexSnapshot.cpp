#include "ViewIndexSnapshot.h"

#include "Hashing/XXHash.h"

#include <algorithm>
#include <cstring>
#include <fstream>

#include <cereal/archives/binary.hpp>
#include <cereal/types/string.hpp>
#include <cereal/types/utility.hpp>
#include <cereal/types/vector.hpp>

namespace ViewMapper
{

  // cereal serialization function
  template<class Archive>
  void serialize(Archive& Ar, ViewIndexSnapshot& V)
  {
    Ar(V.Views, V.Extensions, V.Fingerprint);
  }

  namespace
  {
    constexpr char kSnapshotMagic[8] = {'V', 'M', 'I', 'D', 'X', 0, 0, 0};

    uint64_t FingerprintSorted(const std::vector<std::pair<std::string, std::string>>& Views, const std::vector<std::string>& Extensions)
    {
      Hashing::StreamingHasher64 Hasher;

      for (const auto& [Key, Path] : Views)
      {
        Hasher.UpdateString(Key);
        Hasher.UpdateString(Path);
      }

      // Separates the entries from the extensions
      Hasher.UpdateString({});

      for (const auto& Extension : Extensions)
      {
        Hasher.UpdateString(Extension);
      }

      return Hasher.Finish();
    }

    std::vector<std::pair<std::string, std::string>> SortedEntries(const ViewMap& Views)
    {
      std::vector<std::pair<std::string, std::string>> Entries(Views.begin(), Views.end());
      std::sort(Entries.begin(), Entries.end(), [](const auto& A, const auto& B) { return A.first < B.first; });
      return Entries;
    }
  } // namespace

  uint64_t ComputeFingerprint(const ViewMap& Views, const ExtensionSet& Extensions)
  {
    return FingerprintSorted(SortedEntries(Views), std::vector<std::string>(Extensions.begin(), Extensions.end()));
  }

  ViewIndexSnapshot MakeSnapshot(const ViewMap& Views, const ExtensionSet& Extensions)
  {
    ViewIndexSnapshot Snapshot;
    Snapshot.Views = SortedEntries(Views);
    Snapshot.Extensions.assign(Extensions.begin(), Extensions.end());
    Snapshot.Fingerprint = FingerprintSorted(Snapshot.Views, Snapshot.Extensions);
    return Snapshot;
  }

  std::expected<void, std::string> SaveSnapshot(const ViewIndexSnapshot& Snapshot, const std::string& Path)
  {
    std::ofstream File(Path, std::ios::binary | std::ios::trunc);
    if (!File.is_open())
    {
      return std::unexpected("Failed to open snapshot for writing: " + Path);
    }

    File.write(kSnapshotMagic, sizeof(kSnapshotMagic));
    uint32_t Version = kSnapshotVersion;
    File.write(reinterpret_cast<const char*>(&Version), sizeof(Version));

    {
      cereal::BinaryOutputArchive Ar(File);
      Ar(Snapshot);
    }

    if (!File.good())
    {
      return std::unexpected("Failed to write snapshot: " + Path);
    }

    return {};
  }

  std::expected<ViewIndexSnapshot, std::string> LoadSnapshot(const std::string& Path)
  {
    std::ifstream File(Path, std::ios::binary);
    if (!File.is_open())
    {
      return std::unexpected("Failed to open snapshot: " + Path);
    }

    char Magic[sizeof(kSnapshotMagic)] = {};
    uint32_t Version = 0;
    File.read(Magic, sizeof(Magic));
    File.read(reinterpret_cast<char*>(&Version), sizeof(Version));
    if (!File.good() || std::memcmp(Magic, kSnapshotMagic, sizeof(Magic)) != 0)
    {
      return std::unexpected("Not a view index snapshot: " + Path);
    }

    if (Version != kSnapshotVersion)
    {
      return std::unexpected("Unsupported snapshot version " + std::to_string(Version) + ": " + Path);
    }

    ViewIndexSnapshot Snapshot;
    try
    {
      cereal::BinaryInputArchive Ar(File);
      Ar(Snapshot);
    }
    catch (const std::exception& E)
    {
      return std::unexpected("Corrupt snapshot " + Path + ": " + E.what());
    }

    if (FingerprintSorted(Snapshot.Views, Snapshot.Extensions) != Snapshot.Fingerprint)
    {
      return std::unexpected("Snapshot fingerprint mismatch: " + Path);
    }

    return Snapshot;
  }

} // namespace ViewMapper
