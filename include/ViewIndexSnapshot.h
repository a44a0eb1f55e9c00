#pragma once

#include <cstdint>
#include <expected>
#include <string>
#include <utility>
#include <vector>

#include "Export.h"
#include "ViewTypes.h"

namespace ViewMapper
{

inline constexpr uint32_t kSnapshotVersion = 1;

// Saved result of a scan, sorted so that equal indexes produce equal snapshots
struct VIEWMAPPER_API ViewIndexSnapshot
{
    std::vector<std::pair<std::string, std::string>> Views; // Sorted by key
    std::vector<std::string> Extensions;                     // Sorted
    uint64_t Fingerprint = 0;
};

// XXH3-64 over the entries in key order followed by the extensions.
// Does not depend on the iteration order of Views.
VIEWMAPPER_API uint64_t ComputeFingerprint(const ViewMap& Views, const ExtensionSet& Extensions);

VIEWMAPPER_API ViewIndexSnapshot MakeSnapshot(const ViewMap& Views, const ExtensionSet& Extensions);

VIEWMAPPER_API std::expected<void, std::string> SaveSnapshot(const ViewIndexSnapshot& Snapshot, const std::string& Path);

// Fails on a missing file, foreign or newer format, truncated data or fingerprint mismatch
VIEWMAPPER_API std::expected<ViewIndexSnapshot, std::string> LoadSnapshot(const std::string& Path);

} // namespace ViewMapper
