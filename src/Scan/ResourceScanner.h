#pragma once

#include "Export.h"
#include "IResourceTree.h"
#include "ViewTypes.h"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ViewMapper
{

class VIEWMAPPER_API ResourceScanner
{
  public:
    explicit ResourceScanner(const IResourceTree& Tree);

    // Walks Listing (the children of one directory) and everything below it, collecting
    // every eligible file into CollectedViews under its key with and without extension.
    // CollectedExtensions may be null, in which case no extensions are collected.
    void Scan(const std::string& RootPath,
              std::vector<std::string> Listing,
              const std::optional<std::string>& ExtensionToScan,
              ViewMap& CollectedViews,
              ExtensionSet* CollectedExtensions) const;

    // Under the tree root "/", WEB-INF and META-INF are never descended into
    static bool CanScanDirectory(std::string_view RootPath, std::string_view Directory);

    static bool CanScanResource(std::string_view Resource, const std::optional<std::string>& ExtensionToScan);

  private:
    const IResourceTree& m_Tree;
};

} // namespace ViewMapper
