#include "Scan/ResourceScanner.h"
#include "ResourcePaths.h"

namespace ViewMapper
{

  namespace
  {
    constexpr std::string_view kTreeRoot = "/";

    // One directory listing being walked
    struct PendingListing
    {
        std::vector<std::string> Paths;
        size_t Next = 0;
    };

    void CollectResource(const std::string& RootPath,
                         const std::string& ResourcePath,
                         ViewMap& CollectedViews,
                         ExtensionSet* CollectedExtensions)
    {
      // "/WEB-INF/faces-views/foo.xhtml" becomes "foo.xhtml" for root "/WEB-INF/faces-views/"
      std::string Resource = ResourcePaths::StripPrefixPath(RootPath, ResourcePath);

      // Under the tree root the path with extension already resolves by itself
      if (RootPath != kTreeRoot)
      {
        CollectedViews[Resource] = ResourcePath;
      }
      CollectedViews[ResourcePaths::StripExtension(Resource)] = ResourcePath;

      // A bare "*" would map the dispatcher onto every request
      std::string Extension = ResourcePaths::GetExtension(ResourcePath);
      if (CollectedExtensions && !Extension.empty())
      {
        CollectedExtensions->insert("*" + Extension);
      }
    }
  } // namespace

  ResourceScanner::ResourceScanner(const IResourceTree& Tree) : m_Tree(Tree) {}

  void ResourceScanner::Scan(const std::string& RootPath,
                             std::vector<std::string> Listing,
                             const std::optional<std::string>& ExtensionToScan,
                             ViewMap& CollectedViews,
                             ExtensionSet* CollectedExtensions) const
  {
    if (Listing.empty())
    {
      return;
    }

    // Depth-first, in listing order: a directory's contents are visited before its next sibling
    std::vector<PendingListing> Stack;
    Stack.push_back({std::move(Listing), 0});

    while (!Stack.empty())
    {
      auto& Top = Stack.back();
      if (Top.Next == Top.Paths.size())
      {
        Stack.pop_back();
        continue;
      }

      // Copy out, pushing onto the stack invalidates Top
      std::string Path = Top.Paths[Top.Next++];

      if (ResourcePaths::IsDirectory(Path))
      {
        if (!CanScanDirectory(RootPath, Path))
        {
          continue;
        }

        auto Children = m_Tree.ListChildren(Path);
        if (Children.has_value() && !Children->empty())
        {
          Stack.push_back({std::move(*Children), 0});
        }
      }
      else if (CanScanResource(Path, ExtensionToScan))
      {
        CollectResource(RootPath, Path, CollectedViews, CollectedExtensions);
      }
    }
  }

  bool ResourceScanner::CanScanDirectory(std::string_view RootPath, std::string_view Directory)
  {
    if (RootPath != kTreeRoot)
    {
      // An explicitly configured root may be scanned in full
      return true;
    }

    return !ResourcePaths::StartsWithOneOf(Directory, {"/WEB-INF/", "/META-INF/"});
  }

  bool ResourceScanner::CanScanResource(std::string_view Resource, const std::optional<std::string>& ExtensionToScan)
  {
    if (!ExtensionToScan.has_value())
    {
      return true;
    }

    return Resource.ends_with(*ExtensionToScan);
  }

} // namespace ViewMapper
