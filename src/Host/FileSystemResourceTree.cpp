#include "FileSystemResourceTree.h"
#include "ResourcePaths.h"

#include <algorithm>
#include <system_error>

namespace ViewMapper
{

  namespace
  {
    // Relative part of a tree path: no "..", no empty segment except the trailing one
    bool IsConfinedRelativePath(std::string_view Path)
    {
      while (!Path.empty())
      {
        auto Separator = Path.find(ResourcePaths::kSeparator);
        auto Segment = Path.substr(0, Separator);
        if (Segment == ".." || (Segment.empty() && Separator != std::string_view::npos))
        {
          return false;
        }
        if (Separator == std::string_view::npos)
        {
          break;
        }
        Path.remove_prefix(Separator + 1);
      }
      return true;
    }

    bool IsWithin(const std::filesystem::path& Root, const std::filesystem::path& Path)
    {
      auto Relative = Path.lexically_normal().lexically_relative(Root.lexically_normal());
      return !Relative.empty() && *Relative.begin() != "..";
    }
  } // namespace

  FileSystemResourceTree::FileSystemResourceTree(std::filesystem::path WebRoot) : m_WebRoot(std::move(WebRoot)) {}

  std::optional<std::vector<std::string>> FileSystemResourceTree::ListChildren(std::string_view Path) const
  {
    if (Path.empty() || Path.front() != ResourcePaths::kSeparator || !IsConfinedRelativePath(Path.substr(1)))
    {
      return std::nullopt;
    }

    std::filesystem::path Relative(Path.substr(1));
    if (Relative.has_root_path())
    {
      return std::nullopt;
    }

    std::error_code Ec;
    std::filesystem::path DiskPath = m_WebRoot / Relative;
    if (!IsWithin(m_WebRoot, DiskPath) || !std::filesystem::is_directory(DiskPath, Ec))
    {
      return std::nullopt;
    }

    std::string Base(Path);
    if (!ResourcePaths::IsDirectory(Base))
    {
      Base.push_back(ResourcePaths::kSeparator);
    }

    std::vector<std::string> Children;
    for (std::filesystem::directory_iterator It(DiskPath, Ec), End; !Ec && It != End; It.increment(Ec))
    {
      const auto& Entry = *It;
      std::string Name = Entry.path().filename().generic_string();

      std::error_code EntryEc;
      if (Entry.is_directory(EntryEc))
      {
        if (!Entry.is_symlink(EntryEc))
        {
          Children.push_back(Base + Name + ResourcePaths::kSeparator);
        }
      }
      else if (Entry.is_regular_file(EntryEc))
      {
        Children.push_back(Base + Name);
      }
    }

    if (Ec)
    {
      return std::nullopt;
    }

    std::sort(Children.begin(), Children.end());
    return Children;
  }

} // namespace ViewMapper
