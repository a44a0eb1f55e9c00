#include "ResourcePaths.h"

namespace ViewMapper::ResourcePaths
{

  namespace
  {
    // Position of the dot starting the extension of the last segment, or npos
    std::string_view::size_type FindExtensionDot(std::string_view Path)
    {
      auto LastDot = Path.rfind('.');
      if (LastDot == std::string_view::npos)
      {
        return std::string_view::npos;
      }

      auto LastSeparator = Path.rfind(kSeparator);
      if (LastSeparator != std::string_view::npos && LastSeparator > LastDot)
      {
        return std::string_view::npos;
      }

      return LastDot;
    }
  } // namespace

  bool IsDirectory(std::string_view Path)
  {
    return !Path.empty() && Path.back() == kSeparator;
  }

  std::string StripPrefixPath(std::string_view Prefix, std::string_view Path)
  {
    if (Path.starts_with(Prefix))
    {
      return std::string(Path.substr(Prefix.size()));
    }
    return std::string(Path);
  }

  std::string StripExtension(std::string_view Path)
  {
    auto Dot = FindExtensionDot(Path);
    if (Dot == std::string_view::npos)
    {
      return std::string(Path);
    }
    return std::string(Path.substr(0, Dot));
  }

  std::string GetExtension(std::string_view Path)
  {
    auto Dot = FindExtensionDot(Path);
    if (Dot == std::string_view::npos)
    {
      return {};
    }
    return std::string(Path.substr(Dot));
  }

  bool StartsWithOneOf(std::string_view Value, std::initializer_list<std::string_view> Prefixes)
  {
    for (auto Prefix : Prefixes)
    {
      if (Value.starts_with(Prefix))
      {
        return true;
      }
    }
    return false;
  }

} // namespace ViewMapper::ResourcePaths
