#pragma once

#include <initializer_list>
#include <string>
#include <string_view>

#include "Export.h"

namespace ViewMapper::ResourcePaths
{

// Resource tree paths use '/' as separator; directories carry a trailing '/'.
inline constexpr char kSeparator = '/';

// True if the path denotes a directory (ends with the separator)
VIEWMAPPER_API bool IsDirectory(std::string_view Path);

// Removes Prefix from the start of Path, or returns Path as-is if it doesn't start with it
VIEWMAPPER_API std::string StripPrefixPath(std::string_view Prefix, std::string_view Path);

// Removes the trailing ".ext" of the last path segment, if any
VIEWMAPPER_API std::string StripExtension(std::string_view Path);

// Returns the trailing ".ext" of the last path segment including the dot, or an empty string
VIEWMAPPER_API std::string GetExtension(std::string_view Path);

VIEWMAPPER_API bool StartsWithOneOf(std::string_view Value, std::initializer_list<std::string_view> Prefixes);

} // namespace ViewMapper::ResourcePaths
