#pragma once

#include <set>
#include <string>
#include <unordered_map>

namespace ViewMapper
{

// Lookup key -> resource path, e.g. "admin/list" -> "/views/admin/list.xhtml"
using ViewMap = std::unordered_map<std::string, std::string>;

// Distinct extensions encountered while scanning, each prefixed with '*' (e.g. "*.xhtml")
using ExtensionSet = std::set<std::string>;

// Configured root paths, possibly carrying a "*.ext" filter suffix
using RootPathSet = std::set<std::string>;

} // namespace ViewMapper
