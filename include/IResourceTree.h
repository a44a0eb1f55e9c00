#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "Export.h"

namespace ViewMapper
{

// Directory listing primitive of the hosting environment's resource tree
class VIEWMAPPER_API IResourceTree
{
public:
    virtual ~IResourceTree() = default;

    // Lists the immediate children of a directory path such as "/views/".
    // Child directories are returned with a trailing '/', files without.
    // Returns nullopt if the path does not denote a listable directory.
    virtual std::optional<std::vector<std::string>> ListChildren(std::string_view Path) const = 0;
};

} // namespace ViewMapper
