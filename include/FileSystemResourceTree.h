#pragma once

#include <filesystem>

#include "Export.h"
#include "IResourceTree.h"

namespace ViewMapper
{

// Resource tree backed by a directory on disk. The virtual path "/a/b/" lists WebRoot/a/b.
class VIEWMAPPER_API FileSystemResourceTree final : public IResourceTree
{
public:
    explicit FileSystemResourceTree(std::filesystem::path WebRoot);

    // Children are sorted. Paths escaping the web root via ".." are not listed.
    // Symlinked directories are left out so that a link cycle cannot be walked forever.
    std::optional<std::vector<std::string>> ListChildren(std::string_view Path) const override;

    const std::filesystem::path& GetWebRoot() const { return m_WebRoot; }

private:
    std::filesystem::path m_WebRoot;
};

} // namespace ViewMapper
