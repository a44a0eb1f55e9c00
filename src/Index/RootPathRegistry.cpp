#include "RootPathRegistry.h"
#include "ResourcePaths.h"
#include "ViewMapperParams.h"

#include "Core/StringUtils.h"

namespace ViewMapper
{

  namespace
  {
    constexpr char kExtensionDelimiter = '*';

    // Splits a comma separated value, trimming entries and dropping blank ones
    std::vector<std::string> CsvToList(std::string_view Csv)
    {
      std::vector<std::string> Result;

      while (!Csv.empty())
      {
        auto Comma = Csv.find(',');
        auto Entry = StringUtils::Trim(Csv.substr(0, Comma));
        if (!Entry.empty())
        {
          Result.emplace_back(Entry);
        }

        if (Comma == std::string_view::npos)
        {
          break;
        }
        Csv.remove_prefix(Comma + 1);
      }

      return Result;
    }
  } // namespace

  std::expected<RootPath, std::string> ParseRootPath(std::string_view Configured)
  {
    RootPath Result;

    auto Delimiter = Configured.find(kExtensionDelimiter);
    if (Delimiter == std::string_view::npos)
    {
      Result.Directory = std::string(Configured);
    }
    else
    {
      if (Configured.find(kExtensionDelimiter, Delimiter + 1) != std::string_view::npos)
      {
        return std::unexpected("Scan path has more than one '*': " + std::string(Configured));
      }

      auto Extension = Configured.substr(Delimiter + 1);
      if (Extension.empty())
      {
        return std::unexpected("Scan path has no extension after '*': " + std::string(Configured));
      }

      Result.Directory = std::string(Configured.substr(0, Delimiter));
      Result.ExtensionFilter = std::string(Extension);
    }

    if (!ResourcePaths::IsDirectory(Result.Directory))
    {
      Result.Directory.push_back(ResourcePaths::kSeparator);
    }

    return Result;
  }

  std::shared_ptr<const RootPathSet> RootPathRegistry::GetRootPaths(ApplicationContext& Context)
  {
    if (auto Cached = Context.GetRootPaths())
    {
      return Cached;
    }

    RootPathSet Paths;
    if (auto Csv = Context.GetHost().GetInitParameter(kScanPathsParam))
    {
      for (auto& Path : CsvToList(*Csv))
      {
        Paths.insert(std::move(Path));
      }
    }
    Paths.emplace(kDefaultViewsRoot);

    return Context.SetRootPathsOnce(std::move(Paths));
  }

  std::expected<std::vector<RootPath>, std::string> RootPathRegistry::ResolveRootPaths(ApplicationContext& Context)
  {
    auto Paths = GetRootPaths(Context);

    std::vector<RootPath> Result;
    Result.reserve(Paths->size());

    for (const auto& Path : *Paths)
    {
      auto Parsed = ParseRootPath(Path);
      if (!Parsed.has_value())
      {
        return std::unexpected(Parsed.error());
      }
      Result.push_back(std::move(*Parsed));
    }

    return Result;
  }

} // namespace ViewMapper
