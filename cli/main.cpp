#include "ApplicationContext.h"
#include "HostConfig.h"
#include "IHostContext.h"
#include "ViewIndex.h"
#include "ViewIndexSnapshot.h"
#include "ViewMapperInitializer.h"
#include "ViewMapperParams.h"

#include <algorithm>
#include <cstdio>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

using namespace ViewMapper;

void PrintUsage(const char* ProgramName)
{
  std::cout << "Usage: " << ProgramName << " <command> [options]\n\n"
            << "Commands:\n"
            << "  scan               Scan the web root and print all view mappings\n"
            << "  resolve <name>...  Print the resource path each name maps to\n"
            << "  export <file>      Scan the web root and save the index snapshot\n"
            << "  inspect <file>     Print a saved index snapshot\n"
            << "  help               Show this help message\n\n"
            << "Options:\n"
            << "  -r, --web-root <dir>     Directory backing the resource tree root (default: .)\n"
            << "  -s, --scan-path <path>   Add a root path to scan, e.g. /views/ or /*.xhtml (can be used multiple times)\n"
            << "  -D <name>=<value>        Set an init parameter\n"
            << "  --extensionless          Always render scanned views extensionless\n"
            << "  --disable                Switch view scanning off\n"
            << "  -v, --verbose            Enable verbose output\n"
            << std::endl;
}

std::vector<std::pair<std::string, std::string>> SortedViews(const ViewMap& Views)
{
  std::vector<std::pair<std::string, std::string>> Entries(Views.begin(), Views.end());
  std::sort(Entries.begin(), Entries.end());
  return Entries;
}

int CommandScan(const HostConfig& Config)
{
  auto Host = CreateHostContext(Config);
  ApplicationContext Context(*Host);

  auto Summary = ViewMapperInitializer::Initialize(Context);
  if (!Summary.has_value())
  {
    std::cerr << "Error: " << Summary.error() << std::endl;
    return 1;
  }

  if (!Summary->bEnabled)
  {
    std::cout << "View scanning is disabled\n";
    return 0;
  }

  auto Views = ViewIndex::GetViews(Context);
  std::cout << "Views (" << (Views ? Views->size() : 0) << "):\n";
  if (Views)
  {
    for (const auto& [Key, Path] : SortedViews(*Views))
    {
      std::cout << "  " << Key << " -> " << Path << "\n";
    }
  }

  if (auto* Dispatcher = Host->FindDispatcher())
  {
    auto Mappings = Dispatcher->GetMappings();
    std::cout << "\n" << Dispatcher->GetName() << " mappings (" << Mappings.size() << "):\n";
    for (const auto& Mapping : Mappings)
    {
      std::cout << "  " << Mapping << "\n";
    }
  }

  std::cout << "\nAlways extensionless: " << (ViewIndex::IsScannedViewsAlwaysExtensionless(Context) ? "yes" : "no") << std::endl;
  return 0;
}

int CommandResolve(const HostConfig& Config, const std::vector<std::string>& Names)
{
  auto Host = CreateHostContext(Config);
  ApplicationContext Context(*Host);

  auto Summary = ViewMapperInitializer::Initialize(Context);
  if (!Summary.has_value())
  {
    std::cerr << "Error: " << Summary.error() << std::endl;
    return 1;
  }

  for (const auto& Name : Names)
  {
    std::cout << Name << " -> " << ViewIndex::GetMappedPath(Context, Name) << "\n";
  }
  return 0;
}

int CommandExport(const HostConfig& Config, const std::string& SnapshotPath)
{
  auto Host = CreateHostContext(Config);
  ApplicationContext Context(*Host);

  auto Summary = ViewMapperInitializer::Initialize(Context);
  if (!Summary.has_value())
  {
    std::cerr << "Error: " << Summary.error() << std::endl;
    return 1;
  }

  auto Views = ViewIndex::GetViews(Context);
  auto Snapshot = MakeSnapshot(Views ? *Views : ViewMap{}, Summary->Extensions);

  auto Result = SaveSnapshot(Snapshot, SnapshotPath);
  if (!Result.has_value())
  {
    std::cerr << "Error: " << Result.error() << std::endl;
    return 1;
  }

  std::printf("Saved %zu views to %s (fingerprint %016llx)\n", Snapshot.Views.size(), SnapshotPath.c_str(),
              static_cast<unsigned long long>(Snapshot.Fingerprint));
  return 0;
}

int CommandInspect(const std::string& SnapshotPath)
{
  auto Snapshot = LoadSnapshot(SnapshotPath);
  if (!Snapshot.has_value())
  {
    std::cerr << "Error: " << Snapshot.error() << std::endl;
    return 1;
  }

  std::printf("Snapshot: %s\nFingerprint: %016llx\n\n", SnapshotPath.c_str(), static_cast<unsigned long long>(Snapshot->Fingerprint));

  std::cout << "Views (" << Snapshot->Views.size() << "):\n";
  for (const auto& [Key, Path] : Snapshot->Views)
  {
    std::cout << "  " << Key << " -> " << Path << "\n";
  }

  std::cout << "\nExtensions (" << Snapshot->Extensions.size() << "):\n";
  for (const auto& Extension : Snapshot->Extensions)
  {
    std::cout << "  " << Extension << "\n";
  }
  return 0;
}

int main(int argc, char* argv[])
{
  if (argc < 2)
  {
    PrintUsage(argv[0]);
    return 1;
  }

  std::string Command = argv[1];

  if (Command == "help" || Command == "-h" || Command == "--help")
  {
    PrintUsage(argv[0]);
    return 0;
  }

  // Parse options
  HostConfig Config;
  Config.WebRoot = ".";
  std::vector<std::string> ScanPaths;
  std::vector<std::string> Positional;

  for (int i = 2; i < argc; ++i)
  {
    std::string Arg = argv[i];

    if ((Arg == "-r" || Arg == "--web-root") && i + 1 < argc)
    {
      Config.WebRoot = argv[++i];
    }
    else if ((Arg == "-s" || Arg == "--scan-path") && i + 1 < argc)
    {
      ScanPaths.push_back(argv[++i]);
    }
    else if (Arg == "-D" && i + 1 < argc)
    {
      std::string Param = argv[++i];
      auto Equals = Param.find('=');
      if (Equals == std::string::npos || Equals == 0)
      {
        std::cerr << "Invalid init parameter, expected <name>=<value>: " << Param << std::endl;
        return 1;
      }
      Config.InitParameters[Param.substr(0, Equals)] = Param.substr(Equals + 1);
    }
    else if (Arg == "--extensionless")
    {
      Config.InitParameters[std::string(kScannedViewsExtensionlessParam)] = "true";
    }
    else if (Arg == "--disable")
    {
      Config.InitParameters[std::string(kEnabledParam)] = "false";
    }
    else if (Arg == "-v" || Arg == "--verbose")
    {
      Config.bVerbose = true;
    }
    else if (!Arg.empty() && Arg[0] != '-')
    {
      // Positional argument (names for resolve, snapshot path for export/inspect)
      Positional.push_back(Arg);
    }
    else
    {
      std::cerr << "Unknown option: " << Arg << std::endl;
      return 1;
    }
  }

  if (!ScanPaths.empty())
  {
    std::string Csv;
    for (const auto& Path : ScanPaths)
    {
      if (!Csv.empty())
      {
        Csv += ',';
      }
      Csv += Path;
    }
    Config.InitParameters[std::string(kScanPathsParam)] = Csv;
  }

  // Execute command
  if (Command == "scan")
  {
    return CommandScan(Config);
  }
  else if (Command == "resolve")
  {
    if (Positional.empty())
    {
      std::cerr << "Error: At least one name is required for resolve\n";
      return 1;
    }
    return CommandResolve(Config, Positional);
  }
  else if (Command == "export")
  {
    if (Positional.size() != 1)
    {
      std::cerr << "Error: Snapshot file path is required for export\n";
      return 1;
    }
    return CommandExport(Config, Positional[0]);
  }
  else if (Command == "inspect")
  {
    if (Positional.size() != 1)
    {
      std::cerr << "Error: Snapshot file path is required for inspect\n";
      return 1;
    }
    return CommandInspect(Positional[0]);
  }

  std::cerr << "Unknown command: " << Command << std::endl;
  PrintUsage(argv[0]);
  return 1;
}
