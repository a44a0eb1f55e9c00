#include <catch2/catch_test_macros.hpp>

#include "ApplicationContext.h"
#include "FileSystemResourceTree.h"
#include "IHostContext.h"
#include "ViewIndex.h"
#include "ViewMapperInitializer.h"
#include "ViewMapperParams.h"

#include <chrono>
#include <filesystem>
#include <fstream>

using namespace ViewMapper;

namespace
{

  struct TempDir
  {
      std::filesystem::path Path;

      TempDir()
      {
        Path = std::filesystem::temp_directory_path() / ("viewmapper_tree_" + std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
        std::filesystem::create_directories(Path);
      }

      ~TempDir()
      {
        std::filesystem::remove_all(Path);
      }
  };

  void WriteFile(const std::filesystem::path& FilePath, const std::string& Content)
  {
    std::filesystem::create_directories(FilePath.parent_path());
    std::ofstream File(FilePath, std::ios::binary);
    File.write(Content.data(), static_cast<std::streamsize>(Content.size()));
  }

} // namespace

TEST_CASE("FileSystemResourceTree lists children in sorted order", "[host]")
{
  TempDir Dir;
  WriteFile(Dir.Path / "views" / "home.xhtml", "<html/>");
  WriteFile(Dir.Path / "views" / "admin" / "list.xhtml", "<html/>");
  WriteFile(Dir.Path / "views" / "about.jsp", "<%%>");
  std::filesystem::create_directories(Dir.Path / "views" / "empty");

  FileSystemResourceTree Tree(Dir.Path);

  SECTION("root")
  {
    auto Children = Tree.ListChildren("/");
    REQUIRE(Children.has_value());
    REQUIRE(*Children == std::vector<std::string>{"/views/"});
  }

  SECTION("nested directory")
  {
    auto Children = Tree.ListChildren("/views/");
    REQUIRE(Children.has_value());
    REQUIRE(*Children == std::vector<std::string>{"/views/about.jsp", "/views/admin/", "/views/empty/", "/views/home.xhtml"});
  }

  SECTION("directory without trailing separator")
  {
    auto Children = Tree.ListChildren("/views/admin");
    REQUIRE(Children.has_value());
    REQUIRE(*Children == std::vector<std::string>{"/views/admin/list.xhtml"});
  }

  SECTION("empty directory")
  {
    auto Children = Tree.ListChildren("/views/empty/");
    REQUIRE(Children.has_value());
    REQUIRE(Children->empty());
  }
}

TEST_CASE("FileSystemResourceTree refuses paths it cannot list", "[host]")
{
  TempDir Dir;
  WriteFile(Dir.Path / "web" / "index.xhtml", "<html/>");
  WriteFile(Dir.Path / "outside.xhtml", "<html/>");

  FileSystemResourceTree Tree(Dir.Path / "web");

  REQUIRE_FALSE(Tree.ListChildren("/missing/").has_value());
  REQUIRE_FALSE(Tree.ListChildren("/index.xhtml").has_value());
  REQUIRE_FALSE(Tree.ListChildren("/../").has_value());
  REQUIRE_FALSE(Tree.ListChildren("").has_value());
  REQUIRE_FALSE(Tree.ListChildren("relative/").has_value());
}

TEST_CASE("FileSystemResourceTree stays inside its web root", "[host]")
{
  TempDir Dir;
  WriteFile(Dir.Path / "web" / "pages" / "index.xhtml", "<html/>");
  WriteFile(Dir.Path / "secret" / "passwd", "root");

  FileSystemResourceTree Tree(Dir.Path / "web");
  auto SecretDir = (Dir.Path / "secret").generic_string();

  REQUIRE_FALSE(Tree.ListChildren("//etc/").has_value());
  REQUIRE_FALSE(Tree.ListChildren("/" + SecretDir + "/").has_value());
  REQUIRE_FALSE(Tree.ListChildren("/pages//").has_value());
  REQUIRE_FALSE(Tree.ListChildren("/pages/../../secret/").has_value());

  auto Children = Tree.ListChildren("/pages/");
  REQUIRE(Children.has_value());
  REQUIRE(*Children == std::vector<std::string>{"/pages/index.xhtml"});
}

TEST_CASE("Host context scans a web root on disk", "[host]")
{
  TempDir Dir;
  WriteFile(Dir.Path / "WEB-INF" / "faces-views" / "index.xhtml", "<html/>");
  WriteFile(Dir.Path / "WEB-INF" / "faces-views" / "admin" / "users.xhtml", "<html/>");
  WriteFile(Dir.Path / "WEB-INF" / "web.xml", "<web-app/>");
  WriteFile(Dir.Path / "public" / "contact.jsp", "<%%>");

  HostConfig Config;
  Config.WebRoot = Dir.Path.string();
  Config.InitParameters[std::string(kScanPathsParam)] = "/public/*.jsp";
  Config.DispatcherMappings = {"/faces/*"};

  auto Host = CreateHostContext(Config);
  ApplicationContext Context(*Host);

  auto Summary = ViewMapperInitializer::Initialize(Context);
  REQUIRE(Summary.has_value());
  REQUIRE(Summary->ViewCount == 6);

  REQUIRE(ViewIndex::GetMappedPath(Context, "admin/users") == "/WEB-INF/faces-views/admin/users.xhtml");
  REQUIRE(ViewIndex::GetMappedPath(Context, "contact") == "/public/contact.jsp");
  REQUIRE(ViewIndex::GetMappedPath(Context, "web") == "web");

  auto* Dispatcher = Host->FindDispatcher();
  REQUIRE(Dispatcher != nullptr);
  REQUIRE(Dispatcher->GetMappings() == std::vector<std::string>{"/faces/*", "*.jsp", "*.xhtml"});
}

TEST_CASE("Host context without dispatcher", "[host]")
{
  TempDir Dir;
  WriteFile(Dir.Path / "WEB-INF" / "faces-views" / "index.xhtml", "<html/>");

  HostConfig Config;
  Config.WebRoot = Dir.Path.string();
  Config.bEnableDispatcher = false;

  auto Host = CreateHostContext(Config);
  ApplicationContext Context(*Host);

  auto Summary = ViewMapperInitializer::Initialize(Context);
  REQUIRE(Summary.has_value());
  REQUIRE(Summary->bStored);
  REQUIRE(Host->FindDispatcher() == nullptr);
  REQUIRE_FALSE(Host->GetInitParameter(kScanPathsParam).has_value());
}
