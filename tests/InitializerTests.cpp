#include <catch2/catch_test_macros.hpp>

#include "ViewIndex.h"
#include "ViewMapperInitializer.h"
#include "ViewMapperParams.h"
#include "TestHost.h"

using namespace ViewMapper;
using namespace ViewMapper::Test;

TEST_CASE("ViewMapperInitializer scans, stores and maps the dispatcher", "[init]")
{
  TestHostContext Host;
  Host.Params[std::string(kScanPathsParam)] = "/legacy/*.jsp";
  Host.Dispatcher = std::make_unique<RecordingDispatcher>(std::vector<std::string>{"/faces/*"});
  Host.Tree.AddFile("/WEB-INF/faces-views/index.xhtml").AddFile("/legacy/old.jsp").AddFile("/legacy/skip.xhtml");
  ApplicationContext Context(Host);

  auto Summary = ViewMapperInitializer::Initialize(Context);

  REQUIRE(Summary.has_value());
  REQUIRE(Summary->bEnabled);
  REQUIRE(Summary->bStored);
  REQUIRE(Summary->ViewCount == 4);
  REQUIRE(Summary->Extensions == ExtensionSet{"*.jsp", "*.xhtml"});
  REQUIRE(Host.Dispatcher->GetMappings() == std::vector<std::string>{"/faces/*", "*.jsp", "*.xhtml"});

  REQUIRE(ViewIndex::GetMappedPath(Context, "old") == "/legacy/old.jsp");
  REQUIRE(ViewIndex::GetMappedPath(Context, "skip") == "skip");
}

TEST_CASE("ViewMapperInitializer can be switched off", "[init]")
{
  TestHostContext Host;
  Host.Params[std::string(kEnabledParam)] = "False";
  Host.Dispatcher = std::make_unique<RecordingDispatcher>();
  Host.Tree.AddFile("/WEB-INF/faces-views/index.xhtml");
  ApplicationContext Context(Host);

  REQUIRE_FALSE(ViewMapperInitializer::IsEnabled(Context));

  auto Summary = ViewMapperInitializer::Initialize(Context);

  REQUIRE(Summary.has_value());
  REQUIRE_FALSE(Summary->bEnabled);
  REQUIRE_FALSE(Context.HasViews());
  REQUIRE(Host.Dispatcher->AddCalls == 0);
  REQUIRE(Host.Tree.GetListCalls() == 0);
}

TEST_CASE("ViewMapperInitializer is enabled unless explicitly disabled", "[init]")
{
  TestHostContext Host;

  SECTION("absent")
  {
    ApplicationContext Context(Host);
    REQUIRE(ViewMapperInitializer::IsEnabled(Context));
  }

  SECTION("padded false disables")
  {
    Host.Params[std::string(kEnabledParam)] = "  FALSE ";
    ApplicationContext Context(Host);
    REQUIRE_FALSE(ViewMapperInitializer::IsEnabled(Context));
  }

  SECTION("any other value")
  {
    Host.Params[std::string(kEnabledParam)] = "no";
    ApplicationContext Context(Host);
    REQUIRE(ViewMapperInitializer::IsEnabled(Context));
  }
}

TEST_CASE("ViewMapperInitializer rejects malformed scan paths", "[init]")
{
  TestHostContext Host;
  Host.Params[std::string(kScanPathsParam)] = "/views/*.x*html";
  Host.Dispatcher = std::make_unique<RecordingDispatcher>();
  Host.Tree.AddFile("/WEB-INF/faces-views/index.xhtml");
  ApplicationContext Context(Host);

  auto Summary = ViewMapperInitializer::Initialize(Context);

  REQUIRE_FALSE(Summary.has_value());
  REQUIRE(Summary.error().find("/views/*.x*html") != std::string::npos);
  REQUIRE(Host.Errors.size() == 1);
  REQUIRE_FALSE(Context.HasViews());
  REQUIRE(Host.Dispatcher->AddCalls == 0);
}

TEST_CASE("ViewMapperInitializer never maps a catch-all pattern", "[init]")
{
  TestHostContext Host;
  Host.Dispatcher = std::make_unique<RecordingDispatcher>(std::vector<std::string>{"/faces/*"});
  Host.Tree.AddFile("/WEB-INF/faces-views/LICENSE").AddFile("/WEB-INF/faces-views/index.xhtml");
  ApplicationContext Context(Host);

  auto Summary = ViewMapperInitializer::Initialize(Context);

  REQUIRE(Summary.has_value());
  REQUIRE(Summary->Extensions == ExtensionSet{"*.xhtml"});
  REQUIRE(Host.Dispatcher->GetMappings() == std::vector<std::string>{"/faces/*", "*.xhtml"});
}

TEST_CASE("ViewMapperInitializer reports only what its own scan stored", "[init]")
{
  TestHostContext Host;
  ApplicationContext Context(Host);
  Context.StoreViews(std::make_shared<const ViewMap>(ViewMap{{"home", "/views/home.xhtml"}}));

  auto Summary = ViewMapperInitializer::Initialize(Context);

  REQUIRE(Summary.has_value());
  REQUIRE(Summary->ViewCount == 0);
  REQUIRE_FALSE(Summary->bStored);
  REQUIRE(ViewIndex::GetMappedPath(Context, "home") == "/views/home.xhtml");
}

TEST_CASE("ViewMapperInitializer with nothing to scan", "[init]")
{
  TestHostContext Host;
  Host.Dispatcher = std::make_unique<RecordingDispatcher>();
  ApplicationContext Context(Host);

  auto Summary = ViewMapperInitializer::Initialize(Context);

  REQUIRE(Summary.has_value());
  REQUIRE(Summary->bEnabled);
  REQUIRE_FALSE(Summary->bStored);
  REQUIRE(Summary->ViewCount == 0);
  REQUIRE(Host.Dispatcher->AddCalls == 0);
}
