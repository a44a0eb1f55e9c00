#include <catch2/catch_test_macros.hpp>

#include "ResourcePaths.h"

using namespace ViewMapper;

TEST_CASE("IsDirectory checks for a trailing separator", "[paths]")
{
  REQUIRE(ResourcePaths::IsDirectory("/"));
  REQUIRE(ResourcePaths::IsDirectory("/views/admin/"));
  REQUIRE_FALSE(ResourcePaths::IsDirectory("/views/admin"));
  REQUIRE_FALSE(ResourcePaths::IsDirectory("/views/home.xhtml"));
  REQUIRE_FALSE(ResourcePaths::IsDirectory(""));
}

TEST_CASE("StripPrefixPath", "[paths]")
{
  SECTION("removes a matching prefix")
  {
    REQUIRE(ResourcePaths::StripPrefixPath("/views/", "/views/admin/list.xhtml") == "admin/list.xhtml");
    REQUIRE(ResourcePaths::StripPrefixPath("/", "/index.xhtml") == "index.xhtml");
  }

  SECTION("returns the path unchanged when the prefix does not match")
  {
    REQUIRE(ResourcePaths::StripPrefixPath("/views/", "/templates/home.xhtml") == "/templates/home.xhtml");
    REQUIRE(ResourcePaths::StripPrefixPath("/views/admin/", "/views/") == "/views/");
  }

  SECTION("handles empty input")
  {
    REQUIRE(ResourcePaths::StripPrefixPath("", "/home.xhtml") == "/home.xhtml");
    REQUIRE(ResourcePaths::StripPrefixPath("/views/", "").empty());
  }
}

TEST_CASE("StripExtension", "[paths]")
{
  REQUIRE(ResourcePaths::StripExtension("admin/list.xhtml") == "admin/list");
  REQUIRE(ResourcePaths::StripExtension("/archive.tar.gz") == "/archive.tar");
  REQUIRE(ResourcePaths::StripExtension("README") == "README");
  REQUIRE(ResourcePaths::StripExtension("").empty());

  // A dot in a directory name is not an extension
  REQUIRE(ResourcePaths::StripExtension("/v1.2/page") == "/v1.2/page");
}

TEST_CASE("GetExtension", "[paths]")
{
  REQUIRE(ResourcePaths::GetExtension("/views/home.xhtml") == ".xhtml");
  REQUIRE(ResourcePaths::GetExtension("/archive.tar.gz") == ".gz");
  REQUIRE(ResourcePaths::GetExtension("/views/README").empty());
  REQUIRE(ResourcePaths::GetExtension("/v1.2/page").empty());
  REQUIRE(ResourcePaths::GetExtension("").empty());
}

TEST_CASE("StartsWithOneOf", "[paths]")
{
  REQUIRE(ResourcePaths::StartsWithOneOf("/WEB-INF/lib/", {"/WEB-INF/", "/META-INF/"}));
  REQUIRE(ResourcePaths::StartsWithOneOf("/META-INF/", {"/WEB-INF/", "/META-INF/"}));
  REQUIRE_FALSE(ResourcePaths::StartsWithOneOf("/views/WEB-INF/", {"/WEB-INF/", "/META-INF/"}));
  REQUIRE_FALSE(ResourcePaths::StartsWithOneOf("/views/", {}));
}
