/**
 * @file spa_router_test.cpp
 * @brief Unit tests for the SPA routing decision
 *
 * The existence check is a GMock MockFunction so each test states exactly
 * how often the filesystem may be consulted.
 */

#include "routing/spa_router.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace spaserve::routing;
using ::testing::_;
using ::testing::MockFunction;
using ::testing::Return;

class SpaRouterTest : public ::testing::Test {
protected:
    MockFunction<bool(const std::string &)> exists;

    FileExistsFn exists_fn() {
        return [this](const std::string &path) { return exists.Call(path); };
    }
};

//=============================================================================
// Asset classification
//=============================================================================

TEST(AssetPathTest, StaticExtensionsAreAssets) {
    EXPECT_TRUE(is_asset_path("/app.js"));
    EXPECT_TRUE(is_asset_path("/styles/main.css"));
    EXPECT_TRUE(is_asset_path("/img/logo.png"));
    EXPECT_TRUE(is_asset_path("/photo.jpg"));
    EXPECT_TRUE(is_asset_path("/favicon.ico"));
    EXPECT_TRUE(is_asset_path("/icons/menu.svg"));
}

TEST(AssetPathTest, AssetPrefixIsAsset) {
    EXPECT_TRUE(is_asset_path("/assets/"));
    EXPECT_TRUE(is_asset_path("/assets/logo.png"));
    EXPECT_TRUE(is_asset_path("/assets/fonts/inter.woff2"));
    EXPECT_TRUE(is_asset_path("/assets/no-extension"));
}

TEST(AssetPathTest, OtherPathsAreNotAssets) {
    EXPECT_FALSE(is_asset_path("/"));
    EXPECT_FALSE(is_asset_path("/dashboard/settings"));
    EXPECT_FALSE(is_asset_path("/index.html"));
    EXPECT_FALSE(is_asset_path("/manifest.json"));
    EXPECT_FALSE(is_asset_path("/font.woff2"));
    EXPECT_FALSE(is_asset_path("/jpeg.jpeg"));
}

TEST(AssetPathTest, PrefixMustBeASegment) {
    EXPECT_FALSE(is_asset_path("/assets"));
    EXPECT_FALSE(is_asset_path("/assetsfoo/bar"));
    EXPECT_FALSE(is_asset_path("/static/assets/x"));
}

TEST(AssetPathTest, ExtensionMatchIsCaseSensitive) {
    EXPECT_FALSE(is_asset_path("/APP.JS"));
    EXPECT_FALSE(is_asset_path("/logo.PNG"));
}

TEST(AssetPathTest, ExtensionMustBeASuffix) {
    EXPECT_FALSE(is_asset_path("/app.js.map"));
    EXPECT_FALSE(is_asset_path("/route.js/details"));
}

//=============================================================================
// resolve_serve_path
//=============================================================================

TEST_F(SpaRouterTest, AssetIsServedLiterallyWithoutExistenceCheck) {
    EXPECT_CALL(exists, Call(_)).Times(0);

    ServePath result = resolve_serve_path("/app.js", exists_fn());
    EXPECT_EQ(result.path, "/app.js");
    EXPECT_EQ(result.kind, RouteKind::ASSET);
    EXPECT_FALSE(result.rewritten());
}

TEST_F(SpaRouterTest, AssetPrefixWinsRegardlessOfExtension) {
    EXPECT_CALL(exists, Call(_)).Times(0);

    ServePath result = resolve_serve_path("/assets/logo.png", exists_fn());
    EXPECT_EQ(result.path, "/assets/logo.png");
    EXPECT_EQ(result.kind, RouteKind::ASSET);

    result = resolve_serve_path("/assets/data", exists_fn());
    EXPECT_EQ(result.path, "/assets/data");
    EXPECT_EQ(result.kind, RouteKind::ASSET);
}

TEST_F(SpaRouterTest, RootIsServedWithoutExistenceCheck) {
    EXPECT_CALL(exists, Call(_)).Times(0);

    ServePath result = resolve_serve_path("/", exists_fn());
    EXPECT_EQ(result.path, "/");
    EXPECT_EQ(result.kind, RouteKind::ROOT);
    EXPECT_FALSE(result.rewritten());
}

TEST_F(SpaRouterTest, MissingRouteIsRewrittenToRoot) {
    EXPECT_CALL(exists, Call("/dashboard/settings")).Times(1).WillOnce(Return(false));

    ServePath result = resolve_serve_path("/dashboard/settings", exists_fn());
    EXPECT_EQ(result.path, "/");
    EXPECT_EQ(result.kind, RouteKind::FALLBACK);
    EXPECT_TRUE(result.rewritten());
}

TEST_F(SpaRouterTest, ExistingFileIsServedAsGiven) {
    EXPECT_CALL(exists, Call("/robots.txt")).Times(1).WillOnce(Return(true));

    ServePath result = resolve_serve_path("/robots.txt", exists_fn());
    EXPECT_EQ(result.path, "/robots.txt");
    EXPECT_EQ(result.kind, RouteKind::EXISTING);
    EXPECT_FALSE(result.rewritten());
}

TEST_F(SpaRouterTest, RewriteIsIdempotent) {
    EXPECT_CALL(exists, Call("/missing/page")).Times(1).WillOnce(Return(false));

    ServePath first = resolve_serve_path("/missing/page", exists_fn());
    ASSERT_EQ(first.path, "/");

    // Second pass hits the "/" guard, no further existence check
    ServePath second = resolve_serve_path(first.path, exists_fn());
    EXPECT_EQ(second.path, "/");
    EXPECT_EQ(second.kind, RouteKind::ROOT);
}

TEST_F(SpaRouterTest, MissingAssetIsStillNotRewritten) {
    EXPECT_CALL(exists, Call(_)).Times(0);

    for (const std::string path : {"/gone.js", "/gone.css", "/assets/gone.bin"}) {
        ServePath result = resolve_serve_path(path, exists_fn());
        EXPECT_EQ(result.path, path);
        EXPECT_EQ(result.kind, RouteKind::ASSET);
    }
}

TEST_F(SpaRouterTest, AssetsIgnoreFilesystemStateEntirely) {
    const std::vector<std::string> assets = {"/app.js", "/a/b.css", "/x.png", "/y.jpg", "/favicon.ico",
                                             "/z.svg",  "/assets/", "/assets/deep/file"};

    FileExistsFn always = [](const std::string &) { return true; };
    FileExistsFn never = [](const std::string &) { return false; };

    for (const auto &path : assets) {
        EXPECT_EQ(resolve_serve_path(path, always).path, path);
        EXPECT_EQ(resolve_serve_path(path, never).path, path);
    }
}

TEST_F(SpaRouterTest, EachRouteChecksExistenceExactlyOnce) {
    EXPECT_CALL(exists, Call("/a")).Times(1).WillOnce(Return(false));
    EXPECT_CALL(exists, Call("/b/")).Times(1).WillOnce(Return(true));

    EXPECT_EQ(resolve_serve_path("/a", exists_fn()).path, "/");
    EXPECT_EQ(resolve_serve_path("/b/", exists_fn()).path, "/b/");
}

TEST(SpaRouterNoCheckTest, NullExistenceCheckMeansNothingExists) {
    ServePath result = resolve_serve_path("/users/42", FileExistsFn());
    EXPECT_EQ(result.path, "/");
    EXPECT_EQ(result.kind, RouteKind::FALLBACK);
}

TEST(RouteKindTest, Names) {
    EXPECT_EQ(route_kind_to_string(RouteKind::ASSET), "ASSET");
    EXPECT_EQ(route_kind_to_string(RouteKind::ROOT), "ROOT");
    EXPECT_EQ(route_kind_to_string(RouteKind::EXISTING), "EXISTING");
    EXPECT_EQ(route_kind_to_string(RouteKind::FALLBACK), "FALLBACK");
}
