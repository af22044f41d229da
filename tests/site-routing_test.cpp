#include <gtest/gtest.h>

#include <string>
#include <string_view>
#include <utility>

#include "arbor/arbor.hpp"

namespace arbor {

namespace {

Node::Handler Page(std::string name) {
  return [name = std::move(name)](Node::HandlerArgs) { return "page:" + name; };
}

}  // namespace

// Site layout:
//   root (home)
//     auth -> login (login), register (register)
//     dashboard -> users_list (users), product_list (products)
class SiteRoutingTest : public ::testing::Test {
 protected:
  SiteRoutingTest() {
    auto auth = Node::Create("auth", {}, *root);
    Node::Create("login", Page("login"), *auth);
    Node::Create("register", Page("register"), *auth);

    auto dashboard = Node::Create("dashboard", {}, *root);
    Node::Create("users_list", Page("users"), *dashboard);
    Node::Create("product_list", Page("products"), *dashboard);
  }

  Node::Ptr root = Node::Create("root", Page("home"));
  Router router{NodeTree(root), [](const RouteError& err) {
                  if (dynamic_cast<const RouteNotFoundError*>(&err) != nullptr) {
                    return "404 " + err.path();
                  }
                  return "400 " + err.path();
                }};
};

TEST_F(SiteRoutingTest, ResolvesEveryPage) {
  EXPECT_EQ(router.dispatch("/"), "page:home");
  EXPECT_EQ(router.dispatch("/auth/login"), "page:login");
  EXPECT_EQ(router.dispatch("/auth/register/"), "page:register");
  EXPECT_EQ(router.dispatch("dashboard/users_list"), "page:users");
  EXPECT_EQ(router.dispatch("//dashboard//product_list//"), "page:products");
}

TEST_F(SiteRoutingTest, FailuresAreDelegated) {
  EXPECT_EQ(router.dispatch("/auth"), "400 /auth");
  EXPECT_EQ(router.dispatch("/dashboard/"), "400 /dashboard");
  EXPECT_EQ(router.dispatch("/auth/logout"), "404 /auth/logout");
  EXPECT_EQ(router.dispatch("/auth/login/extra"), "404 /auth/login/extra");
}

TEST_F(SiteRoutingTest, EveryNodeIsReachableFromItsPathKeys) {
  const NodeTree& tree = router.nodeTree();
  int nbChecked = 0;

  auto check = [&](auto& self, const Node& node) -> void {
    auto keys = tree.pathKeys(node);
    std::string path;
    for (const auto& key : keys) {
      path.push_back(SegmentCursor::kSeparator);
      path.append(key);
    }

    SegmentCursor cursor(path);
    if (node.hasHandler()) {
      EXPECT_EQ(&router.match(cursor), &node) << path;
    } else {
      EXPECT_THROW(static_cast<void>(router.match(cursor)), InvalidRouteError) << path;
    }
    ++nbChecked;

    for (const auto& entry : node.children()) {
      self(self, *entry.second);
    }
  };
  check(check, tree.rootNode());

  EXPECT_EQ(nbChecked, 7);
}

TEST_F(SiteRoutingTest, RoutesAddedAtRuntime) {
  EXPECT_EQ(router.dispatch("/dashboard/settings"), "404 /dashboard/settings");

  Node* dashboard = root->child("dashboard");
  ASSERT_NE(dashboard, nullptr);
  Node::Create("settings", Page("settings"), *dashboard);

  EXPECT_EQ(router.dispatch("/dashboard/settings"), "page:settings");
}

TEST_F(SiteRoutingTest, MovingSubtreeChangesItsRoutes) {
  auto auth = root->removeChild("auth");
  root->child("dashboard")->addChild(auth);

  EXPECT_EQ(router.dispatch("/auth/login"), "404 /auth/login");
  EXPECT_EQ(router.dispatch("/dashboard/auth/login"), "page:login");
  EXPECT_EQ(router.nodeTree().pathKeys(*auth->child("login")).size(), 3U);
}

TEST_F(SiteRoutingTest, SharedTreeWithIndependentRouters) {
  Router other(NodeTree(root));

  EXPECT_EQ(other.dispatch("/auth/login"), "page:login");
  EXPECT_EQ(router.nodeTree().activeNode(), &router.nodeTree().rootNode());
  EXPECT_THROW(other.dispatch("/nowhere"), RouteNotFoundError);
  EXPECT_EQ(router.dispatch("/nowhere"), "404 /nowhere");
}

}  // namespace arbor
