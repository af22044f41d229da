#include <arbor/arbor.hpp>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <string>

using namespace arbor;

namespace {

Node::Handler Page(const char *name) {
  return [name](Node::HandlerArgs) { return std::string("200 ") + name; };
}

}  // namespace

// Dispatch each path given on the command line against a small site tree and print the results.
int main(int argc, char **argv) {
  if (argc < 2) {
    std::cerr << "Usage: " << argv[0] << " <path>...\n";
    return EXIT_FAILURE;
  }

  log::set_level(log::level::debug);

  try {
    auto root = Node::Create("root", Page("home"));

    auto auth = Node::Create("auth", {}, *root);
    Node::Create("login", Page("login"), *auth);
    Node::Create("register", Page("register"), *auth);

    auto dashboard = Node::Create("dashboard", {}, *root);
    Node::Create("users_list", Page("users list"), *dashboard);
    Node::Create("product_list", Page("product list"), *dashboard);

    Router router(NodeTree(root), [](const RouteError &err) {
      if (dynamic_cast<const RouteNotFoundError *>(&err) != nullptr) {
        return "404 " + err.path();
      }
      return "400 " + err.path();
    });

    for (int argPos = 1; argPos < argc; ++argPos) {
      std::cout << argv[argPos] << " -> " << router.dispatch(argv[argPos]) << '\n';
    }
  } catch (const std::exception &e) {
    std::cerr << "Routing encountered error: " << e.what() << '\n';
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
