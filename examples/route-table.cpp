#include <fsroute/fsroute.hpp>

#include <cstdlib>
#include <exception>
#include <filesystem>
#include <iostream>
#include <string_view>
#include <utility>

// Usage: route-table <content-root> [target...]
// Prints every route of the content root, then how each given request target resolves.
int main(int argc, char** argv) {
  std::filesystem::path root = ".";
  if (argc > 1) {
    root = argv[1];
  }

  try {
    fsroute::RouteConfig config;
    config.withContentRoot(root).withDirectoryListing();

    const fsroute::FileRouter router(std::move(config), {}, fsroute::WatcherConfig{}.withEnabled(false));

    std::cout << "Routes of " << router.index().rootPath() << " (version " << router.index().version() << "):\n";
    router.index().forEach([](const fsroute::RouteDescriptor& descriptor) {
      std::cout << "  /" << descriptor.normalizedPath << " -> " << fsroute::RouteKindName(descriptor.kind) << " "
                << descriptor.absoluteFilePath.string() << '\n';
    });

    for (int argPos = 2; argPos < argc; ++argPos) {
      const std::string_view target = argv[argPos];
      const fsroute::ResolveResult resolved = router.resolve(target);
      std::cout << target << " => ";
      if (resolved.ok()) {
        std::cout << fsroute::RouteKindName(resolved.route.dispatchKind()) << " "
                  << resolved.route.descriptor().absoluteFilePath.string();
        if (resolved.route.isListing) {
          std::cout << " (listing)";
        }
      } else {
        std::cout << fsroute::MissReasonName(resolved.miss) << " ("
                  << fsroute::MissStatusCode(resolved.miss) << ")";
      }
      std::cout << '\n';
    }
  } catch (const std::exception& ex) {
    std::cerr << "Error: " << ex.what() << '\n';
    return EXIT_FAILURE;
  }

  return 0;
}
