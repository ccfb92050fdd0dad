#include <iostream>
#include <cstdlib>

#include "mdvault/cli/application.hpp"

int main(int argc, char* argv[]) {
  try {
    mdvault::cli::Application app;
    return app.run(argc, argv);
  } catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << std::endl;
    return 1;
  }
}
