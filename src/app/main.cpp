#include <cstdlib>
#include <iostream>

#include "quire/cli/application.hpp"

int main(int argc, char* argv[]) {
  try {
    quire::cli::Application app;
    return app.run(argc, argv);
  } catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << std::endl;
    return EXIT_FAILURE;
  }
}
