#include "packforge/cli/router.hpp"

int main(int argc, char** argv) {
  // Argument parsing and the exit-code contract live in the CLI router.
  return packforge::cli::Dispatch(argc, argv);
}
