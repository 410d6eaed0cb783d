#include "modforge/cli/router.hpp"

int main(int argc, char** argv) {
  return modforge::cli::Dispatch(argc, argv);
}
