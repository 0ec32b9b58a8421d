#include "cudaswitch/cli/router.hpp"

int main(int argc, char** argv) {
  return cudaswitch::cli::Dispatch(argc, argv);
}
