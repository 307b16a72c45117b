#include "rawiface/cli/router.hpp"

int main(int argc, char** argv) {
  return rawiface::cli::Dispatch(argc, argv);
}
