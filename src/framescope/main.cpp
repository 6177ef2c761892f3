#include "framescope/cli/router.hpp"

int main(int argc, char** argv) {
  return framescope::cli::Dispatch(argc, argv);
}
