#include "cli/router.hpp"

int main(int argc, char** argv) {
  return coresidency::cli::Dispatch(argc, argv);
}
