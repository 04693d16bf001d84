#include "mediaprep/cli/router.hpp"

int main(int argc, char** argv) {
  // All command parsing and exit-code contracts live in the CLI router.
  return mediaprep::cli::Dispatch(argc, argv);
}
