#include "agentcore/cli/router.hpp"

int main(int argc, char** argv) {
  return agentcore::cli::Dispatch(argc, argv);
}
