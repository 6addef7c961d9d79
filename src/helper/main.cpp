// lasso-helper: privileged executor. Invoked through a sudoers rule that
// names this binary only. Performs one write per invocation and exits.
#include "helper/Apply.hpp"
#include "helper/Protocol.hpp"

#include <cstdio>
#include <string>
#include <vector>

int main(int argc, char** argv) {
  using namespace lasso;
  std::vector<std::string> args;
  for (int i = 1; i < argc; ++i) args.emplace_back(argv[i]);

  std::string err;
  auto req = helper::decode(args, err);
  if (!req) {
    std::fprintf(stderr, "lasso-helper: %s: %s\n", model::to_string(model::ErrorKind::InvalidRequest), err.c_str());
    return helper::kExitInvalidRequest;
  }

  // Fixed paths; the environment is never consulted here
  auto resp = helper::execute_request(*req);
  if (!resp.ok()) {
    std::fprintf(stderr, "lasso-helper: %s: %s\n", model::to_string(resp.error), resp.detail.c_str());
    return helper::exit_code_for(resp.error);
  }
  return helper::kExitOk;
}
