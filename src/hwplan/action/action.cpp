#include "hwplan/action/action.hpp"

#include <string>
#include <variant>
#include <vector>

#include "hwplan/common/overloaded.hpp"

namespace hwplan::action {

auto OutputsOf(const Action& action) -> std::vector<Artifact> {
  return std::visit(
      Overloaded{
          [](const RunAction& run) { return run.outputs; },
          [](const WriteAction& write) {
            return std::vector<Artifact>{write.output};
          },
      },
      action);
}

auto MnemonicOf(const Action& action) -> std::string {
  return std::visit(
      Overloaded{
          [](const RunAction& run) { return run.mnemonic; },
          [](const WriteAction&) { return std::string("FileWrite"); },
      },
      action);
}

}  // namespace hwplan::action
