#pragma once

#include <string>
#include <vector>

namespace od {
namespace cli {

// Command line of the odict-merge tool:
//   odict-merge [--shallow] [--indent N] [--output PATH] [--verbose] FILE...
class CliArgs {
  public:
    enum class Action {
        HELP,  // Show help message
        MERGE  // Merge the input files (default)
    };

    // Throws std::invalid_argument on malformed or unknown options.
    CliArgs(int argc, const char* argv[]);

    Action getAction() const { return action_; }
    const std::vector<std::string>& getInputs() const { return inputs_; }
    bool recursive() const { return recursive_; }
    int getIndent() const { return indent_; }
    bool hasOutput() const { return not output_.empty(); }
    const std::string& getOutput() const { return output_; }
    bool verbose() const { return verbose_; }

    static std::string usage();

  private:
    Action action_ = Action::HELP;
    std::vector<std::string> inputs_;
    bool recursive_ = true;
    int indent_ = 4;
    std::string output_;
    bool verbose_ = false;
};

}  // namespace cli
}  // namespace od
