#pragma once

#include <string>

#include <ddb/convert/converter.h>

namespace ddb {
namespace convert {

// Parses command-line arguments for the ddbconv tool
class CliArgs {
  public:
    enum class Action {
        HELP,     // Show help message
        CONVERT   // Convert input to output (default once a mode is given)
    };

    // Throws std::invalid_argument on unknown modes or options, and on
    // options that are missing their value.
    CliArgs(int argc, const char* argv[]);

    // Accessors
    Action getAction() const { return action_; }
    const ConvertOptions& getOptions() const { return options_; }
    bool hasInputPath() const { return !inputPath_.empty(); }
    const std::string& getInputPath() const { return inputPath_; }
    bool hasOutputPath() const { return !outputPath_.empty(); }
    const std::string& getOutputPath() const { return outputPath_; }

  private:
    Action action_ = Action::HELP;
    ConvertOptions options_;
    std::string inputPath_;
    std::string outputPath_;
};

}  // namespace convert
}  // namespace ddb
