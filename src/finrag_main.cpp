#include <finrag/finrag_cli.h>

#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {
void PrintGlobalUsage() {
  std::cout
      << "Usage: finrag <command> [options]\n\n"
      << "Commands:\n"
      << "  ingest     Chunk, embed and cache one document file.\n"
      << "  ask        Retrieve passages for a company and generate an answer.\n"
      << "  analyze    Run the full analysis pipeline against a manifest.\n"
      << "  cache      Manage the document cache (stats, list, reset, remove).\n"
      << "  providers  List the configured generation providers.\n\n"
      << "Run 'finrag <command> --help' for command options.\n";
}
} // namespace

int main(int argc, char **argv) {
  try {
    const std::vector<std::string> arguments(argv + 1, argv + argc);
    if (arguments.empty() || arguments.front() == "--help" ||
        arguments.front() == "-h") {
      PrintGlobalUsage();
      return arguments.empty() ? 1 : 0;
    }

    const auto &command = arguments.front();
    const std::vector<std::string> command_arguments(arguments.begin() + 1,
                                                     arguments.end());
    if (command == "ingest") {
      return finrag::RunIngest(command_arguments, std::cout);
    }
    if (command == "ask") {
      return finrag::RunAsk(command_arguments, std::cout);
    }
    if (command == "analyze") {
      return finrag::RunAnalyze(command_arguments, std::cout);
    }
    if (command == "cache") {
      return finrag::RunCacheCommand(command_arguments, std::cout);
    }
    if (command == "providers") {
      return finrag::RunProviders(command_arguments, std::cout);
    }

    throw std::invalid_argument("Unknown command: " + command);
  } catch (const std::exception &ex) {
    std::cerr << "Error: " << ex.what() << "\n";
    return 1;
  }
}
