#include "toolsmith/cli/commands.hpp"

int main(int argc, char **argv) { return toolsmith::cli::run_cli(argc, argv); }
