#include "kild/cli/commands.hpp"

int main(int argc, char **argv) { return kild::cli::run_cli(argc, argv); }
