#pragma once

namespace kild::cli {

int run_cli(int argc, char **argv);

} // namespace kild::cli
