#include "cli/run_cli.hpp"

int main(int argc, char* argv[]) {
    return run_cli(argc, argv);
}
