#include "cli/CommandLine.h"

int main(int argc, char* argv[]) {
    return stratlab::cli::run(argc, argv);
}
