#include "cli/cli.h"
#include <iostream>

int main(int argc, char* argv[]) {
    coursedao::CliConfig config;

    if (!coursedao::parseArgs(argc, argv, config)) {
        coursedao::printHelp(argv[0], std::cerr);
        return 1;
    }

    if (config.showHelp) {
        coursedao::printHelp(argv[0], std::cout);
        return 0;
    }

    if (config.showVersion) {
        coursedao::printVersion(std::cout);
        return 0;
    }

    coursedao::CourseDaoCli cli(config, std::cout, std::cerr);
    if (!cli.initialize()) {
        return 1;
    }
    return cli.runCommand(config.commandArgs);
}
