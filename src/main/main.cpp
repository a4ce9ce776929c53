#include "backup/backup_cli.hpp"
#include "common/logger.hpp"
#include <iostream>
#include <string>
#include <vector>

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);

    try {
        BackupCLI cli;
        int code = cli.run(args);
        Logger::shutdown();
        return code;
    } catch (const std::exception& e) {
        std::cerr << "Error in main: " << e.what() << std::endl;
        if (Logger::isInitialized()) {
            Logger::error("Error in main: " + std::string(e.what()));
        }
        return 1;
    }
}
