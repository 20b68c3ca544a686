#include <iostream>
#include <string>
#include <vector>
#include <glog/logging.h>

#include "commands.h"
#include "common/configuration.h"

int main(int argc, char* argv[]) {
    // Initialize logging
    google::InitGoogleLogging(argv[0]);
    google::InstallFailureSignalHandler();

    const Recpool::Configuration& config = Recpool::GetConfig();
    FLAGS_logtostderr = config.config().logging.to_stderr.get();
    FLAGS_v = config.getLogVerbosity();

    std::vector<std::string> args(argv, argv + argc);
    return Recpool::RunCli(args, std::cout, std::cerr);
}
