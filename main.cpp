// main.cpp
#include <iostream>

#include "command_line.hpp"
#include "file_repairer.hpp"
#include "logger.hpp"
#include "repair_errors.hpp"

int main(int argc, char *argv[])
{
    ChunkFix::Cli::CommandLine cli;
    try
    {
        cli = ChunkFix::Cli::parseCommandLine(argc, argv);
    }
    catch (const ChunkFix::RepairError &e)
    {
        ChunkFix::Logger::error(e.what());
        if (e.exitCode() == ChunkFix::ExitCode::Usage)
        {
            std::cerr << ChunkFix::Cli::usageText();
        }
        return e.exitCode();
    }

    return ChunkFix::runCommandLine(cli, std::cout);
}
