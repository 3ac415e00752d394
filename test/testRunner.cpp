#define CATCH_CONFIG_RUNNER
#include <catch2/catch.hpp>

#include <filesystem>

#include "Logger.hpp"

int main(int argc, char* argv[]) {
    Catch::Session session;

    const int returnCode = session.applyCommandLine(argc, argv);
    if (returnCode != 0) return returnCode;

    // Keep run folders of the test executable out of the working tree
    logger::configure((std::filesystem::temp_directory_path() / "kinfit-tests").string(), "tests");

    return session.run();
}
