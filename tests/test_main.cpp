// tests/test_main.cpp
//
// The only translation unit in the test executable that defines
// CATCH_CONFIG_RUNNER. Other test files include catch.hpp plainly.
#define CATCH_CONFIG_RUNNER
#include <catch2/catch.hpp>

#include <cstdlib>
#include <cstring>

namespace {

bool envTruthy(const char* v) {
    return v != nullptr && v[0] != '\0' && std::strcmp(v, "0") != 0;
}

bool runningInCi() {
    return envTruthy(std::getenv("CI")) || envTruthy(std::getenv("GITHUB_ACTIONS"));
}

} // namespace

int main(int argc, char** argv) {
    Catch::Session session;

    // Defaults; command-line flags override them.
    session.configData().runOrder = Catch::RunTests::InDeclarationOrder;
    session.configData().showDurations = Catch::ShowDurations::Always;
    if (runningInCi()) {
        session.configData().useColour = Catch::UseColour::No;
    }

    const int rc = session.applyCommandLine(argc, argv);
    if (rc != 0) {
        return rc;
    }
    return session.run();
}
