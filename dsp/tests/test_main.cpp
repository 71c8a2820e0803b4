// ==============================================================================
// DSP Library Tests Main
// ==============================================================================
// Provides Catch2 main() function for the DSP unit tests executable.
// ==============================================================================

#include <catch2/catch_session.hpp>

int main(int argc, char* argv[]) {
    return Catch::Session().run(argc, argv);
}
