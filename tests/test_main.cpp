#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>
#include "Logger.hpp"

int main(int argc, char** argv) {
    // Collision warnings are expected while testing
    nexus_keycode::Logger::enableConsoleOutput(false);

    doctest::Context context(argc, argv);
    return context.run();
}
