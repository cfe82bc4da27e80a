#include <cstdlib>
#include <iostream>
#include <unistd.h>
#include "sandbox_probe/probe.hpp"

int main() {
    sandbox_probe::RenderOptions options;
    options.color = isatty(STDOUT_FILENO) == 1 && std::getenv("NO_COLOR") == nullptr;
    return sandbox_probe::run_probe(std::cout, std::cerr, options);
}
