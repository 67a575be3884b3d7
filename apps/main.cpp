#include <iostream>

#include "cli.hpp"

int main(int argc, char** argv) {
  return chartok::cli::run(chartok::cli::Args(argv + 1, argv + argc),
                           std::cout, std::cerr);
}
