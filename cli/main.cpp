#include <cstdio>
#include <iostream>
#include <unistd.h>

#include "app.h"

int main(int argc, char** argv) {
  return schemediff::cli::run_main(argc, argv, std::cout, std::cerr, isatty(fileno(stdout)) != 0);
}
