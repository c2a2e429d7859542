//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: main.cpp
// Purpose: cdev command-line entry point
//==========================================================================================================

#include "cdev/cli/Commands.h"

#include <iostream>
#include <string>
#include <vector>

int main(int argc, char* argv[]) {
    const std::vector<std::string> args(argv + 1, argv + argc);
    return cdev::cli::Run(args, std::cout, std::cerr);
}
