//===----------------------------------------------------------------------===//
//
// Part of the CilKit project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Entry point for the `cil-opinfo` binary; all work happens in runCLI.
//
//===----------------------------------------------------------------------===//

#include "tools/cil-opinfo/driver.hpp"

#include <iostream>

int main(int argc, char **argv)
{
    return cil::tools::opinfo::runCLI(argc, argv, std::cout, std::cerr);
}
