// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <catch2/catch_session.hpp>

int
main(int argc, char* argv[])
{
    Catch::Session session;

    // Run test cases in declaration order
    session.configData().runOrder = Catch::TestRunOrder::Declared;

    // Apply command line arguments (which may override the default)
    int returnCode = session.applyCommandLine(argc, argv);
    if (returnCode != 0)
    {
        return returnCode;
    }

    return session.run();
}
