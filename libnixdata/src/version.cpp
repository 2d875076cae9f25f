// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include "nixdata/version.hpp"

namespace nixdata
{
    std::string version()
    {
        return NIXDATA_VERSION_STRING;
    }
}
