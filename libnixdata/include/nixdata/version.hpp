// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef NIXDATA_VERSION_HPP
#define NIXDATA_VERSION_HPP

#include <string>

#define NIXDATA_VERSION_MAJOR 0
#define NIXDATA_VERSION_MINOR 1
#define NIXDATA_VERSION_PATCH 0

#define NIXDATA_VERSION_STRING "0.1.0"

namespace nixdata
{
    std::string version();
}

#endif
