// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef NIXDATA_FS_FILESYSTEM_HPP
#define NIXDATA_FS_FILESYSTEM_HPP

#include <filesystem>

namespace nixdata
{
    // Paths are only ever handled on Linux, where the native encoding is already UTF-8.
    namespace fs = std::filesystem;
}

#endif
