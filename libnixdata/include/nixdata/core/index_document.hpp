// Copyright (c) 2023, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef NIXDATA_CORE_INDEX_DOCUMENT_HPP
#define NIXDATA_CORE_INDEX_DOCUMENT_HPP

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

#include "nixdata/core/error_handling.hpp"
#include "nixdata/core/index_source.hpp"

namespace nixdata
{
    /**
     * The ``homepage`` field is either a single URL or a list of URLs.
     */
    struct Homepage
    {
        using Single = std::string;
        using List = std::vector<std::string>;

        std::variant<Single, List> value;

        // First URL of a list, the URL itself, or empty for an empty list
        [[nodiscard]] auto resolve() const -> std::string;
    };

    struct PackageMeta
    {
        // Flags absent from the document decode to false
        bool broken = false;
        bool insecure = false;
        bool unsupported = false;
        bool unfree = false;

        std::optional<std::string> description;
        std::optional<std::string> longdescription;
        std::optional<Homepage> homepage;
        std::optional<std::string> position;

        // Kept as structured values, serialized only when stored
        std::optional<nlohmann::json> maintainers;
        std::optional<nlohmann::json> license;
        std::optional<nlohmann::json> platforms;
    };

    struct PackageRecord
    {
        std::optional<std::string> system;
        std::string pname;
        std::string version;
        // Only filled for the extended variant
        PackageMeta meta;
    };

    struct IndexDocument
    {
        IndexVariant variant = IndexVariant::plain;
        // Ordered by attribute
        std::map<std::string, PackageRecord> packages;
    };

    /**
     * Decode a package index.
     *
     * The attribute mapping may be the root object itself or be wrapped in a top-level
     * ``packages`` object. Any structural mismatch is a ``decode_failed`` error and no
     * partial document is returned.
     */
    [[nodiscard]] auto decode_index_document(std::string_view content, IndexVariant variant)
        -> expected_t<IndexDocument>;
}

#endif
