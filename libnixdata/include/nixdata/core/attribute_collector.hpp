// Copyright (c) 2023, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef NIXDATA_CORE_ATTRIBUTE_COLLECTOR_HPP
#define NIXDATA_CORE_ATTRIBUTE_COLLECTOR_HPP

#include <set>
#include <string>
#include <string_view>
#include <vector>

#include "nixdata/core/error_handling.hpp"
#include "nixdata/fs/filesystem.hpp"

namespace nixdata
{
    using DeclaredPackageSet = std::set<std::string>;

    /**
     * Extract the list of values declared under a key of a configuration file.
     */
    class DeclarationReader
    {
    public:

        virtual ~DeclarationReader() = default;

        DeclarationReader(const DeclarationReader&) = delete;
        DeclarationReader& operator=(const DeclarationReader&) = delete;
        DeclarationReader(DeclarationReader&&) = delete;
        DeclarationReader& operator=(DeclarationReader&&) = delete;

        // Values in declaration order, errors are ``config_read_failed``.
        [[nodiscard]] auto read(std::string_view content, std::string_view key)
            -> expected_t<std::vector<std::string>>;

    protected:

        DeclarationReader() = default;

    private:

        virtual auto read_impl(std::string_view content, std::string_view key)
            -> expected_t<std::vector<std::string>> = 0;
    };

    /**
     * Reads ``key = [ a b ];`` and ``key = with pkgs; [ a b ];`` in a Nix file.
     *
     * Comments are ignored, parenthesized expressions and strings are kept as single
     * elements. The first definition of the key is used.
     */
    class NixListReader : public DeclarationReader
    {
    private:

        auto read_impl(std::string_view content, std::string_view key)
            -> expected_t<std::vector<std::string>> override;
    };

    class AttributeCollector
    {
    public:

        static constexpr std::string_view default_key = "environment.systemPackages";

        explicit AttributeCollector(
            DeclarationReader& reader,
            std::string key = std::string(default_key)
        );

        /**
         * Union of the values declared in every readable source.
         *
         * Unreadable or unparsable sources are skipped.
         */
        [[nodiscard]] auto collect(const std::vector<fs::path>& sources) const -> DeclaredPackageSet;

    private:

        DeclarationReader& m_reader;
        std::string m_key;
    };
}

#endif
