// Copyright (c) 2023, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <algorithm>
#include <cctype>
#include <system_error>

#include <fmt/format.h>

#include "nixdata/core/attribute_collector.hpp"
#include "nixdata/core/output.hpp"
#include "nixdata/core/util.hpp"
#include "nixdata/util/string.hpp"

namespace nixdata
{
    namespace
    {
        auto is_identifier_char(char c) -> bool
        {
            return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-' || c == '\''
                   || c == '.';
        }

        // Length of the escape starting at ``''`` inside an indented string, 0 when the
        // ``''`` closes it. ``'''`` and ``''$`` are escapes, ``''\`` escapes one more character.
        auto indented_escape_length(std::string_view rest) -> std::size_t
        {
            const char next = rest.size() > 2 ? rest[2] : '\0';
            if (next == '\'' || next == '$')
            {
                return 3;
            }
            if (next == '\\')
            {
                return std::min<std::size_t>(4, rest.size());
            }
            return 0;
        }

        struct SourceText
        {
            // Comments blanked out, offsets preserved.
            std::string text;
            // Same as ``text`` with string contents blanked out as well.
            std::string code;
        };

        enum class Lexical
        {
            code,
            string,
            indented_string,
        };

        auto scan_source(std::string_view content) -> SourceText
        {
            auto out = SourceText{ std::string(content), std::string(content) };
            const auto size = content.size();
            auto at = [&](std::size_t i) -> char { return i < size ? content[i] : '\0'; };
            auto blank_code = [&](std::size_t i)
            {
                if (i < size && content[i] != '\n')
                {
                    out.code[i] = ' ';
                }
            };
            auto blank_all = [&](std::size_t i)
            {
                blank_code(i);
                if (i < size && content[i] != '\n')
                {
                    out.text[i] = ' ';
                }
            };

            auto state = Lexical::code;
            for (std::size_t i = 0; i < size; ++i)
            {
                const char c = content[i];
                switch (state)
                {
                    case Lexical::code:
                        if (c == '"')
                        {
                            state = Lexical::string;
                        }
                        else if (c == '\'' && at(i + 1) == '\'' && (i == 0 || !is_identifier_char(at(i - 1))))
                        {
                            state = Lexical::indented_string;
                            ++i;
                        }
                        else if (c == '#')
                        {
                            for (; i < size && content[i] != '\n'; ++i)
                            {
                                blank_all(i);
                            }
                        }
                        else if (c == '/' && at(i + 1) == '*')
                        {
                            const auto end = content.find("*/", i + 2);
                            const auto stop = (end == std::string_view::npos) ? size : end + 2;
                            for (; i < stop; ++i)
                            {
                                blank_all(i);
                            }
                            --i;
                        }
                        break;
                    case Lexical::string:
                        if (c == '\\')
                        {
                            blank_code(i);
                            blank_code(++i);
                        }
                        else if (c == '"')
                        {
                            state = Lexical::code;
                        }
                        else
                        {
                            blank_code(i);
                        }
                        break;
                    case Lexical::indented_string:
                        if (c == '\'' && at(i + 1) == '\'')
                        {
                            const auto escaped = indented_escape_length(content.substr(i));
                            if (escaped == 0)
                            {
                                state = Lexical::code;
                                ++i;
                            }
                            else
                            {
                                for (std::size_t k = 0; k < escaped; ++k)
                                {
                                    blank_code(i + k);
                                }
                                i += escaped - 1;
                            }
                        }
                        else
                        {
                            blank_code(i);
                        }
                        break;
                }
            }
            return out;
        }

        class Cursor
        {
        public:

            explicit Cursor(std::string_view text, std::size_t pos = 0)
                : m_text(text)
                , m_pos(pos)
            {
            }

            void skip_whitespace()
            {
                while (m_pos < m_text.size() && std::isspace(static_cast<unsigned char>(m_text[m_pos])))
                {
                    ++m_pos;
                }
            }

            auto consume(std::string_view token) -> bool
            {
                skip_whitespace();
                if (util::starts_with(m_text.substr(m_pos), token))
                {
                    m_pos += token.size();
                    return true;
                }
                return false;
            }

            // Like ``consume``, the keyword must not continue as an identifier.
            auto consume_keyword(std::string_view keyword) -> bool
            {
                skip_whitespace();
                const auto rest = m_text.substr(m_pos);
                if (util::starts_with(rest, keyword)
                    && (rest.size() == keyword.size() || !is_identifier_char(rest[keyword.size()])))
                {
                    m_pos += keyword.size();
                    return true;
                }
                return false;
            }

            auto peek(std::size_t offset = 0) const -> char
            {
                return m_pos + offset < m_text.size() ? m_text[m_pos + offset] : '\0';
            }

            auto at_end() const -> bool
            {
                return m_pos >= m_text.size();
            }

            // A word, a string literal, or a balanced parenthesized expression
            auto read_element() -> std::optional<std::string>
            {
                skip_whitespace();
                const auto start = m_pos;
                if (peek() == '\'' && peek(1) == '\'')
                {
                    m_pos += 2;
                    while (true)
                    {
                        if (at_end())
                        {
                            return std::nullopt;
                        }
                        if (peek() == '\'' && peek(1) == '\'')
                        {
                            const auto escaped = indented_escape_length(m_text.substr(m_pos));
                            if (escaped == 0)
                            {
                                m_pos += 2;
                                break;
                            }
                            m_pos += escaped;
                        }
                        else
                        {
                            ++m_pos;
                        }
                    }
                }
                else if (peek() == '"')
                {
                    ++m_pos;
                    while (!at_end() && peek() != '"')
                    {
                        m_pos += (peek() == '\\') ? 2 : 1;
                    }
                    if (at_end())
                    {
                        return std::nullopt;
                    }
                    ++m_pos;
                }
                else if (peek() == '(')
                {
                    int depth = 0;
                    do
                    {
                        if (peek() == '(')
                        {
                            ++depth;
                        }
                        else if (peek() == ')')
                        {
                            --depth;
                        }
                        ++m_pos;
                    } while (!at_end() && depth > 0);
                    if (depth != 0)
                    {
                        return std::nullopt;
                    }
                }
                else
                {
                    while (!at_end() && !std::isspace(static_cast<unsigned char>(peek()))
                           && peek() != ']' && peek() != '[' && peek() != '(')
                    {
                        ++m_pos;
                    }
                }
                if (m_pos == start)
                {
                    return std::nullopt;
                }
                return std::string(m_text.substr(start, m_pos - start));
            }

            auto read_identifier() -> std::string
            {
                skip_whitespace();
                const auto start = m_pos;
                while (!at_end() && is_identifier_char(peek()))
                {
                    ++m_pos;
                }
                return std::string(m_text.substr(start, m_pos - start));
            }

        private:

            std::string_view m_text;
            std::size_t m_pos;
        };

        // Offset just after ``<key> =``, for the first definition of the key.
        auto find_definition(std::string_view text, std::string_view key) -> std::optional<std::size_t>
        {
            std::size_t pos = text.find(key);
            while (pos != std::string_view::npos)
            {
                const bool starts_word = pos == 0 || !is_identifier_char(text[pos - 1]);
                const auto after = pos + key.size();
                const bool ends_word = after >= text.size() || !is_identifier_char(text[after]);
                if (starts_word && ends_word)
                {
                    auto cursor = Cursor(text, after);
                    if (cursor.consume("=") && cursor.peek() != '=')
                    {
                        return after + text.substr(after).find('=') + 1;
                    }
                }
                pos = text.find(key, pos + 1);
            }
            return std::nullopt;
        }
    }

    /*********************
     * DeclarationReader *
     *********************/

    auto DeclarationReader::read(std::string_view content, std::string_view key)
        -> expected_t<std::vector<std::string>>
    {
        return read_impl(content, key);
    }

    /*****************
     * NixListReader *
     *****************/

    auto NixListReader::read_impl(std::string_view content, std::string_view key)
        -> expected_t<std::vector<std::string>>
    {
        const auto source = scan_source(content);
        const auto definition = find_definition(source.code, key);
        if (!definition)
        {
            return make_unexpected(
                fmt::format(R"(No definition of "{}")", key),
                nixdata_error_code::config_read_failed
            );
        }

        auto cursor = Cursor(source.text, *definition);
        while (cursor.consume_keyword("with"))
        {
            if (cursor.read_identifier().empty() || !cursor.consume(";"))
            {
                return make_unexpected(
                    fmt::format(R"(Malformed "with" expression in "{}")", key),
                    nixdata_error_code::config_read_failed
                );
            }
        }
        if (!cursor.consume("["))
        {
            return make_unexpected(
                fmt::format(R"(Value of "{}" is not a list)", key),
                nixdata_error_code::config_read_failed
            );
        }

        std::vector<std::string> values;
        while (true)
        {
            cursor.skip_whitespace();
            if (cursor.consume("]"))
            {
                break;
            }
            auto element = cursor.at_end() ? std::nullopt : cursor.read_element();
            if (!element)
            {
                return make_unexpected(
                    fmt::format(R"(Unterminated list for "{}")", key),
                    nixdata_error_code::config_read_failed
                );
            }
            values.push_back(std::move(element).value());
        }
        return { std::move(values) };
    }

    /**********************
     * AttributeCollector *
     **********************/

    AttributeCollector::AttributeCollector(DeclarationReader& reader, std::string key)
        : m_reader(reader)
        , m_key(std::move(key))
    {
    }

    auto AttributeCollector::collect(const std::vector<fs::path>& sources) const
        -> DeclaredPackageSet
    {
        DeclaredPackageSet packages;
        for (const auto& source : sources)
        {
            std::string content;
            try
            {
                content = read_contents(source);
            }
            catch (const std::system_error& e)
            {
                LOG_DEBUG << "Skipping unreadable declaration source " << source << ": " << e.what();
                continue;
            }

            auto values = m_reader.read(content, m_key);
            if (!values)
            {
                LOG_DEBUG << "Skipping declaration source " << source << ": "
                          << values.error().what();
                continue;
            }
            packages.insert(values->begin(), values->end());
        }
        LOG_DEBUG << "Collected " << packages.size() << " declared packages from "
                  << sources.size() << " sources";
        return packages;
    }
}
