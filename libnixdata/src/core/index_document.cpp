// Copyright (c) 2023, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <stdexcept>

#include <fmt/format.h>

#include "nixdata/core/index_document.hpp"
#include "nixdata/core/output.hpp"

namespace nixdata
{
    namespace
    {
        class decode_error : public std::runtime_error
        {
        public:

            using std::runtime_error::runtime_error;
        };

        // A member holding null is the same as a missing member
        auto find_member(const nlohmann::json& obj, const char* key) -> const nlohmann::json*
        {
            const auto it = obj.find(key);
            if (it == obj.end() || it->is_null())
            {
                return nullptr;
            }
            return &(*it);
        }

        auto read_string(const nlohmann::json& obj, const char* key, std::string_view attr)
            -> std::optional<std::string>
        {
            const auto* val = find_member(obj, key);
            if (val == nullptr)
            {
                return std::nullopt;
            }
            if (!val->is_string())
            {
                throw decode_error(fmt::format(
                    R"(Field "{}" of "{}" must be a string, got {})",
                    key,
                    attr,
                    val->type_name()
                ));
            }
            return val->get<std::string>();
        }

        auto require_string(const nlohmann::json& obj, const char* key, std::string_view attr)
            -> std::string
        {
            auto val = read_string(obj, key, attr);
            if (!val)
            {
                throw decode_error(fmt::format(R"(Missing field "{}" in "{}")", key, attr));
            }
            return std::move(val).value();
        }

        auto read_flag(const nlohmann::json& obj, const char* key, std::string_view attr) -> bool
        {
            const auto* val = find_member(obj, key);
            if (val == nullptr)
            {
                return false;
            }
            if (!val->is_boolean())
            {
                throw decode_error(fmt::format(
                    R"(Field "meta.{}" of "{}" must be a boolean, got {})",
                    key,
                    attr,
                    val->type_name()
                ));
            }
            return val->get<bool>();
        }

        auto read_homepage(const nlohmann::json& meta, std::string_view attr)
            -> std::optional<Homepage>
        {
            const auto* val = find_member(meta, "homepage");
            if (val == nullptr)
            {
                return std::nullopt;
            }
            if (val->is_string())
            {
                return Homepage{ val->get<std::string>() };
            }
            if (val->is_array())
            {
                Homepage::List urls;
                urls.reserve(val->size());
                for (const auto& url : *val)
                {
                    if (!url.is_string())
                    {
                        throw decode_error(
                            fmt::format(R"(Field "meta.homepage" of "{}" must only hold strings)", attr)
                        );
                    }
                    urls.push_back(url.get<std::string>());
                }
                return Homepage{ std::move(urls) };
            }
            throw decode_error(fmt::format(
                R"(Field "meta.homepage" of "{}" must be a string or a list, got {})",
                attr,
                val->type_name()
            ));
        }

        auto read_structured(const nlohmann::json& meta, const char* key)
            -> std::optional<nlohmann::json>
        {
            if (const auto* val = find_member(meta, key))
            {
                return *val;
            }
            return std::nullopt;
        }

        auto read_meta(const nlohmann::json& record, std::string_view attr) -> PackageMeta
        {
            PackageMeta meta;
            const auto* obj = find_member(record, "meta");
            if (obj == nullptr)
            {
                return meta;
            }
            if (!obj->is_object())
            {
                throw decode_error(fmt::format(R"(Field "meta" of "{}" must be an object)", attr));
            }

            meta.broken = read_flag(*obj, "broken", attr);
            meta.insecure = read_flag(*obj, "insecure", attr);
            meta.unsupported = read_flag(*obj, "unsupported", attr);
            meta.unfree = read_flag(*obj, "unfree", attr);
            meta.description = read_string(*obj, "description", attr);
            meta.longdescription = read_string(*obj, "longdescription", attr);
            if (!meta.longdescription)
            {
                meta.longdescription = read_string(*obj, "longDescription", attr);
            }
            meta.homepage = read_homepage(*obj, attr);
            meta.position = read_string(*obj, "position", attr);
            meta.maintainers = read_structured(*obj, "maintainers");
            meta.license = read_structured(*obj, "license");
            meta.platforms = read_structured(*obj, "platforms");
            return meta;
        }

        auto read_record(const nlohmann::json& record, std::string_view attr, IndexVariant variant)
            -> PackageRecord
        {
            if (!record.is_object())
            {
                throw decode_error(fmt::format(R"(Record "{}" must be an object)", attr));
            }
            PackageRecord out;
            out.pname = require_string(record, "pname", attr);
            out.version = require_string(record, "version", attr);
            if (variant == IndexVariant::extended)
            {
                out.system = read_string(record, "system", attr);
                out.meta = read_meta(record, attr);
            }
            return out;
        }

        // ``{"version": 2, "packages": {...}}`` wraps the mapping, unless "packages" is
        // itself a package record.
        auto unwrap_packages(const nlohmann::json& root) -> const nlohmann::json&
        {
            const auto it = root.find("packages");
            if (it != root.end() && it->is_object() && !it->contains("pname"))
            {
                return *it;
            }
            return root;
        }
    }

    auto Homepage::resolve() const -> std::string
    {
        if (const auto* single = std::get_if<Single>(&value))
        {
            return *single;
        }
        const auto& list = std::get<List>(value);
        return list.empty() ? std::string() : list.front();
    }

    auto decode_index_document(std::string_view content, IndexVariant variant)
        -> expected_t<IndexDocument>
    {
        if (variant == IndexVariant::raw)
        {
            return make_unexpected(
                "A raw document has no package records",
                nixdata_error_code::decode_failed
            );
        }

        try
        {
            const auto root = nlohmann::json::parse(content);
            if (!root.is_object())
            {
                return make_unexpected(
                    fmt::format("Index document must be an object, got {}", root.type_name()),
                    nixdata_error_code::decode_failed
                );
            }

            IndexDocument doc;
            doc.variant = variant;
            for (const auto& [attr, record] : unwrap_packages(root).items())
            {
                doc.packages.emplace(attr, read_record(record, attr, variant));
            }
            LOG_DEBUG << "Decoded " << doc.packages.size() << " package records";
            return { std::move(doc) };
        }
        catch (const nlohmann::json::exception& e)
        {
            return make_unexpected(
                fmt::format("Malformed index document: {}", e.what()),
                nixdata_error_code::decode_failed
            );
        }
        catch (const decode_error& e)
        {
            return make_unexpected(
                fmt::format("Malformed index document: {}", e.what()),
                nixdata_error_code::decode_failed
            );
        }
    }
}
