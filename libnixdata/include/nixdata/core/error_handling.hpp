// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef NIXDATA_CORE_ERROR_HANDLING_HPP
#define NIXDATA_CORE_ERROR_HANDLING_HPP

#include <stdexcept>
#include <string>
#include <utility>

#include <tl/expected.hpp>

namespace nixdata
{

    /**********************
     * nixdata exceptions *
     **********************/

    enum class nixdata_error_code
    {
        unknown,
        resolve_failed,
        fetch_failed,
        decode_failed,
        store_failed,
        subprocess_failed,
        config_read_failed,
        cache_locked,
        configuration_invalid
    };

    [[nodiscard]] auto to_string(nixdata_error_code ec) -> const char*;

    class nixdata_error : public std::runtime_error
    {
    public:

        using base_type = std::runtime_error;

        nixdata_error(const std::string& msg, nixdata_error_code ec);
        nixdata_error(const char* msg, nixdata_error_code ec);

        nixdata_error_code error_code() const noexcept;

    private:

        nixdata_error_code m_error_code;
    };

    template <class T, class E = nixdata_error>
    using expected_t = tl::expected<T, E>;

    /********************
     * helper functions *
     ********************/

    tl::unexpected<nixdata_error> make_unexpected(const char* msg, nixdata_error_code ec);

    tl::unexpected<nixdata_error> make_unexpected(const std::string& msg, nixdata_error_code ec);

    template <class T, class E>
    tl::unexpected<E> forward_error(const tl::expected<T, E>& exp);

    template <class T, class E>
    T& extract(tl::expected<T, E>& exp);

    template <class T, class E>
    const T& extract(const tl::expected<T, E>& exp);

    template <class T, class E>
    T&& extract(tl::expected<T, E>&& exp);

    /*********************************
     * helper functions implentation *
     *********************************/

    template <class T, class E>
    tl::unexpected<E> forward_error(const tl::expected<T, E>& exp)
    {
        return tl::make_unexpected(exp.error());
    }

    namespace detail
    {
        template <class T>
        decltype(auto) extract_impl(T&& exp)
        {
            if (exp)
            {
                return std::forward<T>(exp).value();
            }
            else
            {
                throw exp.error();
            }
        }
    }

    template <class T, class E>
    T& extract(tl::expected<T, E>& exp)
    {
        return detail::extract_impl(exp);
    }

    template <class T, class E>
    const T& extract(const tl::expected<T, E>& exp)
    {
        return detail::extract_impl(exp);
    }

    template <class T, class E>
    T&& extract(tl::expected<T, E>&& exp)
    {
        return detail::extract_impl(std::move(exp));
    }
}

#endif
