/**********************************************************************
File name: error.hpp
This file is part of: userspacefs

LICENSE

This program is free software: you can redistribute it and/or modify it
under the terms of the GNU General Public License as published by the
Free Software Foundation, either version 3 of the License, or (at your
option) any later version.

This program is distributed in the hope that it will be useful, but
WITHOUT ANY WARRANTY; without even the implied warranty of
MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the GNU
General Public License for more details.

You should have received a copy of the GNU General Public License along
with this program.  If not, see <http://www.gnu.org/licenses/>.

FEEDBACK & QUESTIONS

For feedback and questions about userspacefs please e-mail one of the
authors named in the AUTHORS file.
**********************************************************************/
#ifndef USERSPACEFS_ERROR_H
#define USERSPACEFS_ERROR_H

#include <optional>
#include <ostream>
#include <type_traits>
#include <utility>

namespace Userspacefs {

/**
 * Closed error taxonomy shared by backends, the dispatcher and the codecs.
 *
 * The last two kinds are only produced by codecs and are never returned by
 * a backend.
 */
enum class Errc {
    NONE = 0,
    NOT_FOUND,
    NOT_A_DIRECTORY,
    IS_A_DIRECTORY,
    EXISTS,
    NOT_EMPTY,
    PERMISSION_DENIED,
    NO_SPACE,
    TOO_MANY_OPEN_FILES,
    STALE_HANDLE,
    INVALID_ARGUMENT,
    NOT_SUPPORTED,
    IO_ERROR,
    WOULD_BLOCK,
    CANCELLED,
    MALFORMED_REQUEST,
    UNKNOWN_OPERATION,
};

inline constexpr Errc ALL_ERRORS[] = {
    Errc::NOT_FOUND,
    Errc::NOT_A_DIRECTORY,
    Errc::IS_A_DIRECTORY,
    Errc::EXISTS,
    Errc::NOT_EMPTY,
    Errc::PERMISSION_DENIED,
    Errc::NO_SPACE,
    Errc::TOO_MANY_OPEN_FILES,
    Errc::STALE_HANDLE,
    Errc::INVALID_ARGUMENT,
    Errc::NOT_SUPPORTED,
    Errc::IO_ERROR,
    Errc::WOULD_BLOCK,
    Errc::CANCELLED,
    Errc::MALFORMED_REQUEST,
    Errc::UNKNOWN_OPERATION,
};

const char *errc_name(Errc err);

std::ostream &operator<<(std::ostream &stream, Errc err);

enum failed_t {
    FAILED = 0,
};

struct ErrorResultHelper {
    Errc error;
};

template <typename T>
struct Result {
public:
    template<typename U, typename _ = typename std::enable_if<std::is_convertible<U, T>::value>::type>
    Result(U &&value):
        m_value(std::forward<U>(value)),
        m_error(Errc::NONE)
    {

    }

    Result(failed_t, Errc err):
        m_value(),
        m_error(err)
    {

    }

    Result(ErrorResultHelper &&helper):
        Result(FAILED, helper.error)
    {

    }

    Result(const Result &ref) = default;
    Result(Result &&src) noexcept = default;
    Result &operator=(const Result &ref) = default;
    Result &operator=(Result &&src) noexcept = default;

    ~Result() = default;

private:
    std::optional<T> m_value;
    Errc m_error;

public:
    inline explicit operator bool() const {
        return m_value.has_value();
    }

    [[nodiscard]] inline Errc error() const {
        return m_error;
    }

    inline T &operator*() {
        return m_value.value();
    }

    inline const T &operator*() const {
        return m_value.value();
    }

    inline T *operator->() {
        return &m_value.value();
    }

    inline const T *operator->() const {
        return &m_value.value();
    }

};

template<>
struct Result<void> {
public:
    Result():
        m_ok(true),
        m_error(Errc::NONE)
    {

    }

    Result(const Result &src) = default;
    Result(Result &&src) = default;
    Result &operator=(const Result &src) = default;
    Result &operator=(Result &&src) = default;

    Result(ErrorResultHelper &&helper):
        m_ok(false),
        m_error(helper.error)
    {

    }

    Result(failed_t, Errc err):
        m_ok(false),
        m_error(err)
    {

    }

private:
    bool m_ok;
    Errc m_error;

public:
    inline explicit operator bool() const {
        return m_ok;
    }

    [[nodiscard]] inline Errc error() const {
        return m_error;
    }

};


template<typename T>
[[nodiscard]] inline Result<typename std::remove_reference<T>::type> make_result(T &&value)
{
    return Result<typename std::remove_reference<T>::type>(std::forward<T>(value));
}

[[nodiscard]] inline ErrorResultHelper make_result(failed_t, Errc err)
{
    return ErrorResultHelper{err};
}

template<typename T>
[[nodiscard]] inline ErrorResultHelper copy_error(const Result<T> &result)
{
    return ErrorResultHelper{result.error()};
}

[[nodiscard]] inline Result<void> make_result()
{
    return Result<void>();
}


}

#endif
