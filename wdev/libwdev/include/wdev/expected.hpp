/**
 * Copyright (c) 2026 The wireless-dev Authors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file expected.hpp
 * @brief Expected<T> is either a T or the ::wdev_status preventing T to be created.
 *
 * Typical use is a static factory that validates its input before constructing:
 *
 * class Endpoint {
 * public:
 *     static Expected<Endpoint> create(const std::string &address)
 *     {
 *         if (address.empty()) {
 *             return make_unexpected(WDEV_INVALID_ARGUMENT);
 *         }
 *         return Endpoint(address);
 *     }
 * private:
 *     explicit Endpoint(const std::string &address);
 * };
 *
 * Callers check the result with operator bool (or the TRY macro in common/utils.hpp):
 *
 *     auto endpoint = Endpoint::create("10.0.0.7:5555");
 *     if (!endpoint) {
 *         return endpoint.status();
 *     }
 **/

#ifndef _WDEV_EXPECTED_HPP_
#define _WDEV_EXPECTED_HPP_

#include "wdev/wdev.h"

#include <assert.h>
#include <utility>
#include <type_traits>
#include <functional>
#include <stdexcept>
#include <sstream>

/** wdev namespace */
namespace wdev
{

/*! wdev_error is thrown only by Expected<T>::expect(), for callers that prefer exceptions */
class wdev_error : public std::runtime_error
{
public:
    template<typename... Args>
    wdev_error(wdev_status status, Args&&... args) :
        std::runtime_error(std::forward<Args>(args)...), m_status(status)
    {}

    wdev_status status() const {
        return m_status;
    }

private:
    wdev_status m_status;
};

/*! Unexpected is an object containing ::wdev_status error, used when an unexpected outcome occurred. */
class Unexpected final
{
public:
    explicit Unexpected(wdev_status status) :
        m_status(status)
    {}

    operator wdev_status() { return m_status; }

    wdev_status m_status;
};

inline Unexpected make_unexpected(wdev_status status)
{
    return Unexpected(status);
}

template<typename T>
class Expected final
{
public:
    template<class U>
    friend class Expected;

    Expected(Unexpected unexpected) :
        m_status(unexpected.m_status)
    {
        assert(unexpected.m_status != WDEV_SUCCESS);
    }

    explicit Expected(const Expected<T> &other) :
        m_status(other.m_status)
    {
        if (other.has_value()) {
            construct(&m_value, other.m_value);
        }
    }

    // Implicit upcasting (e.g. Expected<std::unique_ptr<Derived>> to Expected<std::unique_ptr<Base>>)
    template <typename U>
    Expected(Expected<U> &&other) :
        m_status(other.m_status)
    {
        if (other.has_value()) {
            construct(&m_value, std::move(other.m_value));
        }
    }

    Expected(Expected<T> &&other) :
        m_status(other.m_status)
    {
        if (other.has_value()) {
            construct(&m_value, std::move(other.m_value));
        }
    }

    Expected(T &&value) :
        m_value(std::move(value)),
        m_status(WDEV_SUCCESS)
    {}

    // Returning a bare wdev_status instead of make_unexpected() is a bug, reject it at compile time
    Expected(wdev_status status) = delete;

    template <typename... Args, std::enable_if_t<std::is_constructible<T, Args...>::value, int> = 0>
    explicit Expected(Args &&...args) :
        m_value(std::forward<Args>(args)...),
        m_status(WDEV_SUCCESS)
    {}

    Expected<T>& operator=(const Expected<T> &other) = delete;
    Expected<T>& operator=(Expected<T> &&other) noexcept = delete;
    Expected<T>& operator=(const T &other) = delete;
    Expected<T>& operator=(T &&other) noexcept = delete;
    Expected<T>& operator=(wdev_status status) = delete;

    ~Expected()
    {
        if (has_value()) {
            m_status = WDEV_UNINITIALIZED;
            m_value.~T();
        }
    }

    void make_unexpected(wdev_status status)
    {
        assert(status != WDEV_SUCCESS);
        if (has_value()) {
            m_value.~T();
        }
        m_status = status;
    }

    bool has_value() const
    {
        return (WDEV_SUCCESS == m_status);
    }

    T& value() &
    {
        assert(has_value());
        return m_value;
    }

    const T& value() const&
    {
        assert(has_value());
        return m_value;
    }

    wdev_status status() const
    {
        return m_status;
    }

    /**
     * Returns the stored value and leaves this object Unexpected.
     * @note Must only be called when has_value() is true.
     */
    T release()
    {
        assert(has_value());
        T tmp = std::move(m_value);
        make_unexpected(WDEV_UNINITIALIZED);
        return tmp;
    }

    T expect(const std::string &msg) &&
    {
        if (!has_value()) {
            std::stringstream ss;
            ss << "Expected::expect() failed with status=" << static_cast<int>(status()) << ". " << msg;
            throw wdev_error(status(), ss.str());
        }
        return release();
    }

    T* operator->()
    {
        assert(has_value());
        return &(value());
    }

    const T* operator->() const
    {
        assert(has_value());
        return &(value());
    }

    T& operator*() &
    {
        assert(has_value());
        return value();
    }

    const T& operator*() const&
    {
        assert(has_value());
        return value();
    }

    explicit operator bool() const
    {
        return has_value();
    }

private:
    template<typename... Args>
    static void construct(T *value, Args &&...args)
    {
        new ((void*)value) T(std::forward<Args>(args)...);
    }

    union {
        T m_value;
    };
    wdev_status m_status;
};

} /* namespace wdev */

#endif  // _WDEV_EXPECTED_HPP_
