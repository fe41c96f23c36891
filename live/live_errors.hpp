#ifndef CHATLIVE_LIVE_ERRORS_HPP
#define CHATLIVE_LIVE_ERRORS_HPP

/******************************************************************************
 *
 * @file       live_errors.hpp
 * @brief      Exceptions raised by the token exchange and the presence registry
 *
 *****************************************************************************/

#include <stdexcept>
#include <string>

namespace chatlive::live {

/**
 * @brief Token is malformed, unknown, expired or already redeemed
 */
class InvalidToken : public std::runtime_error {
public:
    explicit InvalidToken(const std::string& what) : std::runtime_error(what) {}
};

/**
 * @brief The handle lost its online entry or its liveness record.
 *        The transport must drop the connection and rejoin.
 */
class PingTimeoutException : public std::runtime_error {
public:
    explicit PingTimeoutException(const std::string& what) : std::runtime_error(what) {}
};

}  // namespace chatlive::live

#endif  // CHATLIVE_LIVE_ERRORS_HPP
