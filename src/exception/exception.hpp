/*
 * exception.hpp
 *
 * Copyright (C) 2025 Frostguard Authors
 */

/*************************************************

Date: 2025-2-18

Description: Frost risk engine exceptions

**************************************************/

#ifndef FROSTGUARD_EXCEPTION_EXCEPTION_HPP
#define FROSTGUARD_EXCEPTION_EXCEPTION_HPP

#include <cstdint>
#include <string_view>

#include "atom/error/exception.hpp"

namespace frostguard {

/**
 * @brief Failure reasons visible at the request boundary.
 */
enum class ErrorKind : uint8_t {
    InsufficientData,
    OutOfDomain,
    UnknownStageParameters,
    UpstreamUnavailable,
    UpstreamTimeout,
    InvalidDate,
    BadConfig
};

/**
 * @brief Stable identifier of an error kind, used in serialized errors.
 */
[[nodiscard]] constexpr auto errorKindName(ErrorKind kind) noexcept
    -> std::string_view {
    switch (kind) {
        case ErrorKind::InsufficientData:
            return "InsufficientData";
        case ErrorKind::OutOfDomain:
            return "OutOfDomain";
        case ErrorKind::UnknownStageParameters:
            return "UnknownStageParameters";
        case ErrorKind::UpstreamUnavailable:
            return "UpstreamUnavailable";
        case ErrorKind::UpstreamTimeout:
            return "UpstreamTimeout";
        case ErrorKind::InvalidDate:
            return "InvalidDate";
        case ErrorKind::BadConfig:
            return "BadConfig";
    }
    return "Unknown";
}

/**
 * @brief HTTP-like status an API layer should answer with for each kind.
 */
[[nodiscard]] constexpr auto errorKindStatus(ErrorKind kind) noexcept -> int {
    switch (kind) {
        case ErrorKind::InsufficientData:
            return 404;
        case ErrorKind::OutOfDomain:
            return 422;
        case ErrorKind::UnknownStageParameters:
            return 400;
        case ErrorKind::UpstreamUnavailable:
            return 502;
        case ErrorKind::UpstreamTimeout:
            return 504;
        case ErrorKind::InvalidDate:
            return 400;
        case ErrorKind::BadConfig:
            return 500;
    }
    return 500;
}

// ============================================================================
// Engine Exceptions
// ============================================================================

/**
 * @brief Base class of every recoverable engine failure.
 */
class FrostError : public atom::error::Exception {
public:
    using atom::error::Exception::Exception;

    [[nodiscard]] virtual auto kind() const noexcept -> ErrorKind = 0;
};

/**
 * @brief Too few valid hourly records to assess a station-day.
 */
class InsufficientData : public FrostError {
public:
    using FrostError::FrostError;

    [[nodiscard]] auto kind() const noexcept -> ErrorKind override {
        return ErrorKind::InsufficientData;
    }
};

/**
 * @brief Inputs outside the validated range of a physical formula.
 */
class OutOfDomain : public FrostError {
public:
    using FrostError::FrostError;

    [[nodiscard]] auto kind() const noexcept -> ErrorKind override {
        return ErrorKind::OutOfDomain;
    }
};

/**
 * @brief No damage-curve parameters for a crop/variety/stage combination.
 */
class UnknownStageParameters : public FrostError {
public:
    using FrostError::FrostError;

    [[nodiscard]] auto kind() const noexcept -> ErrorKind override {
        return ErrorKind::UnknownStageParameters;
    }
};

/**
 * @brief The weather source failed to deliver observations.
 */
class UpstreamUnavailable : public FrostError {
public:
    using FrostError::FrostError;

    [[nodiscard]] auto kind() const noexcept -> ErrorKind override {
        return ErrorKind::UpstreamUnavailable;
    }
};

/**
 * @brief A fetch or computation exceeded its time budget.
 */
class UpstreamTimeout : public FrostError {
public:
    using FrostError::FrostError;

    [[nodiscard]] auto kind() const noexcept -> ErrorKind override {
        return ErrorKind::UpstreamTimeout;
    }
};

/**
 * @brief Malformed date, or a date after the processing date.
 */
class InvalidDate : public FrostError {
public:
    using FrostError::FrostError;

    [[nodiscard]] auto kind() const noexcept -> ErrorKind override {
        return ErrorKind::InvalidDate;
    }
};

/**
 * @brief Configuration value missing its required shape.
 */
class BadConfigException : public FrostError {
public:
    using FrostError::FrostError;

    [[nodiscard]] auto kind() const noexcept -> ErrorKind override {
        return ErrorKind::BadConfig;
    }
};

// ============================================================================
// Convenience Macros
// ============================================================================

#define THROW_INSUFFICIENT_DATA(...)                                    \
    throw frostguard::InsufficientData(ATOM_FILE_NAME, ATOM_FILE_LINE, \
                                       ATOM_FUNC_NAME, __VA_ARGS__)

#define THROW_OUT_OF_DOMAIN(...)                                   \
    throw frostguard::OutOfDomain(ATOM_FILE_NAME, ATOM_FILE_LINE, \
                                  ATOM_FUNC_NAME, __VA_ARGS__)

#define THROW_UNKNOWN_STAGE_PARAMETERS(...)                       \
    throw frostguard::UnknownStageParameters(                     \
        ATOM_FILE_NAME, ATOM_FILE_LINE, ATOM_FUNC_NAME, __VA_ARGS__)

#define THROW_UPSTREAM_UNAVAILABLE(...)                                    \
    throw frostguard::UpstreamUnavailable(ATOM_FILE_NAME, ATOM_FILE_LINE, \
                                          ATOM_FUNC_NAME, __VA_ARGS__)

#define THROW_UPSTREAM_TIMEOUT(...)                                    \
    throw frostguard::UpstreamTimeout(ATOM_FILE_NAME, ATOM_FILE_LINE, \
                                      ATOM_FUNC_NAME, __VA_ARGS__)

#define THROW_INVALID_DATE(...)                                    \
    throw frostguard::InvalidDate(ATOM_FILE_NAME, ATOM_FILE_LINE, \
                                  ATOM_FUNC_NAME, __VA_ARGS__)

#define THROW_BAD_CONFIG_EXCEPTION(...)                                   \
    throw frostguard::BadConfigException(ATOM_FILE_NAME, ATOM_FILE_LINE, \
                                         ATOM_FUNC_NAME, __VA_ARGS__)

}  // namespace frostguard

#endif  // FROSTGUARD_EXCEPTION_EXCEPTION_HPP
