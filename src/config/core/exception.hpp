/*
 * exception.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-6-4

Description: Configuration Exception Types

**************************************************/

#ifndef TEARDOWN_CONFIG_CORE_EXCEPTION_HPP
#define TEARDOWN_CONFIG_CORE_EXCEPTION_HPP

#include "atom/error/exception.hpp"

namespace teardown::config {

/**
 * @brief Base exception for configuration errors, also raised for documents
 * that are not valid JSON
 */
class BadConfigException : public atom::error::Exception {
    using atom::error::Exception::Exception;
};

#define THROW_BAD_CONFIG_EXCEPTION(...)                                        \
    throw teardown::config::BadConfigException(ATOM_FILE_NAME, ATOM_FILE_LINE, \
                                               ATOM_FUNC_NAME, __VA_ARGS__)

/**
 * @brief Exception for invalid configuration values
 */
class InvalidConfigException : public BadConfigException {
    using BadConfigException::BadConfigException;
};

#define THROW_INVALID_CONFIG_EXCEPTION(...)         \
    throw teardown::config::InvalidConfigException( \
        ATOM_FILE_NAME, ATOM_FILE_LINE, ATOM_FUNC_NAME, __VA_ARGS__)

/**
 * @brief Exception for configuration file I/O errors
 */
class ConfigIOException : public BadConfigException {
    using BadConfigException::BadConfigException;
};

#define THROW_CONFIG_IO_EXCEPTION(...)                                        \
    throw teardown::config::ConfigIOException(ATOM_FILE_NAME, ATOM_FILE_LINE, \
                                              ATOM_FUNC_NAME, __VA_ARGS__)

using ConfigError = BadConfigException;

}  // namespace teardown::config

#endif  // TEARDOWN_CONFIG_CORE_EXCEPTION_HPP
