#pragma once

#include <stdexcept>
#include <string>

/**
 * @brief Raised when a raster that needs an affine transform does not have one
 */
class MissingTransformError : public std::invalid_argument {
public:
    explicit MissingTransformError(const std::string& message)
        : std::invalid_argument(message) {}
};

/**
 * @brief Raised when a unit conversion needs a CRS and the raster has none
 */
class MissingCRSError : public std::invalid_argument {
public:
    explicit MissingCRSError(const std::string& message)
        : std::invalid_argument(message) {}
};

/**
 * @brief Raised when a raster does not match the shape, transform or CRS of the flow raster
 */
class RasterMetadataError : public std::invalid_argument {
public:
    explicit RasterMetadataError(const std::string& message)
        : std::invalid_argument(message) {}
};

/**
 * @brief Raised when the basin raster cannot be allocated
 */
class BasinMemoryError : public std::runtime_error {
public:
    explicit BasinMemoryError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Raised when a catchment basin cannot be delineated from an outlet
 */
class CatchmentError : public std::runtime_error {
public:
    explicit CatchmentError(const std::string& message)
        : std::runtime_error(message) {}
};
