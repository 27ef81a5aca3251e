#pragma once

#include <stdexcept>
#include <string>

namespace floodmap {

class FloodmapError : public std::runtime_error {
public:
    explicit FloodmapError(const std::string& message)
        : std::runtime_error(message) {}
};

class ConfigError : public FloodmapError {
public:
    explicit ConfigError(const std::string& message)
        : FloodmapError("Config error: " + message) {}
};

class ValidationError : public FloodmapError {
public:
    explicit ValidationError(const std::string& message)
        : FloodmapError("Validation error: " + message) {}
};

class IOError : public FloodmapError {
public:
    explicit IOError(const std::string& message)
        : FloodmapError("I/O error: " + message) {}
};

class FitsError : public IOError {
public:
    explicit FitsError(const std::string& message)
        : IOError("FITS error: " + message) {}
};

class GeoJsonError : public IOError {
public:
    explicit GeoJsonError(const std::string& message)
        : IOError("GeoJSON error: " + message) {}
};

// Input rasters disagree on resolution or reference system.
class RasterMismatchError : public FloodmapError {
public:
    explicit RasterMismatchError(const std::string& message)
        : FloodmapError("Raster mismatch: " + message) {}
};

// The validity footprint leaves no room for a tile grid.
class InvalidFootprint : public FloodmapError {
public:
    explicit InvalidFootprint(const std::string& message)
        : FloodmapError("Invalid footprint: " + message) {}
};

class ClassifierError : public FloodmapError {
public:
    explicit ClassifierError(const std::string& message)
        : FloodmapError("Classifier error: " + message) {}
};

} // namespace floodmap
