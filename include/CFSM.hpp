#ifndef CFSM_HPP
#define CFSM_HPP

#include <stdexcept>
#include <string>

namespace CFSM {

// Forward declarations
class FaultModel;
class DislocationSolver;
class CatalogSource;
class Visualizer;
class StressTransferModel;
struct ModelResult;
struct RunConfig;

// Unit conversions
constexpr double KM2M = 1e3;    // Kilometers to meters

/**
 * @brief Invalid or out-of-range run configuration
 *
 * Raised before any computation begins.
 */
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& what)
        : std::runtime_error(what) {}
};

/**
 * @brief Structural error in a rupture description
 *
 * Inconsistent row lengths, missing mandatory geometry, malformed data lines.
 */
class RuptureParseError : public std::runtime_error {
public:
    explicit RuptureParseError(const std::string& what)
        : std::runtime_error(what) {}
};

} // namespace CFSM

#endif // CFSM_HPP
