/**
 * @file errors.hpp
 * @brief Exception types thrown across component boundaries.
 *
 * Everything else is reported as a plain std::runtime_error, as the rest of
 * the library does; these types exist where a caller must tell failures apart.
 */

#ifndef CBZXL_ERRORS_HPP
#define CBZXL_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace cbzxl {

/// A required external capability (program or libmagic database) is missing. Fatal for the run.
class ToolMissingError final : public std::runtime_error {
public:
    explicit ToolMissingError(const std::string& what) : std::runtime_error(what) {}
};

/// Extraction or repacking of a single archive failed.
class ArchiveError final : public std::runtime_error {
public:
    explicit ArchiveError(const std::string& what) : std::runtime_error(what) {}
};

/// A read or write against one of the persisted record stores failed.
class StateStoreError final : public std::runtime_error {
public:
    explicit StateStoreError(const std::string& what) : std::runtime_error(what) {}
};

} // namespace cbzxl

#endif // CBZXL_ERRORS_HPP
