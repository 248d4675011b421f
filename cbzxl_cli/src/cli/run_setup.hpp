#ifndef CBZXL_RUN_SETUP_HPP
#define CBZXL_RUN_SETUP_HPP

#include "cli_parser.hpp"
#include <functional>

/**
 * @brief Checks the external tools, then applies --reset-db.
 *
 * The databases are deleted only once every tool is known to be present,
 * so a missing encoder never costs the user their records.
 *
 * @param verify_tools Throws cbzxl::ToolMissingError when something is missing.
 * @return false when the run must not start (exit code 1).
 */
bool prepare_run(const Settings& settings, const std::function<void()>& verify_tools);

#endif // CBZXL_RUN_SETUP_HPP
