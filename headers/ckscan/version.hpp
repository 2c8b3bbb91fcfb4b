#ifndef CKSCAN_VERSION_HPP
#define CKSCAN_VERSION_HPP

/**
 * @file version.hpp
 * @brief ckscan version information.
 */

namespace ckscan {

    /**
     * Major version number.
     * Incremented for breaking API or report format changes.
     */
    constexpr int VERSION_MAJOR = 0;

    constexpr int VERSION_MINOR = 4;

    constexpr int VERSION_PATCH = 1;

    /**
     * Full version string in "major.minor.patch" format.
     */
    constexpr auto VERSION_STRING = "0.4.1";

    /**
     * Version of the JSON report layout written by the exporters.
     */
    constexpr int REPORT_SCHEMA_VERSION = 1;

    constexpr auto PROJECT_NAME = "CK Cohesion Scanner";

    /**
     * Short project name for CLI usage.
     */
    constexpr auto PROJECT_SHORT_NAME = "ckscan";

}  // namespace ckscan

#endif //CKSCAN_VERSION_HPP
