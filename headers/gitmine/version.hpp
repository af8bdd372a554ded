//
// Created by gregorian-rayne on 10/19/26.
//

#ifndef GITMINE_VERSION_HPP
#define GITMINE_VERSION_HPP

/**
 * @file version.hpp
 * @brief gitmine version information.
 */

namespace gitmine {

    constexpr int VERSION_MAJOR = 0;
    constexpr int VERSION_MINOR = 3;
    constexpr int VERSION_PATCH = 0;

    /**
     * Full version string in "major.minor.patch" format.
     */
    constexpr auto VERSION_STRING = "0.3.0";

    constexpr auto PROJECT_NAME = "Repository History Miner";

    /**
     * Executable name, also used as the config and environment prefix.
     */
    constexpr auto PROJECT_SHORT_NAME = "gitmine";

}  // namespace gitmine

#endif //GITMINE_VERSION_HPP
