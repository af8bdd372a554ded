//
// Created by gregorian-rayne on 10/19/26.
//

#ifndef GITMINE_REPOSITORY_STRUCTURE_HPP
#define GITMINE_REPOSITORY_STRUCTURE_HPP

/**
 * @file repository_structure.hpp
 * @brief Shallow directory overview of a working copy.
 *
 * One pre-order traversal, children visited in name order. Each visited
 * directory yields {relative_path, file_count} where file_count counts the
 * non-directory entries directly inside it. The version-control metadata
 * directory is skipped, symlinked directories are not followed.
 */

#include "gitmine/error.hpp"
#include "gitmine/result.hpp"
#include "gitmine/types.hpp"

#include <cstddef>
#include <string>

namespace gitmine::structure
{
    struct StructureLimits {
        std::size_t max_depth = 2;          // Path segments below the root
        std::size_t max_entries = 10;
        std::string excluded_dir = ".git";
    };

    /**
     * Takes the snapshot.
     *
     * @return The entries, root first, or NotFound / InvalidArgument when
     *         root is missing or not a directory.
     */
    [[nodiscard]] Result<RepositoryStructure, Error> snapshot(
        const fs::path& root,
        const StructureLimits& limits = {}
    );

}  // namespace gitmine::structure

#endif //GITMINE_REPOSITORY_STRUCTURE_HPP
