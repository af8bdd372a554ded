//
// Created by gregorian-rayne on 10/19/26.
//

#include "gitmine/structure/repository_structure.hpp"

#include <algorithm>
#include <ranges>
#include <vector>

namespace gitmine::structure
{
    namespace {

        struct PendingDir {
            fs::path path;
            std::size_t depth;
        };

        struct DirListing {
            std::size_t file_count = 0;
            std::vector<fs::path> subdirs;
        };

        DirListing list_directory(const fs::path& dir, const std::string& excluded) {
            DirListing listing;

            std::error_code ec;
            fs::directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec);
            if (ec) {
                return listing;
            }

            for (; it != fs::directory_iterator(); it.increment(ec)) {
                if (ec) {
                    break;
                }
                const auto status = it->symlink_status(ec);
                if (ec) {
                    ec.clear();
                    continue;
                }
                if (fs::is_directory(status)) {
                    if (it->path().filename() != excluded) {
                        listing.subdirs.push_back(it->path());
                    }
                } else {
                    ++listing.file_count;
                }
            }

            std::ranges::sort(listing.subdirs);
            return listing;
        }

    }  // namespace

    Result<RepositoryStructure, Error> snapshot(const fs::path& root, const StructureLimits& limits) {
        std::error_code ec;
        if (!fs::exists(root, ec)) {
            return Result<RepositoryStructure, Error>::failure(
                Error::not_found("Repository path not found", root.string())
            );
        }
        if (!fs::is_directory(root, ec)) {
            return Result<RepositoryStructure, Error>::failure(
                Error::invalid_argument("Repository path is not a directory", root.string())
            );
        }

        RepositoryStructure entries;
        std::vector<PendingDir> stack{{root, 0}};

        while (!stack.empty() && entries.size() < limits.max_entries) {
            auto [dir, depth] = std::move(stack.back());
            stack.pop_back();

            auto listing = list_directory(dir, limits.excluded_dir);

            StructureEntry entry;
            entry.relative_path = depth == 0 ? "." : dir.lexically_relative(root).generic_string();
            entry.file_count = listing.file_count;
            entries.push_back(std::move(entry));

            if (depth + 1 > limits.max_depth) {
                continue;
            }
            // Reverse so the smallest name is popped first.
            for (auto& subdir : listing.subdirs | std::views::reverse) {
                stack.push_back({std::move(subdir), depth + 1});
            }
        }

        return Result<RepositoryStructure, Error>::success(std::move(entries));
    }

}  // namespace gitmine::structure
