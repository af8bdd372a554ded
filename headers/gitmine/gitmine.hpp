//
// Created by gregorian-rayne on 10/19/26.
//

#ifndef GITMINE_GITMINE_HPP
#define GITMINE_GITMINE_HPP

/**
 * @file gitmine.hpp
 * @brief Main header for the gitmine library.
 *
 * Pulls in the mining entry point, configuration and JSON export.
 * Include specific headers for more targeted dependencies.
 */

#include "version.hpp"
#include "error.hpp"
#include "result.hpp"
#include "types.hpp"
#include "log.hpp"
#include "config.hpp"
#include "classify/commit_classifier.hpp"
#include "git/git_integration.hpp"
#include "diff/diff_stats.hpp"
#include "diff/patch_parser.hpp"
#include "diff/diff_extractor.hpp"
#include "structure/repository_structure.hpp"
#include "mining/history_miner.hpp"
#include "mining/derived_views.hpp"
#include "export/json_export.hpp"
#include "utils/string_utils.hpp"

#endif //GITMINE_GITMINE_HPP
