//
// Created by gregorian-rayne on 10/19/26.
//

#include "gitmine/export/json_export.hpp"
#include "gitmine/mining/derived_views.hpp"
#include "gitmine/utils/json_utils.hpp"
#include "gitmine/utils/string_utils.hpp"

namespace gitmine::json
{
    using nlohmann::json;

    namespace {

        json commit_to_json(const CommitRecord& commit, const bool include_diffs) {
            json entry;
            entry["hash"] = commit.hash();
            entry["author"] = commit.author_name();
            entry["email"] = commit.author_email();
            entry["date"] = string_utils::format_timestamp(commit.timestamp());
            entry["message"] = commit.message();
            entry["category"] = to_string(commit.category());
            entry["diffs"] = include_diffs ? json(commit.diffs()) : json::object();
            entry["lines_added"] = commit.lines_added();
            entry["lines_deleted"] = commit.lines_deleted();
            entry["files_changed"] = commit.files_changed();
            return entry;
        }

        json summary_to_json(const MiningResult& result) {
            const auto t = mining::totals(result);

            json totals;
            totals["commits"] = t.commits;
            totals["contributors"] = t.contributors;
            totals["lines_added"] = t.lines_added;
            totals["lines_deleted"] = t.lines_deleted;
            totals["files_changed"] = t.files_changed;

            json summary;
            summary["totals"] = totals;
            summary["commit_types"] = mining::commit_type_counts(result);
            summary["file_types"] = mining::file_type_counts(result);
            summary["day_activity"] = mining::day_activity(result);
            summary["file_changes"] = mining::file_change_counts(result);
            return summary;
        }

    }  // namespace

    json to_json(const MiningResult& result, const ExportOptions& options) {
        json output;
        output["repo_name"] = result.repo_name;
        output["period"] = result.period;

        if (result.contributor_filter && !result.contributor_filter->empty()) {
            output["filtered_by"] = *result.contributor_filter;
        } else {
            output["filtered_by"] = std::string(ALL_CONTRIBUTORS);
        }

        output["branch"] = result.branch;
        output["total_commits"] = result.total_commits();

        json commits = json::array();
        for (const auto& commit : result.commits) {
            commits.push_back(commit_to_json(commit, options.include_diffs));
        }
        output["commits"] = commits;

        json contributors = json::object();
        for (const auto& [name, rollup] : result.contributors) {
            json c;
            c["email"] = rollup.email;
            c["commits"] = rollup.commits;
            c["lines_added"] = rollup.lines_added;
            c["lines_deleted"] = rollup.lines_deleted;
            c["files_changed"] = rollup.files_changed;
            contributors[name] = c;
        }
        output["contributors"] = contributors;

        json structure = json::array();
        for (const auto& entry : result.repository_structure) {
            structure.push_back({{"path", entry.relative_path}, {"files", entry.file_count}});
        }
        output["repository_structure"] = structure;

        output["warnings"] = result.warnings;

        if (options.include_summary) {
            output["summary"] = summary_to_json(result);
        }

        return output;
    }

    std::string to_string(const MiningResult& result, const ExportOptions& options) {
        return json_utils::dump(to_json(result, options), options.pretty_print ? 2 : -1);
    }

    Result<void, Error> write_file(const fs::path& path, const MiningResult& result, const ExportOptions& options) {
        return json_utils::write_file(path, to_json(result, options), options.pretty_print ? 2 : -1);
    }

}  // namespace gitmine::json
