/**
 * @file spec_loader.cpp
 * @brief TOML task specification parsing using toml++.
 * @author Dimitris Kafetzis
 */

#include "workload/spec_loader.hpp"

#include <fstream>
#include <sstream>

#include <toml++/toml.hpp>

namespace wave_delegator {

Result<std::vector<TaskSpec>> load_task_specs(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Error{ErrorCode::Config, "Task specification not found: " + path.string()};
    }

    std::ifstream in(path);
    if (!in) {
        return Error{ErrorCode::Config, "Cannot open task specification: " + path.string()};
    }
    std::ostringstream contents;
    contents << in.rdbuf();
    return parse_task_specs(contents.str());
}

Result<std::vector<TaskSpec>> parse_task_specs(std::string_view toml_text) {
    toml::table tbl;
    try {
        tbl = toml::parse(toml_text);
    } catch (const toml::parse_error& err) {
        return Error{ErrorCode::Config,
                     std::string{"TOML parse error: "} + std::string{err.description()}};
    }

    const auto* tasks = tbl["tasks"].as_table();
    if (!tasks) {
        return Error{ErrorCode::Config, "Task specification has no [tasks] table"};
    }

    std::vector<TaskSpec> specs;
    specs.reserve(tasks->size());

    for (const auto& [key, node] : *tasks) {
        std::string id{key.str()};
        const auto* entry = node.as_table();
        if (!entry) {
            return Error{ErrorCode::Config, "tasks." + id + " must be a table"};
        }

        TaskSpec spec;
        spec.id = id;
        spec.description = (*entry)["description"].value_or(std::string{});

        auto type_name = (*entry)["worker_type"].value_or(std::string{"general"});
        auto type = parse_worker_type(type_name);
        if (!type) {
            return Error{ErrorCode::Config,
                         "tasks." + id + ": unknown worker_type '" + type_name + "'"};
        }
        spec.worker_type = *type;

        if (auto deps = (*entry)["depends_on"]; deps) {
            const auto* arr = deps.as_array();
            if (!arr) {
                return Error{ErrorCode::Config, "tasks." + id + ".depends_on must be an array"};
            }
            for (const auto& dep : *arr) {
                auto dep_id = dep.value<std::string>();
                if (!dep_id) {
                    return Error{ErrorCode::Config,
                                 "tasks." + id + ".depends_on must contain strings"};
                }
                spec.dependencies.push_back(std::move(*dep_id));
            }
        }

        specs.push_back(std::move(spec));
    }

    return specs;
}

}  // namespace wave_delegator
