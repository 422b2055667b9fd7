/**
 * @file spec_loader.hpp
 * @brief Read task specifications from TOML.
 * @author Dimitris Kafetzis
 *
 * Expected layout, one table per task:
 *
 *   [tasks.implement]
 *   description = "Implement feature"
 *   worker_type = "frontend"
 *   depends_on  = ["research", "docs"]
 */

#pragma once

#include "core/result.hpp"
#include "workload/task_graph.hpp"

#include <filesystem>
#include <string_view>
#include <vector>

namespace wave_delegator {

Result<std::vector<TaskSpec>> load_task_specs(const std::filesystem::path& path);
Result<std::vector<TaskSpec>> parse_task_specs(std::string_view toml_text);

}  // namespace wave_delegator
