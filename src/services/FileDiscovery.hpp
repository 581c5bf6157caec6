/**
 * @file FileDiscovery.hpp
 * @brief Expanding user-supplied paths into file lists and copy plans
 */

#pragma once

#include "models/CopyTypes.hpp"

#include <filesystem>
#include <vector>

namespace file_discovery {

/**
 * @brief Flatten inputs into a sorted, de-duplicated file list
 *
 * Directories are walked recursively (regular files only, unreadable
 * subdirectories skipped). Explicit non-directory inputs are kept even if
 * missing so the caller can report them per file.
 */
[[nodiscard]] auto expand_paths(const std::vector<std::filesystem::path>& inputs)
    -> std::vector<std::filesystem::path>;

/**
 * @brief Deepest directory containing every input
 *
 * A directory input contributes itself, a file input its parent.
 */
[[nodiscard]] auto common_root(const std::vector<std::filesystem::path>& inputs)
    -> std::filesystem::path;

/**
 * @brief Path of a file relative to a root, falling back to the file name
 */
[[nodiscard]] auto relative_to(const std::filesystem::path& file,
                               const std::filesystem::path& root) -> std::filesystem::path;

struct CopyPlan {
    std::vector<CopyItem> items;
    std::vector<CopyFileError> errors;  ///< Inputs that cannot be planned
    std::filesystem::path source_root;
};

/**
 * @brief Map sources to destination paths
 *
 * With preserve_structure a file lands at dest/<name> and a directory's files
 * at dest/<dirname>/<relative path>. Without it every file lands directly in
 * dest; a repeated name becomes a planning error instead of an overwrite.
 */
[[nodiscard]] auto plan_copy(const std::vector<std::filesystem::path>& sources,
                             const std::filesystem::path& destination, bool preserve_structure)
    -> CopyPlan;

}  // namespace file_discovery
