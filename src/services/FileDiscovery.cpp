/**
 * @file FileDiscovery.cpp
 * @brief Directory walking and copy planning
 */

#include "services/FileDiscovery.hpp"

#include "util/Logger.hpp"

#include <algorithm>
#include <cerrno>
#include <format>
#include <optional>
#include <set>

namespace fs = std::filesystem;

namespace file_discovery {

namespace {
constexpr auto COMPONENT = "FileDiscovery";

auto normalized(const fs::path& path) -> fs::path {
    std::error_code ec;
    auto absolute = fs::absolute(path, ec);
    if (ec) {
        absolute = path;
    }
    auto result = absolute.lexically_normal();
    if (!result.has_filename() && result.has_relative_path()) {
        result = result.parent_path();
    }
    return result;
}

void walk_directory(const fs::path& dir, std::vector<fs::path>& out) {
    std::error_code ec;
    fs::recursive_directory_iterator it{dir, fs::directory_options::skip_permission_denied, ec};
    if (ec) {
        LOG_WARNING(COMPONENT, std::format("Cannot list {}: {}", dir.string(), ec.message()));
        return;
    }
    for (const auto end = fs::recursive_directory_iterator{}; it != end; it.increment(ec)) {
        if (ec) {
            LOG_WARNING(COMPONENT, std::format("Error walking {}: {}", dir.string(), ec.message()));
            break;
        }
        std::error_code type_ec;
        if (it->is_regular_file(type_ec)) {
            out.push_back(it->path().lexically_normal());
        }
    }
}

auto file_size_or_zero(const fs::path& path) -> uint64_t {
    std::error_code ec;
    const auto size = fs::file_size(path, ec);
    return ec ? 0 : static_cast<uint64_t>(size);
}

}  // namespace

auto expand_paths(const std::vector<fs::path>& inputs) -> std::vector<fs::path> {
    std::vector<fs::path> files;
    for (const auto& input : inputs) {
        const auto path = normalized(input);
        std::error_code ec;
        if (fs::is_directory(path, ec)) {
            walk_directory(path, files);
        } else {
            files.push_back(path);
        }
    }
    std::ranges::sort(files);
    const auto [first, last] = std::ranges::unique(files);
    files.erase(first, last);
    return files;
}

auto common_root(const std::vector<fs::path>& inputs) -> fs::path {
    std::optional<fs::path> root;
    for (const auto& input : inputs) {
        const auto path = normalized(input);
        std::error_code ec;
        const auto base = fs::is_directory(path, ec) ? path : path.parent_path();
        if (!root) {
            root = base;
            continue;
        }
        fs::path common;
        auto it_a = root->begin();
        auto it_b = base.begin();
        for (; it_a != root->end() && it_b != base.end() && *it_a == *it_b; ++it_a, ++it_b) {
            common /= *it_a;
        }
        root = common;
    }
    return root.value_or(fs::path{});
}

auto relative_to(const fs::path& file, const fs::path& root) -> fs::path {
    const auto relative = normalized(file).lexically_relative(normalized(root));
    if (relative.empty() || *relative.begin() == "..") {
        return file.filename();
    }
    return relative;
}

auto plan_copy(const std::vector<fs::path>& sources, const fs::path& destination,
               bool preserve_structure) -> CopyPlan {
    CopyPlan plan;
    plan.source_root = common_root(sources);
    const auto dest_root = normalized(destination);

    std::set<fs::path> claimed;
    auto add = [&](const fs::path& source, fs::path target) {
        target = target.lexically_normal();
        if (!claimed.insert(target).second) {
            plan.errors.push_back(CopyFileError{
                source, target,
                util::Error{std::format("Destination {} already planned for another file",
                                        target.string()),
                            EEXIST, util::ErrorKind::InvalidInput}});
            return;
        }
        plan.items.push_back(CopyItem{source, std::move(target), file_size_or_zero(source)});
    };

    for (const auto& input : sources) {
        const auto source = normalized(input);
        std::error_code ec;
        if (fs::is_directory(source, ec)) {
            std::vector<fs::path> files;
            walk_directory(source, files);
            std::ranges::sort(files);
            for (const auto& file : files) {
                if (preserve_structure) {
                    add(file, dest_root / source.filename() / relative_to(file, source));
                } else {
                    add(file, dest_root / file.filename());
                }
            }
        } else if (fs::exists(source, ec)) {
            add(source, dest_root / source.filename());
        } else {
            plan.errors.push_back(CopyFileError{
                source, {},
                util::Error{std::format("Source not found: {}", source.string()), ENOENT,
                            util::ErrorKind::Copy}});
        }
    }
    return plan;
}

}  // namespace file_discovery
