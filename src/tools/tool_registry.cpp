#include "tools/tool_registry.hpp"

#include <cctype>
#include <set>
#include <system_error>
#include <utility>
#include "core/logging/logger.hpp"
#include "core/text/utf8.hpp"

namespace appbridge::tools {

using core::errors::BridgeError;
using core::errors::ErrorCategory;
using nlohmann::json;

namespace {

bool is_separator(const char32_t c) {
    return core::text::is_whitespace(c) || c == U'-' || c == U'_' || c == U'.' || c == U'/';
}

bool extension_matches(const std::filesystem::path& path,
                       const std::vector<std::string>& extensions) {
    std::string ext = path.extension().string();
    if (ext.size() < 2) {
        return false;
    }
    ext.erase(0, 1);
    for (const auto& candidate : extensions) {
        if (candidate.size() != ext.size()) {
            continue;
        }
        bool same = true;
        for (std::size_t i = 0; i < ext.size(); ++i) {
            if (std::tolower(static_cast<unsigned char>(ext[i])) !=
                std::tolower(static_cast<unsigned char>(candidate[i]))) {
                same = false;
                break;
            }
        }
        if (same) {
            return true;
        }
    }
    return false;
}

BridgeError scan_error(const std::filesystem::path& dir, const std::error_code& ec) {
    return BridgeError{ErrorCategory::Internal,
                       "Failed to scan catalog directory " + dir.string() + ": " +
                           ec.message(),
                       "catalog_scan_failed"};
}

// Adds the stem of every matching non-directory entry of `dir` to `names`.
core::errors::Result<std::size_t> collect_app_names(
    const std::filesystem::path& dir, const std::vector<std::string>& extensions,
    std::set<std::string>& names) {
    std::error_code ec;
    std::filesystem::directory_iterator it(dir, ec);
    if (ec) {
        return scan_error(dir, ec);
    }

    std::size_t matched = 0;
    const auto end = std::filesystem::directory_iterator{};
    for (; it != end; it.increment(ec)) {
        if (ec) {
            return scan_error(dir, ec);
        }
        const bool is_dir = it->is_directory(ec);
        if (ec) {
            return scan_error(it->path(), ec);
        }
        if (is_dir || !extension_matches(it->path(), extensions)) {
            continue;
        }
        const std::string stem = it->path().stem().string();
        if (stem.empty()) {
            continue;
        }
        names.insert(stem);
        ++matched;
    }
    if (ec) {
        return scan_error(dir, ec);
    }
    return matched;
}

json script_input_schema() {
    json script;
    script["type"] = "string";
    script["description"] =
        "AppleScript commands to execute inside a 'tell application' block";

    json schema;
    schema["type"] = "object";
    schema["properties"] = json::object({{"script", script}});
    schema["required"] = json::array({"script"});
    return schema;
}

}  // namespace

std::string slugify(std::string_view input) {
    std::string slug;
    slug.reserve(input.size());
    std::size_t pos = 0;
    while (pos < input.size()) {
        char32_t c = 0;
        const std::size_t length = core::text::decode_code_point(input, pos, c);
        if (length == 0) {
            ++pos;
            continue;
        }
        pos += length;

        if (c < 0x80 && std::isalnum(static_cast<unsigned char>(c)) != 0) {
            slug.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        } else if (is_separator(c)) {
            if (!slug.empty() && slug.back() != '-') {
                slug.push_back('-');
            }
        }
    }
    while (!slug.empty() && slug.back() == '-') {
        slug.pop_back();
    }
    return slug;
}

Tool make_tool(const std::string& app_name) {
    Tool tool;
    tool.app_name = app_name;
    tool.name = std::string(kToolNamePrefix) + slugify(app_name);
    tool.description =
        "Execute AppleScript commands in the " + app_name + " application context.";
    return tool;
}

protocol::ToolDescriptor describe(const Tool& tool) {
    return protocol::ToolDescriptor{tool.name, tool.description, script_input_schema()};
}

ToolRegistry::ToolRegistry(std::vector<Tool> tools) {
    tools_.reserve(tools.size());
    for (auto& tool : tools) {
        if (index_.find(tool.name) != index_.end()) {
            LOG_WARN("ToolRegistry: skipping '" + tool.app_name + "', name " + tool.name +
                     " is already taken");
            continue;
        }
        index_.emplace(tool.name, tools_.size());
        tools_.push_back(std::move(tool));
    }
}

core::errors::Result<ToolRegistry> ToolRegistry::load(const std::filesystem::path& root,
                                                      const CatalogLayout& layout) {
    std::set<std::string> names;

    std::error_code ec;
    const bool root_exists = std::filesystem::exists(root, ec);
    if (ec) {
        return scan_error(root, ec);
    }
    if (!root_exists) {
        LOG_WARN("ToolRegistry: catalog root " + root.string() +
                 " does not exist; no tools registered");
        return ToolRegistry{};
    }

    auto root_scan = collect_app_names(root, layout.root_extensions, names);
    if (core::errors::is_error(root_scan)) {
        return core::errors::get_error(root_scan);
    }

    const auto text_dir = root / layout.text_subdir;
    const bool text_exists = std::filesystem::exists(text_dir, ec);
    if (ec) {
        return scan_error(text_dir, ec);
    }
    if (text_exists) {
        auto text_scan = collect_app_names(text_dir, layout.text_extensions, names);
        if (core::errors::is_error(text_scan)) {
            return core::errors::get_error(text_scan);
        }
    }

    std::vector<Tool> tools;
    tools.reserve(names.size());
    for (const auto& app_name : names) {
        if (slugify(app_name).empty()) {
            LOG_WARN("ToolRegistry: skipping '" + app_name + "', it has no usable name characters");
            continue;
        }
        tools.push_back(make_tool(app_name));
    }

    ToolRegistry registry(std::move(tools));
    LOG_INFO("ToolRegistry: loaded " + std::to_string(registry.size()) + " tools from " +
             root.string());
    return registry;
}

std::vector<protocol::ToolDescriptor> ToolRegistry::descriptors() const {
    std::vector<protocol::ToolDescriptor> list;
    list.reserve(tools_.size());
    for (const auto& tool : tools_) {
        list.push_back(describe(tool));
    }
    return list;
}

const Tool* ToolRegistry::find(const std::string& name) const {
    auto it = index_.find(name);
    if (it == index_.end()) {
        return nullptr;
    }
    return &tools_[it->second];
}

}  // namespace appbridge::tools
