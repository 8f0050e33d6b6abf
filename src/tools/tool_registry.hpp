#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>
#include "core/errors/bridge_errors.hpp"
#include "protocol/mcp_contract.hpp"

namespace appbridge::tools {

inline constexpr std::string_view kToolNamePrefix = "app.";

// One callable tool, bound to a target application.
struct Tool {
    std::string name;         // "app." + slugify(app_name)
    std::string app_name;     // Identity, as found on disk
    std::string description;
};

// Where the catalog scan looks and which extensions it accepts.
struct CatalogLayout {
    std::vector<std::string> root_extensions = {"pdf"};
    std::string text_subdir = "text";
    std::vector<std::string> text_extensions = {"txt"};
};

// Lower-cased ASCII alphanumerics; runs of Unicode whitespace, '-', '_',
// '.', '/' become one '-'; everything else is dropped; no leading/trailing
// '-'.
std::string slugify(std::string_view input);

Tool make_tool(const std::string& app_name);

protocol::ToolDescriptor describe(const Tool& tool);

// Read-only after construction.
class ToolRegistry {
public:
    ToolRegistry() = default;
    explicit ToolRegistry(std::vector<Tool> tools);

    // Builds the catalog from the entry names under `root`. A missing root
    // gives an empty registry; any filesystem error fails the whole load.
    static core::errors::Result<ToolRegistry> load(const std::filesystem::path& root,
                                                   const CatalogLayout& layout = {});

    std::vector<protocol::ToolDescriptor> descriptors() const;
    const Tool* find(const std::string& name) const;
    const std::vector<Tool>& tools() const { return tools_; }
    std::size_t size() const { return tools_.size(); }

private:
    std::vector<Tool> tools_;
    std::unordered_map<std::string, std::size_t> index_;
};

}  // namespace appbridge::tools
