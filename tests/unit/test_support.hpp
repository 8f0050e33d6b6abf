#pragma once

#include <deque>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "core/config/session_id.hpp"
#include "core/errors/bridge_errors.hpp"
#include "transport/transport.hpp"

namespace appbridge::testing {

class TempWorkspace {
public:
    explicit TempWorkspace(const std::string& prefix = "workspace") {
        root_ = std::filesystem::current_path() /
                (".tmp_" + prefix + "_" + appbridge::core::config::generate_session_id());
        std::filesystem::create_directories(root_);
    }

    ~TempWorkspace() {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path root_;
};

inline void write_file(const std::filesystem::path& path, const std::string& content) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary);
    out << content;
}

// Writes a /bin/sh script and makes it executable. The interpreter receives
// "-e <program>", so the program text is "$2".
inline std::filesystem::path write_interpreter(const std::filesystem::path& path,
                                               const std::string& body) {
    write_file(path, "#!/bin/sh\n" + body);
    std::filesystem::permissions(path,
                                 std::filesystem::perms::owner_all |
                                     std::filesystem::perms::group_read |
                                     std::filesystem::perms::group_exec,
                                 std::filesystem::perm_options::replace);
    return path;
}

// Scripted inbound frames, recorded outbound frames.
class MemoryTransport : public appbridge::transport::Transport {
public:
    void push(std::string payload) {
        inbound_.emplace_back(std::optional<std::string>(std::move(payload)));
    }

    void push_error(appbridge::core::errors::BridgeError error) {
        inbound_.emplace_back(std::move(error));
    }

    appbridge::core::errors::Result<std::optional<std::string>> read() override {
        ++reads_;
        if (inbound_.empty()) {
            return std::optional<std::string>{};
        }
        auto next = std::move(inbound_.front());
        inbound_.pop_front();
        return next;
    }

    appbridge::core::errors::Result<std::size_t> write(const std::string& payload) override {
        written_.push_back(payload);
        return payload.size();
    }

    const std::vector<std::string>& written() const { return written_; }
    std::size_t reads() const { return reads_; }

private:
    std::deque<appbridge::core::errors::Result<std::optional<std::string>>> inbound_;
    std::vector<std::string> written_;
    std::size_t reads_ = 0;
};

}  // namespace appbridge::testing
