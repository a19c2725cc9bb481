#pragma once


#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>

namespace tare::internal {

    namespace fs = std::filesystem;

    inline std::string read_text_file(const fs::path& path) {
        std::ifstream in{path};
        if (!in) {
            throw std::runtime_error("failed to open " + path.string());
        }
        std::ostringstream ss{};
        ss << in.rdbuf();
        if (!in.good() && !in.eof()) {
            throw std::runtime_error("failed to read " + path.string());
        }
        return ss.str();
    }

    // Creates missing parent directories
    inline void write_text_file(const fs::path& path, std::string_view text) {
        if (path.has_parent_path()) {
            std::error_code ec{};
            fs::create_directories(path.parent_path(), ec);
            if (ec) {
                throw std::runtime_error("failed to create directory " + path.parent_path().string());
            }
        }

        std::ofstream out{path, std::ios::binary | std::ios::trunc};
        if (!out) {
            throw std::runtime_error("failed to open " + path.string());
        }
        out << text;
        if (!out) {
            throw std::runtime_error("failed to write " + path.string());
        }
    }

}  // namespace tare::internal
