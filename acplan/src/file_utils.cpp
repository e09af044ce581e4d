#include "acplan/file_utils.hpp"

#include <cerrno>   // for errno
#include <cstdio>   // for fopen, fread, fclose
#include <cstring>  // for strerror

#include <spdlog/spdlog.h>

namespace acplan::file_utils {

auto read_whole_file(std::string_view filepath) noexcept -> std::string {
    // fopen needs null-terminated path
    const std::string path{filepath};

    // Use std::fopen because it's faster than std::ifstream
    auto* file = std::fopen(path.c_str(), "rb");
    if (file == nullptr) {
        spdlog::error("[READWHOLEFILE] '{}' read failed: {}", filepath, std::strerror(errno));
        return {};
    }

    std::fseek(file, 0, SEEK_END);
    const auto file_size = std::ftell(file);
    if (file_size < 0) {
        spdlog::error("[READWHOLEFILE] '{}' size query failed: {}", filepath, std::strerror(errno));
        std::fclose(file);
        return {};
    }
    const auto size = static_cast<std::size_t>(file_size);
    std::fseek(file, 0, SEEK_SET);

    std::string buf;
    buf.resize(size);

    const std::size_t read = std::fread(buf.data(), sizeof(char), size, file);
    std::fclose(file);
    if (read != size) {
        spdlog::error("[READWHOLEFILE] '{}' read failed: {}", filepath, std::strerror(errno));
        return {};
    }

    return buf;
}

}  // namespace acplan::file_utils
