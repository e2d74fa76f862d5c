//
// Created by gregorian on 19/10/2026.
//

#include "insight/utils/file_utils.h"
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

namespace insight::utils {

namespace {

bool create_parent_directories(const std::filesystem::path& p) {
    if (p.parent_path().empty()) {
        return true;
    }
    std::error_code ec;
    std::filesystem::create_directories(p.parent_path(), ec);
    return !ec;
}

}  // namespace

std::optional<std::string> read_file(const std::string_view path) {
    std::ifstream file(std::string(path), std::ios::in | std::ios::binary);

    if (!file.is_open()) {
        return std::nullopt;
    }

    std::ostringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

bool write_file(const std::string_view path, const std::string_view content) {
    const std::filesystem::path p(path);

    if (!create_parent_directories(p)) {
        return false;
    }

    std::ofstream file(p, std::ios::out | std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        return false;
    }

    file.write(content.data(), static_cast<std::streamsize>(content.size()));
    return file.good();
}

bool write_file_atomic(const std::string_view path, const std::string_view content) {
    const std::filesystem::path target(path);
    std::filesystem::path temp = target;
    temp += ".tmp";

    if (!write_file(temp.string(), content)) {
        return false;
    }

    std::error_code ec;
    std::filesystem::rename(temp, target, ec);
    if (ec) {
        std::filesystem::remove(temp, ec);
        return false;
    }
    return true;
}

bool file_exists(const std::string_view path) {
    std::error_code ec;
    return std::filesystem::is_regular_file(std::filesystem::path(path), ec);
}

bool remove_file(const std::string_view path) {
    std::error_code ec;
    return std::filesystem::remove(std::filesystem::path(path), ec) && !ec;
}

}  // namespace insight::utils
