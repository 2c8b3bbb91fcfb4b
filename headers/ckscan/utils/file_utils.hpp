#ifndef CKSCAN_UTILS_FILE_UTILS_HPP
#define CKSCAN_UTILS_FILE_UTILS_HPP

/**
 * @file file_utils.hpp
 * @brief File system helpers returning Result<T, Error>.
 */

#include "ckscan/result.hpp"
#include "ckscan/error.hpp"
#include "ckscan/syntax/language.hpp"
#include "ckscan/utils/path_utils.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <system_error>
#include <vector>

namespace ckscan::file_utils {

    namespace fs = std::filesystem;

    /**
     * Reads an entire file into a string.
     *
     * @param path Path to the file.
     * @return The file contents, NotFound if it does not exist, IoError otherwise.
     */
    inline Result<std::string, Error> read_file(const fs::path& path) {
        if (std::error_code ec; !fs::exists(path, ec)) {
            return Result<std::string, Error>::failure(
                Error::not_found("File not found", path.string())
            );
        }

        std::ifstream file(path, std::ios::binary);
        if (!file) {
            return Result<std::string, Error>::failure(
                Error::io_error("Failed to open file", path.string())
            );
        }

        std::ostringstream oss;
        oss << file.rdbuf();

        if (file.bad()) {
            return Result<std::string, Error>::failure(
                Error::io_error("Failed to read file", path.string())
            );
        }

        return Result<std::string, Error>::success(oss.str());
    }

    /**
     * Returns the size of a regular file in bytes.
     */
    inline Result<std::uintmax_t, Error> file_size(const fs::path& path) {
        std::error_code ec;
        const auto size = fs::file_size(path, ec);
        if (ec) {
            if (ec == std::errc::no_such_file_or_directory) {
                return Result<std::uintmax_t, Error>::failure(
                    Error::not_found("File not found", path.string())
                );
            }
            return Result<std::uintmax_t, Error>::failure(
                Error::io_error("Failed to stat file: " + ec.message(), path.string())
            );
        }
        return Result<std::uintmax_t, Error>::success(size);
    }

    /**
     * Sorts the files found by a directory walk and reports how it ended.
     *
     * A walk that stopped early on an iteration error keeps what it found
     * and logs a warning; if it found nothing the error is returned.
     */
    inline Result<std::vector<fs::path>, Error> finish_walk(
        const fs::path& root,
        std::vector<fs::path> files,
        const std::error_code walk_error
    ) {
        if (walk_error) {
            if (files.empty()) {
                return Result<std::vector<fs::path>, Error>::failure(
                    Error::io_error("Directory walk failed: " + walk_error.message(), root.string())
                );
            }
            spdlog::warn("{}: directory walk stopped early ({}), continuing with {} files",
                         root.string(), walk_error.message(), files.size());
        }

        std::ranges::sort(files);
        return Result<std::vector<fs::path>, Error>::success(std::move(files));
    }

    /**
     * Recursively collects source files below a root.
     *
     * Only files with a recognized language extension are returned. Vendored
     * directories (node_modules, vendor, third_party, ...) and hidden
     * directories are not descended into. A root that is itself a file is
     * returned as-is when its language is recognized. Directories below the root
     * that deny access are skipped; only an unreadable root is an error.
     *
     * @param root Directory or file to scan.
     * @return Sorted list of source files.
     */
    inline Result<std::vector<fs::path>, Error> collect_source_files(const fs::path& root) {
        std::error_code ec;
        const auto status = fs::status(root, ec);
        if (ec || !fs::exists(status)) {
            return Result<std::vector<fs::path>, Error>::failure(
                Error::not_found("Path does not exist", root.string())
            );
        }

        std::vector<fs::path> files;

        if (fs::is_regular_file(status)) {
            if (detect_language(root) != Language::Unknown) {
                files.push_back(root);
            }
            return Result<std::vector<fs::path>, Error>::success(std::move(files));
        }

        fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
        if (ec) {
            return Result<std::vector<fs::path>, Error>::failure(
                Error::io_error("Cannot read directory: " + ec.message(), root.string())
            );
        }

        std::error_code walk_error;
        for (const fs::recursive_directory_iterator end; it != end; it.increment(walk_error)) {
            if (walk_error) {
                break;
            }

            const auto& entry = *it;
            const auto name = entry.path().filename().string();

            if (entry.is_directory(ec)) {
                const bool hidden = name.size() > 1 && name.front() == '.';
                if (hidden || path_utils::is_vendor_directory(name)) {
                    it.disable_recursion_pending();
                }
                continue;
            }

            if (entry.is_regular_file(ec) && detect_language(entry.path()) != Language::Unknown) {
                files.push_back(entry.path());
            }
        }

        return finish_walk(root, std::move(files), walk_error);
    }

}  // namespace ckscan::file_utils

#endif //CKSCAN_UTILS_FILE_UTILS_HPP
