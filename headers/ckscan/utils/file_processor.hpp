#ifndef CKSCAN_UTILS_FILE_PROCESSOR_HPP
#define CKSCAN_UTILS_FILE_PROCESSOR_HPP

/**
 * @file file_processor.hpp
 * @brief Per-file parallel map with failure isolation.
 *
 * map_files() runs a fallible per-file function on a thread pool. Every
 * input path produces exactly one FileResult, in input order: either the
 * function's value or the reason the file was not processed. One failing
 * file never prevents the others from being processed.
 *
 * Usage:
 * @code
 *     fileproc::MapOptions options;
 *     options.max_file_size = 512 * 1024;
 *     options.on_progress = [&bar] { bar.tick(); };
 *
 *     auto results = fileproc::map_files(files, [&](const fs::path& p) {
 *         return parser.parse_file(p);
 *     }, options, pool);
 * @endcode
 */

#include "ckscan/result.hpp"
#include "ckscan/error.hpp"
#include "ckscan/utils/file_utils.hpp"
#include "ckscan/utils/parallel.hpp"

#include <cstdint>
#include <exception>
#include <filesystem>
#include <functional>
#include <mutex>
#include <string>
#include <type_traits>
#include <vector>

namespace ckscan::fileproc {

    namespace fs = std::filesystem;

    /**
     * Zero-argument callback invoked once per processed file.
     */
    using ProgressFn = std::function<void()>;

    struct MapOptions {
        /// Files larger than this many bytes are skipped (0 = no limit).
        std::uintmax_t max_file_size = 0;

        /// Invoked after each file, whether it succeeded, failed or was skipped.
        /// Calls are serialized, never concurrent.
        ProgressFn on_progress;
    };

    /**
     * Outcome of processing one file.
     */
    template<typename T>
    struct FileResult {
        fs::path path;
        Result<T, Error> result;
    };

    namespace detail {
        template<typename R>
        struct result_value;

        template<typename T>
        struct result_value<Result<T, Error>> {
            using type = T;
        };
    }  // namespace detail

    /**
     * Applies a fallible function to every file on the given pool.
     *
     * When options.max_file_size is set, each file is stat'ed first and
     * oversized files yield a LimitExceeded error without calling fn. An
     * exception escaping fn is reported as an InternalError for that file.
     *
     * @param files Files to process.
     * @param fn Callable taking const fs::path& and returning Result<T, Error>.
     * @param options Size limit and progress callback.
     * @param pool Worker pool to run on.
     * @return One FileResult per input path, in input order.
     */
    template<typename F>
    auto map_files(
        const std::vector<fs::path>& files,
        F&& fn,
        const MapOptions& options,
        parallel::ThreadPool& pool
    ) {
        using R = std::invoke_result_t<F&, const fs::path&>;
        using T = typename detail::result_value<R>::type;

        std::mutex progress_mutex;
        auto report_progress = [&]() {
            if (options.on_progress) {
                std::lock_guard lock(progress_mutex);
                options.on_progress();
            }
        };

        auto process_one = [&](const fs::path& path) -> FileResult<T> {
            auto outcome = [&]() -> Result<T, Error> {
                if (options.max_file_size > 0) {
                    auto size = file_utils::file_size(path);
                    if (size.is_err()) {
                        return Result<T, Error>::failure(size.error());
                    }
                    if (size.value() > options.max_file_size) {
                        return Result<T, Error>::failure(Error::limit_exceeded(
                            "file too large (" + std::to_string(size.value()) + " bytes, limit " +
                                std::to_string(options.max_file_size) + ")",
                            path.string()
                        ));
                    }
                }

                try {
                    return fn(path);
                } catch (const std::exception& e) {
                    return Result<T, Error>::failure(
                        Error::internal_error(std::string("Unhandled exception: ") + e.what(), path.string())
                    );
                }
            }();

            report_progress();
            return FileResult<T>{path, std::move(outcome)};
        };

        return parallel::map(files, process_one, pool);
    }

    /**
     * Convenience overload without size limit or progress reporting.
     */
    template<typename F>
    auto map_files(const std::vector<fs::path>& files, F&& fn, parallel::ThreadPool& pool) {
        return map_files(files, std::forward<F>(fn), MapOptions{}, pool);
    }

}  // namespace ckscan::fileproc

#endif //CKSCAN_UTILS_FILE_PROCESSOR_HPP
