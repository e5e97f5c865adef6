#ifndef CAPTUREAP_CORE_FILE_UTIL_HPP
#define CAPTUREAP_CORE_FILE_UTIL_HPP

#include <filesystem>
#include <optional>
#include <string>

namespace captureap
{
    namespace core
    {

        /**
         * Replace the file at path with content.
         * Writes "<path>.tmp" next to it and renames it into place, so readers see
         * either the old or the new file. The result is readable by its owner only.
         * Parent directories are created.
         * Throws CaptureApError on any I/O failure.
         */
        void write_file_atomically(const std::filesystem::path &path, const std::string &content);

        // Whole file, or nothing if it does not exist. Throws CaptureApError if it exists but cannot be read.
        std::optional<std::string> read_file(const std::filesystem::path &path);

    } // namespace core
} // namespace captureap

#endif // CAPTUREAP_CORE_FILE_UTIL_HPP
