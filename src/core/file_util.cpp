#include "core/file_util.hpp"
#include "core/errors.hpp"

#include <fstream>
#include <sstream>

namespace captureap
{
    namespace core
    {

        void write_file_atomically(const std::filesystem::path &path, const std::string &content)
        {
            std::error_code ec;
            if (path.has_parent_path())
            {
                std::filesystem::create_directories(path.parent_path(), ec);
                if (ec)
                {
                    throw CaptureApError("Cannot create directory " + path.parent_path().string() + ": " + ec.message());
                }
            }

            auto temp_path = path;
            temp_path += ".tmp";

            {
                std::ofstream out(temp_path, std::ios::binary | std::ios::trunc);
                if (!out)
                {
                    throw CaptureApError("Cannot open " + temp_path.string() + " for writing");
                }
                // The hostapd config holds the passphrase; owner-only before anything is written
                std::filesystem::permissions(temp_path,
                                             std::filesystem::perms::owner_read | std::filesystem::perms::owner_write,
                                             std::filesystem::perm_options::replace, ec);
                if (ec)
                {
                    out.close();
                    std::error_code ignored;
                    std::filesystem::remove(temp_path, ignored);
                    throw CaptureApError("Cannot restrict permissions of " + temp_path.string() + ": " + ec.message());
                }
                out << content;
                out.flush();
                if (!out)
                {
                    out.close();
                    std::filesystem::remove(temp_path, ec);
                    throw CaptureApError("Failed writing " + temp_path.string());
                }
            }

            std::filesystem::rename(temp_path, path, ec);
            if (ec)
            {
                std::error_code ignored;
                std::filesystem::remove(temp_path, ignored);
                throw CaptureApError("Cannot replace " + path.string() + ": " + ec.message());
            }
        }

        std::optional<std::string> read_file(const std::filesystem::path &path)
        {
            std::error_code ec;
            if (!std::filesystem::exists(path, ec))
            {
                return std::nullopt;
            }

            std::ifstream in(path, std::ios::binary);
            if (!in)
            {
                throw CaptureApError("Cannot open " + path.string() + " for reading");
            }

            std::ostringstream content;
            content << in.rdbuf();
            return content.str();
        }

    } // namespace core
} // namespace captureap
