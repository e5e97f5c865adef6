#ifndef CAPTUREAP_TESTS_TEMPORARY_DIRECTORY_HPP
#define CAPTUREAP_TESTS_TEMPORARY_DIRECTORY_HPP

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>

namespace captureap
{
    namespace test
    {

        // Scratch directory removed with everything in it on destruction
        class TemporaryDirectory
        {
        public:
            TemporaryDirectory()
            {
                auto pattern = (std::filesystem::temp_directory_path() / "capture_ap_test_XXXXXX").string();
                if (mkdtemp(pattern.data()) == nullptr)
                {
                    throw std::runtime_error("mkdtemp failed for " + pattern);
                }
                path_ = pattern;
            }

            ~TemporaryDirectory()
            {
                std::error_code ec;
                std::filesystem::remove_all(path_, ec);
            }

            TemporaryDirectory(const TemporaryDirectory &) = delete;
            TemporaryDirectory &operator=(const TemporaryDirectory &) = delete;

            const std::filesystem::path &path() const { return path_; }
            std::filesystem::path operator/(const std::string &name) const { return path_ / name; }

        private:
            std::filesystem::path path_;
        };

        inline void write_text(const std::filesystem::path &path, const std::string &text)
        {
            std::ofstream out(path, std::ios::binary | std::ios::trunc);
            out << text;
        }

        inline std::string read_text(const std::filesystem::path &path)
        {
            std::ifstream in(path, std::ios::binary);
            std::ostringstream content;
            content << in.rdbuf();
            return content.str();
        }

    } // namespace test
} // namespace captureap

#endif // CAPTUREAP_TESTS_TEMPORARY_DIRECTORY_HPP
