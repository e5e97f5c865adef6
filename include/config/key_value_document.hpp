#ifndef CAPTUREAP_CONFIG_KEY_VALUE_DOCUMENT_HPP
#define CAPTUREAP_CONFIG_KEY_VALUE_DOCUMENT_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace captureap
{
    namespace config
    {

        /**
         * Line-preserving "key=value" document, the format shared by hostapd and dnsmasq
         *
         * Comments ('#'), blank lines and bare flags (e.g. "bind-interfaces") are
         * kept verbatim and are never reported as entries. Rewriting a key only
         * touches the value part of the lines carrying that key, so a file that is
         * loaded and saved unchanged is byte-identical.
         */
        class KeyValueDocument
        {
        public:
            KeyValueDocument() = default;

            static KeyValueDocument parse(const std::string &text);
            // Nothing if the file does not exist
            static std::optional<KeyValueDocument> load(const std::filesystem::path &path);

            // Value of the first line carrying key
            std::optional<std::string> get(const std::string &key) const;
            // Values of every line carrying key, in file order
            std::vector<std::string> get_all(const std::string &key) const;
            // First value of key that starts with prefix, prefix included
            std::optional<std::string> find_with_prefix(const std::string &key, const std::string &prefix) const;

            /**
             * Replace the value on every line carrying key whose current value
             * starts with value_prefix.
             * @return number of lines rewritten
             */
            std::size_t set(const std::string &key, const std::string &value, const std::string &value_prefix = "");

            // Builders used when generating a document from scratch
            KeyValueDocument &add(const std::string &key, const std::string &value);
            KeyValueDocument &add_comment(const std::string &text);
            KeyValueDocument &add_blank();

            std::string to_string() const;
            void save(const std::filesystem::path &path) const;

        private:
            struct Line
            {
                std::string text;
                // Set when the line is an entry
                std::optional<std::string> key;
                std::string value;
            };

            static Line parse_line(const std::string &text);

            std::vector<Line> lines_;
            bool trailing_newline_ = true;
        };

    } // namespace config
} // namespace captureap

#endif // CAPTUREAP_CONFIG_KEY_VALUE_DOCUMENT_HPP
