#include "config/key_value_document.hpp"
#include "core/file_util.hpp"

#include <sstream>

namespace captureap
{
    namespace config
    {

        KeyValueDocument::Line KeyValueDocument::parse_line(const std::string &text)
        {
            Line line;
            line.text = text;

            auto first = text.find_first_not_of(" \t");
            if (first == std::string::npos || text[first] == '#')
            {
                return line;
            }

            auto equals = text.find('=', first);
            if (equals == std::string::npos || equals == first)
            {
                return line;
            }

            line.key = text.substr(first, equals - first);
            line.value = text.substr(equals + 1);
            if (!line.value.empty() && line.value.back() == '\r')
            {
                line.value.pop_back();
            }
            return line;
        }

        KeyValueDocument KeyValueDocument::parse(const std::string &text)
        {
            KeyValueDocument document;
            document.trailing_newline_ = text.empty() || text.back() == '\n';

            std::istringstream stream(text);
            std::string raw;
            while (std::getline(stream, raw))
            {
                document.lines_.push_back(parse_line(raw));
            }
            return document;
        }

        std::optional<KeyValueDocument> KeyValueDocument::load(const std::filesystem::path &path)
        {
            auto content = core::read_file(path);
            if (!content)
            {
                return std::nullopt;
            }
            return parse(*content);
        }

        std::optional<std::string> KeyValueDocument::get(const std::string &key) const
        {
            for (const auto &line : lines_)
            {
                if (line.key && *line.key == key)
                {
                    return line.value;
                }
            }
            return std::nullopt;
        }

        std::vector<std::string> KeyValueDocument::get_all(const std::string &key) const
        {
            std::vector<std::string> values;
            for (const auto &line : lines_)
            {
                if (line.key && *line.key == key)
                {
                    values.push_back(line.value);
                }
            }
            return values;
        }

        std::optional<std::string> KeyValueDocument::find_with_prefix(const std::string &key, const std::string &prefix) const
        {
            for (const auto &line : lines_)
            {
                if (line.key && *line.key == key && line.value.compare(0, prefix.size(), prefix) == 0)
                {
                    return line.value;
                }
            }
            return std::nullopt;
        }

        std::size_t KeyValueDocument::set(const std::string &key, const std::string &value, const std::string &value_prefix)
        {
            std::size_t replaced = 0;
            for (auto &line : lines_)
            {
                if (!line.key || *line.key != key || line.value.compare(0, value_prefix.size(), value_prefix) != 0)
                {
                    continue;
                }

                // Keep any indentation in front of the key
                auto equals = line.text.find('=');
                line.text = line.text.substr(0, equals + 1) + value;
                line.value = value;
                ++replaced;
            }
            return replaced;
        }

        KeyValueDocument &KeyValueDocument::add(const std::string &key, const std::string &value)
        {
            lines_.push_back(parse_line(key + "=" + value));
            return *this;
        }

        KeyValueDocument &KeyValueDocument::add_comment(const std::string &text)
        {
            lines_.push_back(parse_line("# " + text));
            return *this;
        }

        KeyValueDocument &KeyValueDocument::add_blank()
        {
            lines_.push_back(Line{});
            return *this;
        }

        std::string KeyValueDocument::to_string() const
        {
            std::string text;
            for (std::size_t i = 0; i < lines_.size(); ++i)
            {
                text += lines_[i].text;
                if (i + 1 < lines_.size() || trailing_newline_)
                {
                    text += "\n";
                }
            }
            return text;
        }

        void KeyValueDocument::save(const std::filesystem::path &path) const
        {
            core::write_file_atomically(path, to_string());
        }

    } // namespace config
} // namespace captureap
