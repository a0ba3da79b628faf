#ifndef UTILS_HPP
#define UTILS_HPP

#include <string>
#include <string_view>
#include <vector>
#include <memory>
#include <optional>
#include <utility>

namespace pc::utils {
    using std::string;
    using std::string_view;
    using std::vector;
    using std::unique_ptr;
    using std::make_unique;
    using std::optional;
    using std::move;

    template<typename T>
    unique_ptr<T> make_ptr(T&& value) {
        return make_unique<T>(move(value));
    }

    // Splits on '\n', dropping one trailing '\r' per line. A final empty
    // segment after the last newline is not returned.
    inline vector<string> split_lines(string_view text) {
        vector<string> lines;
        size_t index = 0;

        while (index < text.size()) {
            auto end_index = text.find('\n', index);
            if (end_index == string_view::npos)
                end_index = text.size();

            auto line = text.substr(index, end_index - index);
            if (!line.empty() && line.back() == '\r')
                line.remove_suffix(1);

            lines.emplace_back(line);
            index = end_index + 1;
        }

        return lines;
    }

    inline void replace_all(string& text, string_view pattern, string_view replacement) {
        size_t index = 0;
        while ((index = text.find(pattern, index)) != string::npos) {
            text.replace(index, pattern.size(), replacement);
            index += replacement.size();
        }
    }

    inline optional<unsigned> parse_unsigned(string_view text) {
        if (text.empty() || text.size() > 9)
            return { };

        unsigned result = 0;
        for (auto ch : text) {
            if (ch < '0' || ch > '9')
                return { };
            result = result * 10 + (ch - '0');
        }

        return result;
    }
}

#endif
