#ifndef LOCATION_HPP
#define LOCATION_HPP

#include <string>
#include <cstddef>

namespace pc {
    using std::string;

    struct position {
        string file_name;
        size_t line = 0;
        size_t column = 0;
    };

    struct location {
        position begin;
        position end;
    };

    inline location whole_line(const string& file_name, size_t line, size_t column) {
        return { { file_name, line, column }, { file_name, line, column } };
    }
}

#endif
