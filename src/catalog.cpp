#include "catalog.hpp"
#include "diags.hpp"
#include "utils.hpp"
#include <algorithm>
#include <set>

namespace pc {
    using namespace pc::utils;
    using std::set;
    using std::find;

    const vector<string> GO_PRIMITIVES = {
        "bool",
        "uint8",
        "uint16",
        "uint32",
        "uint64",
        "int8",
        "int16",
        "int32",
        "int64",
        "float32",
        "float64",
        "complex64",
        "complex128",
        "string",
        "int",
        "uint",
        "uintptr",
        "byte", // alias for uint8
        "rune", // alias for int32
    };

    type_catalog type_catalog::go_primitives() {
        return type_catalog(GO_PRIMITIVES);
    }

    type_catalog type_catalog::from_names(vector<string> names, diagnostic_collector& diags) {
        auto fail = [&] (string reason) {
            diags.add(make_ptr(diags::invalid_catalog(move(reason))));
            throw pipeline_error();
        };

        if (names.empty())
            fail("The catalog is empty");

        set<string> seen;

        for (auto& name : names) {
            if (!is_go_identifier(name))
                fail("'" + name + "' is not a valid type name");
            if (!seen.insert(name).second)
                fail("'" + name + "' is listed more than once");
        }

        return type_catalog(move(names));
    }

    bool type_catalog::contains(const string& name) const {
        return find(names.begin(), names.end(), name) != names.end();
    }

    void type_catalog::for_each_pair(function<void(const conversion_pair&)> func) const {
        for (auto& from : names) {
            for (auto& to : names)
                func({ from, to });
        }
    }

    const set<string> GO_KEYWORDS = {
        "break", "case", "chan", "const", "continue", "default", "defer", "else",
        "fallthrough", "for", "func", "go", "goto", "if", "import", "interface",
        "map", "package", "range", "return", "select", "struct", "switch", "type", "var",
    };

    bool is_go_identifier(const string& name) {
        if (name.empty() || GO_KEYWORDS.count(name))
            return false;

        auto letter = [] (char ch) { return (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') || ch == '_'; };
        auto digit = [] (char ch) { return ch >= '0' && ch <= '9'; };

        if (!letter(name[0]))
            return false;

        for (auto ch : name) {
            if (!letter(ch) && !digit(ch))
                return false;
        }

        return true;
    }
}
