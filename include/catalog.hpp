#ifndef CATALOG_HPP
#define CATALOG_HPP

#include "diagcol.hpp"
#include <string>
#include <vector>
#include <functional>

namespace pc {
    using std::string;
    using std::vector;
    using std::function;

    struct conversion_pair {
        string from;
        string to;

        bool operator==(const conversion_pair& other) const {
            return from == other.from && to == other.to;
        }

        bool operator!=(const conversion_pair& other) const {
            return !(*this == other);
        }

        bool operator<(const conversion_pair& other) const {
            return from != other.from ? from < other.from : to < other.to;
        }
    };

    // Ordered list of the type names under test. The order only fixes the
    // layout of generated code and reports.
    class type_catalog {
        vector<string> names;

        explicit type_catalog(vector<string> names) : names(move(names)) { }

        public:

        static type_catalog go_primitives();
        static type_catalog from_names(vector<string> names, diagnostic_collector& diags);

        const vector<string>& types() const { return names; }
        size_t size() const { return names.size(); }
        size_t pair_count() const { return names.size() * names.size(); }
        bool contains(const string& name) const;

        // Visits the self-product, outer loop over source types.
        void for_each_pair(function<void(const conversion_pair&)> func) const;
    };

    bool is_go_identifier(const string& name);
}

#endif
