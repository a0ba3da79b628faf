#ifndef FAILURES_HPP
#define FAILURES_HPP

#include "catalog.hpp"
#include "location.hpp"
#include <optional>
#include <vector>
#include <set>

namespace pc {
    using std::optional;
    using std::vector;
    using std::set;

    struct conversion_failure {
        conversion_pair pair;
        optional<location> loc;
    };

    // Conversions the compiler rejected during one run, in the order they
    // were reported.
    class failure_set {
        vector<conversion_failure> failures;
        set<conversion_pair> pairs;

        public:

        void add(conversion_failure failure) {
            pairs.insert(failure.pair);
            failures.push_back(move(failure));
        }

        bool contains(const conversion_pair& pair) const {
            return pairs.count(pair) != 0;
        }

        bool contains(const string& from, const string& to) const {
            return contains(conversion_pair { from, to });
        }

        size_t size() const { return failures.size(); }
        size_t distinct_pairs() const { return pairs.size(); }
        bool empty() const { return failures.empty(); }

        auto begin() const { return failures.begin(); }
        auto end() const { return failures.end(); }
    };

    inline bool is_convertible(const failure_set& failures, const conversion_pair& pair) {
        return !failures.contains(pair);
    }
}

#endif
