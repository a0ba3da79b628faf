#ifndef DIAGCOL_HPP
#define DIAGCOL_HPP

#include "location.hpp"
#include <optional>
#include <ostream>
#include <vector>
#include <memory>
#include <utility>
#include <unordered_map>
#include <istream>
#include <string>

namespace pc {
    using std::optional;
    using std::ostream;
    using std::vector;
    using std::unique_ptr;
    using std::make_unique;
    using std::move;
    using std::unordered_map;
    using std::istream;
    using std::string;

    template<typename T>
    using ref = std::reference_wrapper<T>;

    struct diagnostic {
        enum level_t {
            NOTE = 0,
            WARNING = 1,
            ERROR = 2,
        } level;

        optional<location> loc;

        diagnostic(level_t level) : level(level) { }
        diagnostic(level_t level, location loc) : level(level), loc(loc) { }
        virtual ~diagnostic() { }

        virtual void write(ostream& stream) const = 0;
    };

    class diagnostic_collector {
        vector<unique_ptr<diagnostic>> diags;
        bool verbose = false;

        public:

        diagnostic_collector() { }
        diagnostic_collector(bool verbose) : verbose(verbose) { }

        // Notes are dropped unless the collector is verbose.
        inline void add(unique_ptr<diagnostic> diag) {
            if (diag->level == diagnostic::NOTE && !verbose)
                return;
            diags.push_back(move(diag));
        }

        size_t count(diagnostic::level_t level) const;
        bool has_errors() const { return count(diagnostic::ERROR) != 0; }
        const vector<unique_ptr<diagnostic>>& all() const { return diags; }

        void report_all(ostream& stream, bool enable_colors, const unordered_map<string, ref<istream>>& files) const;
    };

    // Thrown after the failing component has recorded its diagnostic.
    struct pipeline_error { };
}

#endif
