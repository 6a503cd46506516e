#pragma once

#include "../core/error.hpp"
#include "../core/types.hpp"
#include "spn_definition.hpp"
#include "spn_table.hpp"
#include <datapod/datapod.hpp>
#include <echo/echo.hpp>
#include <string>

namespace spnkit::database {

    struct DatabaseStats {
        usize spn_count = 0;
        usize pgn_count = 0;
    };

    // ─── SPN definition registry ─────────────────────────────────────────────────
    // Built once through create() and never modified afterwards, so a shared
    // instance can be read from any number of threads without locking.
    class Database {
        dp::Vector<SpnDefinition> definitions_;
        dp::Map<SPN, usize> by_spn_;               // spn -> index into definitions_
        dp::Map<PGN, dp::Vector<usize>> by_pgn_;   // pgn -> indices, registration order
        dp::Vector<PGN> pgns_;                     // first-registration order

      public:
        Database() = default;

        // Rejects malformed definitions and duplicate SPN numbers
        static Result<Database> create(const SpnDefinition *defs, usize count) {
            Database db;
            db.definitions_.reserve(count);
            for (usize i = 0; i < count; ++i) {
                const SpnDefinition &def = defs[i];
                if (!def.is_valid()) {
                    echo::category("spnkit.database").warn("rejected SPN ", def.spn, ": bad bit layout");
                    return Result<Database>::err(Error::invalid_definition(
                        "SPN " + dp::String(std::to_string(def.spn)) + " does not fit in an 8-byte frame"));
                }
                if (def.name == nullptr || def.name[0] == '\0') {
                    echo::category("spnkit.database").warn("rejected SPN ", def.spn, ": empty name");
                    return Result<Database>::err(
                        Error::invalid_definition("SPN " + dp::String(std::to_string(def.spn)) + " has no name"));
                }
                if (db.by_spn_.find(def.spn) != db.by_spn_.end()) {
                    echo::category("spnkit.database").warn("rejected SPN ", def.spn, ": duplicate");
                    return Result<Database>::err(Error::duplicate_spn(def.spn));
                }

                usize index = db.definitions_.size();
                db.definitions_.push_back(def);
                db.by_spn_[def.spn] = index;
                if (db.by_pgn_.find(def.pgn) == db.by_pgn_.end()) {
                    db.pgns_.push_back(def.pgn);
                }
                db.by_pgn_[def.pgn].push_back(index);
            }
            echo::category("spnkit.database")
                .debug("built: ", db.definitions_.size(), " SPNs across ", db.pgns_.size(), " PGNs");
            return Result<Database>::ok(std::move(db));
        }

        template <usize N> static Result<Database> create(const SpnDefinition (&defs)[N]) { return create(defs, N); }

        static Result<Database> create(const dp::Vector<SpnDefinition> &defs) {
            return create(defs.data(), defs.size());
        }

        // Process-wide database over BUILTIN_SPN_TABLE, built on first use.
        // The table is checked at compile time, so create() cannot reject it.
        static const Database &builtin() {
            static const Database instance = create(BUILTIN_SPN_TABLE).value();
            return instance;
        }

        // ─── Lookup ──────────────────────────────────────────────────────────────
        const SpnDefinition *find_spn(SPN spn) const noexcept {
            auto it = by_spn_.find(spn);
            if (it == by_spn_.end()) {
                return nullptr;
            }
            return &definitions_[it->second];
        }

        dp::Optional<SpnDefinition> get_spn_def(SPN spn) const {
            if (auto *def = find_spn(spn)) {
                return *def;
            }
            return dp::nullopt;
        }

        bool has_pgn(PGN pgn) const noexcept { return by_pgn_.find(pgn) != by_pgn_.end(); }

        // Registration order; empty when the PGN is unknown
        dp::Vector<const SpnDefinition *> get_spns_for_pgn(PGN pgn) const {
            dp::Vector<const SpnDefinition *> result;
            for_each_in_pgn(pgn, [&result](const SpnDefinition &def) { result.push_back(&def); });
            return result;
        }

        template <typename Fn> void for_each_in_pgn(PGN pgn, Fn &&fn) const {
            auto it = by_pgn_.find(pgn);
            if (it == by_pgn_.end()) {
                return;
            }
            for (usize index : it->second) {
                fn(definitions_[index]);
            }
        }

        const dp::Vector<PGN> &list_supported_pgns() const noexcept { return pgns_; }

        DatabaseStats stats() const noexcept { return DatabaseStats{definitions_.size(), pgns_.size()}; }

        const dp::Vector<SpnDefinition> &definitions() const noexcept { return definitions_; }

        bool empty() const noexcept { return definitions_.empty(); }
    };

    // ─── Lookups against the built-in database ───────────────────────────────────
    inline dp::Optional<SpnDefinition> get_spn_def(SPN spn) { return Database::builtin().get_spn_def(spn); }

    inline dp::Vector<const SpnDefinition *> get_spns_for_pgn(PGN pgn) {
        return Database::builtin().get_spns_for_pgn(pgn);
    }

    inline dp::Vector<PGN> list_supported_pgns() { return Database::builtin().list_supported_pgns(); }

    inline DatabaseStats database_stats() { return Database::builtin().stats(); }

} // namespace spnkit::database
namespace spnkit {
    using namespace database;
}
