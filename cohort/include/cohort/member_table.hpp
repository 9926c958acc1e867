#pragma once
// Member Table: id-keyed rows of (kind, location)
//
// Rows are kept in a dense vector in insertion order, with an id -> row
// index for O(1) upsert/get/remove. Removal swaps the last row into the
// hole, so order among survivors is not preserved after a removal.
//
// The table does no I/O. to_json()/from_json() exist so a caller can mirror
// it into whatever durable store owns the members.

#include "errors.hpp"
#include "types.hpp"
#include "version.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace cohort {

class MemberTable {
public:
    using json = nlohmann::json;

    explicit MemberTable(FieldLimits limits = {}) : limits_(limits) {}

    // ═══════════════════════════════════════════════════════════════════════
    // Mutation
    // ═══════════════════════════════════════════════════════════════════════

    // Append a row, or refresh the location of an existing one.
    // Kind is fixed by the first insert and never overwritten.
    void upsert(const MemberId& id, const std::string& kind, const std::string& location) {
        validate(id, kind, location);

        auto it = index_.find(id);
        if (it != index_.end()) {
            rows_[it->second].location = location;
            return;
        }

        index_.emplace(id, rows_.size());
        rows_.push_back(MemberRecord{id, kind, location});
    }

    // Remove rows for the given ids. Unknown ids are ignored.
    void remove(const std::vector<MemberId>& ids) {
        for (const auto& id : ids) {
            auto it = index_.find(id);
            if (it == index_.end()) continue;

            size_t row = it->second;
            size_t last = rows_.size() - 1;
            if (row != last) {
                rows_[row] = std::move(rows_[last]);
                index_[rows_[row].id] = row;
            }
            rows_.pop_back();
            index_.erase(it);
        }
    }

    void remove_all() {
        rows_.clear();
        index_.clear();
    }

    // ═══════════════════════════════════════════════════════════════════════
    // Queries
    // ═══════════════════════════════════════════════════════════════════════

    std::optional<MemberRecord> get(const MemberId& id) const {
        auto it = index_.find(id);
        if (it == index_.end()) return std::nullopt;
        return rows_[it->second];
    }

    bool contains(const MemberId& id) const {
        return index_.find(id) != index_.end();
    }

    // Position of id in row order
    std::optional<size_t> position(const MemberId& id) const {
        auto it = index_.find(id);
        if (it == index_.end()) return std::nullopt;
        return it->second;
    }

    const MemberRecord& row(size_t i) const { return rows_.at(i); }

    const std::vector<MemberRecord>& snapshot() const { return rows_; }

    std::vector<MemberId> ids() const {
        std::vector<MemberId> out;
        out.reserve(rows_.size());
        for (const auto& r : rows_) out.push_back(r.id);
        return out;
    }

    std::vector<std::string> kinds() const {
        std::vector<std::string> out;
        out.reserve(rows_.size());
        for (const auto& r : rows_) out.push_back(r.kind);
        return out;
    }

    std::vector<std::string> locations() const {
        std::vector<std::string> out;
        out.reserve(rows_.size());
        for (const auto& r : rows_) out.push_back(r.location);
        return out;
    }

    size_t size() const { return rows_.size(); }
    bool empty() const { return rows_.empty(); }

    const FieldLimits& limits() const { return limits_; }

    // ═══════════════════════════════════════════════════════════════════════
    // Encoding
    // ═══════════════════════════════════════════════════════════════════════

    json to_json() const {
        json members = json::array();
        for (const auto& r : rows_) {
            members.push_back({
                {"id", r.id.to_string()},
                {"kind", r.kind},
                {"location", r.location}
            });
        }
        return {
            {"format", COHORT_TABLE_FORMAT_VERSION},
            {"members", members}
        };
    }

    static MemberTable from_json(const json& j, FieldLimits limits = {}) {
        MemberTable table(limits);

        try {
            int format = j.value("format", 0);
            if (!version::table_format_compatible(format)) {
                throw ValidationError("member table: unsupported format " + std::to_string(format));
            }

            const json& members = j.at("members");
            if (!members.is_array()) {
                throw ValidationError("member table: 'members' must be an array");
            }

            for (const auto& m : members) {
                std::string id_str = m.at("id").get<std::string>();
                MemberId id = MemberId::from_string(id_str);
                if (!id.valid()) {
                    throw ValidationError("member table: malformed id '" + id_str + "'");
                }
                table.upsert(id, m.at("kind").get<std::string>(),
                             m.at("location").get<std::string>());
            }
        } catch (const json::exception& e) {
            throw ValidationError(std::string("member table: ") + e.what());
        }
        return table;
    }

private:
    std::vector<MemberRecord> rows_;
    std::unordered_map<MemberId, size_t, MemberIdHash> index_;
    FieldLimits limits_;

    void validate(const MemberId& id, const std::string& kind, const std::string& location) const {
        if (!id.valid()) {
            throw ValidationError("member id must not be the zero UUID");
        }
        check_length("id", id.to_string().size(), limits_.id_length);
        if (kind.empty()) {
            throw ValidationError("member kind must not be empty");
        }
        check_length("kind", kind.size(), limits_.kind_length);
        if (location.empty()) {
            throw ValidationError("member location must not be empty");
        }
        check_length("location", location.size(), limits_.location_length);
    }

    static void check_length(const char* field, size_t length, size_t limit) {
        if (length > limit) {
            throw ValidationError(std::string("member ") + field + " is " +
                                  std::to_string(length) + " characters; limit is " +
                                  std::to_string(limit));
        }
    }
};

} // namespace cohort
