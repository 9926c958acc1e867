#pragma once
// Core types: what the catalog knows about a member
//
// A member is identified by a UUID, tagged with a kind, and last seen at a
// location. Anything richer lives behind a Handle.

#include <cctype>
#include <cstdint>
#include <cstdio>
#include <functional>
#include <memory>
#include <optional>
#include <random>
#include <string>

namespace cohort {

// UUID - 128-bit member identifier
struct MemberId {
    uint64_t high = 0;
    uint64_t low = 0;

    static MemberId generate() {
        static std::random_device rd;
        static std::mt19937_64 gen(rd());
        static std::uniform_int_distribution<uint64_t> dis;
        return {dis(gen), dis(gen)};
    }

    bool operator==(const MemberId& other) const {
        return high == other.high && low == other.low;
    }

    bool operator!=(const MemberId& other) const {
        return !(*this == other);
    }

    bool operator<(const MemberId& other) const {
        return high < other.high || (high == other.high && low < other.low);
    }

    std::string to_string() const {
        char buf[37];
        snprintf(buf, sizeof(buf), "%08x-%04x-%04x-%04x-%012llx",
                 (uint32_t)(high >> 32),
                 (uint16_t)(high >> 16),
                 (uint16_t)high,
                 (uint16_t)(low >> 48),
                 (unsigned long long)(low & 0xFFFFFFFFFFFFULL));
        return buf;
    }

    // Returns the zero id when s is not a canonical UUID
    static MemberId from_string(const std::string& s) {
        MemberId id;
        if (s.length() != 36) return id;

        // sscanf's %x would also take signs and blanks inside a group
        for (size_t i = 0; i < s.length(); ++i) {
            bool dash = (i == 8 || i == 13 || i == 18 || i == 23);
            if (dash ? s[i] != '-' : !std::isxdigit(static_cast<unsigned char>(s[i]))) {
                return id;
            }
        }

        uint32_t a;
        unsigned int b, c, d;
        unsigned long long e;
        char tail;

        if (sscanf(s.c_str(), "%8x-%4x-%4x-%4x-%12llx%c",
                   &a, &b, &c, &d, &e, &tail) == 5) {
            id.high = ((uint64_t)a << 32) | ((uint64_t)(b & 0xFFFF) << 16) | (c & 0xFFFF);
            id.low = ((uint64_t)(d & 0xFFFF) << 48) | (e & 0xFFFFFFFFFFFFULL);
        }
        return id;
    }

    bool valid() const { return high != 0 || low != 0; }
};

// Hash function for MemberId (for use in unordered containers)
struct MemberIdHash {
    size_t operator()(const MemberId& id) const {
        return std::hash<uint64_t>{}(id.high) ^ (std::hash<uint64_t>{}(id.low) << 1);
    }
};

// One row of the member table
struct MemberRecord {
    MemberId id;
    std::string kind;       // e.g. "Sim", "Group"; fixed once recorded
    std::string location;   // Absolute path of the member's directory

    bool operator==(const MemberRecord& other) const {
        return id == other.id && kind == other.kind && location == other.location;
    }
};

// Maximum encoded widths of the three record fields
struct FieldLimits {
    size_t id_length = 36;
    size_t kind_length = 55;
    size_t location_length = 511;
};

// Live reference to a resolved member.
//
// Implementations wrap whatever richer object the caller tracks; the
// catalog only ever reads these four attributes.
class Handle {
public:
    virtual ~Handle() = default;

    virtual MemberId id() const = 0;
    virtual std::string kind() const = 0;
    virtual std::string location() const = 0;

    // Display name, if the member has one
    virtual std::optional<std::string> name() const { return std::nullopt; }
};

// Shared, read-only handle. A null HandlePtr means "absent".
using HandlePtr = std::shared_ptr<const Handle>;

} // namespace cohort

namespace std {
template <>
struct hash<cohort::MemberId> {
    size_t operator()(const cohort::MemberId& id) const {
        return cohort::MemberIdHash{}(id);
    }
};
} // namespace std
