#pragma once
// Collaborator contracts: locating members and mirroring the table
//
// The catalog never touches the filesystem itself. A ResolutionClient turns
// ids and location hints into live handles; a TableMirror, when installed,
// receives every table change so the caller can keep a durable copy.

#include "types.hpp"
#include <string>
#include <unordered_map>
#include <vector>

namespace cohort {

using LocationHints = std::unordered_map<MemberId, std::string, MemberIdHash>;
using Resolved = std::unordered_map<MemberId, HandlePtr, MemberIdHash>;

class ResolutionClient {
public:
    virtual ~ResolutionClient() = default;

    // Locate each pending member, trying its hinted location first and a
    // broader search second. The result has an entry for every pending id;
    // members that could not be found map to nullptr.
    virtual Resolved resolve(const std::vector<MemberId>& pending,
                             const LocationHints& hints) = 0;

    // Handles for every member found at a location. A directory holding
    // several statefiles yields several handles; nothing found yields none.
    virtual std::vector<HandlePtr> expand(const std::string& location) = 0;
};

class TableMirror {
public:
    virtual ~TableMirror() = default;

    // Throw PermissionDenied when the backing store refuses the write
    virtual void on_upsert(const MemberRecord& record) = 0;
    virtual void on_remove(const std::vector<MemberId>& ids) = 0;
    virtual void on_clear() = 0;
};

} // namespace cohort
