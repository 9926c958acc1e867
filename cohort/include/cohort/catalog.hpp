#pragma once
// Catalog: ordered, indexable collection of tracked members
//
// Composes three views of the same members:
//   - MemberTable: authoritative (id, kind, location) rows
//   - ObjectCache: live handles resolved so far
//   - ResolutionClient: the outside world, asked for anything not cached
//
// Every resolution writes back: found handles enter the cache and their
// current location replaces the recorded one, so a member that moved on
// disk is corrected the next time it is found.

#include "config.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "member_table.hpp"
#include "object_cache.hpp"
#include "parallel_mapper.hpp"
#include "resolver.hpp"
#include "types.hpp"
#include <filesystem>
#include <memory>
#include <optional>
#include <stdexcept>
#include <sstream>
#include <string>
#include <system_error>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace cohort {

class Catalog;

// ═══════════════════════════════════════════════════════════════════════════
// Argument types
// ═══════════════════════════════════════════════════════════════════════════

// Anything add() accepts: nothing, a handle, a location, or a nested
// collection (other catalogs flatten into one).
class MemberArg {
public:
    enum class Kind { Absent, Handle, Location, Collection };
    using Collection = std::vector<MemberArg>;

    MemberArg() = default;
    MemberArg(std::nullptr_t) {}
    MemberArg(HandlePtr handle) {
        if (handle) value_ = std::move(handle);
    }
    template <typename T, typename = std::enable_if_t<std::is_base_of_v<Handle, T>>>
    MemberArg(std::shared_ptr<T> handle) : MemberArg(HandlePtr(std::move(handle))) {}
    MemberArg(std::string location) : value_(std::move(location)) {}
    MemberArg(const char* location) {
        if (location) value_ = std::string(location);
    }
    MemberArg(Collection items) : value_(std::move(items)) {}
    MemberArg(const std::vector<HandlePtr>& handles) {
        Collection items(handles.begin(), handles.end());
        value_ = std::move(items);
    }
    MemberArg(Catalog& other);
    MemberArg(Catalog&& other);
    // Resolves through a copy; the const catalog's cache stays as it was
    MemberArg(const Catalog& other);

    Kind kind() const { return static_cast<Kind>(value_.index()); }

    const HandlePtr& handle() const { return std::get<HandlePtr>(value_); }
    const std::string& location() const { return std::get<std::string>(value_); }
    const Collection& items() const { return std::get<Collection>(value_); }

private:
    // Alternative order matches Kind
    std::variant<std::monostate, HandlePtr, std::string, Collection> value_;
};

// Anything remove() accepts: an ordinal position or a handle
class RemoveArg {
public:
    template <typename T, std::enable_if_t<std::is_integral_v<T>, int> = 0>
    RemoveArg(T index) : value_(static_cast<long long>(index)) {}
    RemoveArg(HandlePtr handle) : value_(std::move(handle)) {}
    template <typename T, typename = std::enable_if_t<std::is_base_of_v<Handle, T>>>
    RemoveArg(std::shared_ptr<T> handle) : value_(HandlePtr(std::move(handle))) {}

    bool is_index() const { return std::holds_alternative<long long>(value_); }
    long long index() const { return std::get<long long>(value_); }
    const HandlePtr& handle() const { return std::get<HandlePtr>(value_); }

private:
    std::variant<long long, HandlePtr> value_;
};

// ═══════════════════════════════════════════════════════════════════════════
// Catalog
// ═══════════════════════════════════════════════════════════════════════════

class Catalog {
public:
    explicit Catalog(std::shared_ptr<ResolutionClient> client, CatalogConfig config = {})
        : config_(config)
        , table_(config.limits)
        , client_(std::move(client))
    {
        if (!client_) {
            throw InvalidArgument("a catalog needs a resolution client");
        }
    }

    Catalog(std::shared_ptr<ResolutionClient> client, CatalogConfig config,
            const std::vector<MemberArg>& items)
        : Catalog(std::move(client), config)
    {
        add_all(items);
    }

    // Copies are independent values; a table mirror stays with the source
    Catalog(const Catalog& other)
        : config_(other.config_)
        , table_(other.table_)
        , cache_(other.cache_)
        , client_(other.client_)
    {}

    Catalog& operator=(const Catalog& other) {
        if (this != &other) {
            config_ = other.config_;
            table_ = other.table_;
            cache_ = other.cache_;
            client_ = other.client_;
            mirror_.reset();
        }
        return *this;
    }

    Catalog(Catalog&&) = default;
    Catalog& operator=(Catalog&&) = default;

    // ═══════════════════════════════════════════════════════════════════════
    // Membership
    // ═══════════════════════════════════════════════════════════════════════

    // Add members given as handles, locations, or collections of either.
    // Re-adding a member only refreshes its location.
    template <typename... Ts>
    void add(Ts&&... items) {
        add_all(std::vector<MemberArg>{MemberArg(std::forward<Ts>(items))...});
    }

    void add_all(const std::vector<MemberArg>& items) {
        std::vector<HandlePtr> handles;
        for (const auto& item : items) {
            collect(item, handles);
        }
        for (const auto& h : handles) {
            record(h->id(), h->kind(), h->location());
        }
    }

    // Remove members given as ordinals (against current order) or handles
    template <typename... Ts>
    void remove(Ts&&... members) {
        remove_each(std::vector<RemoveArg>{RemoveArg(std::forward<Ts>(members))...});
    }

    void remove_each(const std::vector<RemoveArg>& members) {
        std::vector<MemberId> ids = table_.ids();
        std::vector<MemberId> doomed;
        doomed.reserve(members.size());

        // Interpret every argument before touching anything
        for (const auto& m : members) {
            if (m.is_index()) {
                auto i = position_of(m.index());
                if (!i) {
                    throw InvalidArgument("remove: position " + std::to_string(m.index()) +
                                          " out of range for " + std::to_string(ids.size()) +
                                          " members");
                }
                doomed.push_back(ids[*i]);
            } else if (m.handle()) {
                doomed.push_back(m.handle()->id());
            } else {
                throw InvalidArgument("remove: only an index or a handle is acceptable");
            }
        }
        drop(doomed);
    }

    void remove_all() {
        cache_.clear();
        table_.remove_all();
        if (mirror_) mirror_->on_clear();
    }

    // ═══════════════════════════════════════════════════════════════════════
    // Access
    // ═══════════════════════════════════════════════════════════════════════

    // Every member as a live handle, in table order.
    // Throws MemberNotFound if any member cannot be resolved.
    std::vector<HandlePtr> list() {
        return materialize(all_positions(), true);
    }

    HandlePtr at(long long index) {
        auto i = position_of(index);
        if (!i) {
            throw std::out_of_range("catalog index " + std::to_string(index) +
                                    " out of range for " + std::to_string(size()) + " members");
        }
        return materialize({*i}, true).front();
    }

    HandlePtr operator[](long long index) { return at(index); }

    // New catalog from the members at start:stop:step (Python slice rules).
    // The source catalog is not modified.
    Catalog slice(std::optional<long long> start, std::optional<long long> stop,
                  long long step = 1) {
        std::vector<HandlePtr> members = materialize(slice_positions(start, stop, step), true);
        return Catalog(client_, config_, {MemberArg(members)});
    }

    size_t size() const { return table_.size(); }
    bool empty() const { return table_.empty(); }

    bool contains(const MemberId& id) const { return table_.contains(id); }
    bool contains(const HandlePtr& handle) const {
        return handle && table_.contains(handle->id());
    }

    // ═══════════════════════════════════════════════════════════════════════
    // Projections
    // ═══════════════════════════════════════════════════════════════════════

    std::vector<MemberId> ids() const { return table_.ids(); }
    std::vector<std::string> kinds() const { return table_.kinds(); }
    std::vector<std::string> locations() const { return table_.locations(); }

    // Display name per member; members that cannot be found give nullopt.
    // Missing members are looked for again on every call.
    std::vector<std::optional<std::string>> names() {
        std::vector<HandlePtr> members = materialize(all_positions(), false);
        std::vector<std::optional<std::string>> out;
        out.reserve(members.size());
        for (const auto& m : members) {
            out.push_back(m ? m->name() : std::nullopt);
        }
        return out;
    }

    std::string repr() {
        std::vector<HandlePtr> members = materialize(all_positions(), false);
        const auto& rows = table_.snapshot();

        std::ostringstream ss;
        ss << "<Catalog([";
        for (size_t i = 0; i < members.size(); ++i) {
            if (i > 0) ss << ", ";
            if (!members[i]) {
                ss << "<missing: " << rows[i].id.to_string() << ">";
                continue;
            }
            auto name = members[i]->name();
            ss << "<" << members[i]->kind() << ": "
               << (name ? *name : members[i]->id().to_string()) << ">";
        }
        ss << "])>";
        return ss.str();
    }

    // ═══════════════════════════════════════════════════════════════════════
    // Map
    // ═══════════════════════════════════════════════════════════════════════

    // fn(handle, args...) for every member, results in member order.
    // concurrency 0 uses the configured default.
    template <typename F, typename... Args>
    auto map(F fn, size_t concurrency = 1, const Args&... args) {
        if (concurrency == 0) concurrency = config_.default_concurrency;
        ParallelMapper mapper(config_.verbose);
        return mapper.map(list(), std::move(fn), concurrency, args...);
    }

    // ═══════════════════════════════════════════════════════════════════════
    // Collaborators and internals
    // ═══════════════════════════════════════════════════════════════════════

    void set_mirror(std::shared_ptr<TableMirror> mirror) { mirror_ = std::move(mirror); }

    const MemberTable& table() const { return table_; }
    const CatalogConfig& config() const { return config_; }
    const std::shared_ptr<ResolutionClient>& client() const { return client_; }

    size_t cache_size() const { return cache_.size(); }
    void clear_cache() { cache_.clear(); }

private:
    CatalogConfig config_;
    MemberTable table_;
    ObjectCache cache_;
    std::shared_ptr<ResolutionClient> client_;
    std::shared_ptr<TableMirror> mirror_;

    // Parse one add() argument into handles
    void collect(const MemberArg& item, std::vector<HandlePtr>& out) {
        switch (item.kind()) {
            case MemberArg::Kind::Absent:
                break;
            case MemberArg::Kind::Handle:
                out.push_back(item.handle());
                break;
            case MemberArg::Kind::Location:
                for (auto& h : client_->expand(item.location())) {
                    if (h) out.push_back(std::move(h));
                }
                break;
            case MemberArg::Kind::Collection:
                for (const auto& sub : item.items()) {
                    collect(sub, out);
                }
                break;
        }
    }

    void record(const MemberId& id, const std::string& kind, const std::string& location) {
        table_.upsert(id, kind, normalize(location));
        if (mirror_) {
            mirror_->on_upsert(*table_.get(id));
        }
    }

    void drop(const std::vector<MemberId>& ids) {
        table_.remove(ids);
        cache_.erase(ids);
        if (mirror_) mirror_->on_remove(ids);
    }

    std::string normalize(const std::string& location) const {
        if (!config_.normalize_locations) return location;

        namespace fs = std::filesystem;
        std::error_code ec;
        fs::path p = fs::absolute(fs::path(location), ec);
        if (ec) p = fs::path(location);

        std::string out = p.lexically_normal().string();
        while (out.size() > 1 && out.back() == '/') out.pop_back();
        return out;
    }

    // Resolve the members at the given positions, in the order given.
    // With fail_on_missing, a member that cannot be found raises
    // MemberNotFound before table or cache change; otherwise it is nullptr.
    std::vector<HandlePtr> materialize(const std::vector<size_t>& positions,
                                       bool fail_on_missing) {
        const auto& rows = table_.snapshot();
        std::vector<HandlePtr> out(positions.size());

        std::vector<MemberId> pending;
        LocationHints hints;
        for (size_t k = 0; k < positions.size(); ++k) {
            const MemberRecord& row = rows[positions[k]];
            if (HandlePtr h = cache_.get(row.id)) {
                out[k] = std::move(h);
            } else if (hints.emplace(row.id, row.location).second) {
                pending.push_back(row.id);
            }
        }

        if (pending.empty()) return out;

        log::detail(config_.verbose, "Catalog",
                    "Resolving " + std::to_string(pending.size()) + " of " +
                    std::to_string(positions.size()) + " members");

        Resolved found = client_->resolve(pending, hints);

        for (size_t k = 0; k < positions.size(); ++k) {
            if (out[k]) continue;
            const MemberId& id = rows[positions[k]].id;
            auto it = found.find(id);
            if (it != found.end() && it->second) {
                out[k] = it->second;
            } else if (fail_on_missing) {
                throw MemberNotFound(positions[k], id);
            }
        }

        for (const auto& id : pending) {
            auto it = found.find(id);
            if (it == found.end() || !it->second) {
                log::detail(config_.verbose, "Catalog", "Member " + id.to_string() + " not found");
                continue;
            }
            // Cached only once the table agrees with the handle, so a
            // refresh that did not land is retried on the next resolution
            if (refresh(id, it->second)) {
                cache_.insert(id, it->second);
            }
        }
        return out;
    }

    // Record where a resolved member actually is. Returns false when the
    // new location could not be stored in the table; the handle is still
    // good either way. A mirror refusing the write leaves the in-memory
    // row corrected.
    bool refresh(const MemberId& id, const HandlePtr& handle) {
        try {
            std::string kind = table_.get(id)->kind;
            record(id, kind, handle->location());
        } catch (const PermissionDenied& e) {
            log::warn("Catalog", "Location of " + id.to_string() + " not mirrored: " + e.what());
        } catch (const ValidationError& e) {
            log::warn("Catalog", "Location of " + id.to_string() + " not refreshed: " + e.what());
            return false;
        } catch (const std::filesystem::filesystem_error& e) {
            if (e.code() != std::errc::permission_denied) throw;
            log::warn("Catalog", "Location of " + id.to_string() + " not refreshed: " + e.what());
            return false;
        }
        return true;
    }

    std::vector<size_t> all_positions() const {
        std::vector<size_t> positions(table_.size());
        for (size_t i = 0; i < positions.size(); ++i) positions[i] = i;
        return positions;
    }

    // Ordinal to row, counting from the end when negative
    std::optional<size_t> position_of(long long index) const {
        long long n = static_cast<long long>(table_.size());
        long long i = index < 0 ? index + n : index;
        if (i < 0 || i >= n) return std::nullopt;
        return static_cast<size_t>(i);
    }

    std::vector<size_t> slice_positions(std::optional<long long> start,
                                        std::optional<long long> stop,
                                        long long step) const {
        if (step == 0) {
            throw InvalidArgument("slice step cannot be zero");
        }

        long long n = static_cast<long long>(table_.size());
        long long lower = step > 0 ? 0 : -1;
        long long upper = step > 0 ? n : n - 1;

        auto clamp = [&](std::optional<long long> v, long long fallback) {
            if (!v) return fallback;
            long long x = *v;
            if (x < 0) {
                x += n;
                if (x < lower) x = lower;
            } else if (x > upper) {
                x = upper;
            }
            return x;
        };

        long long from = clamp(start, step > 0 ? lower : upper);
        long long to = clamp(stop, step > 0 ? upper : lower);

        std::vector<size_t> positions;
        if (step > 0) {
            for (long long i = from; i < to; i += step) positions.push_back(static_cast<size_t>(i));
        } else {
            for (long long i = from; i > to; i += step) positions.push_back(static_cast<size_t>(i));
        }
        return positions;
    }
};

inline MemberArg::MemberArg(Catalog& other) : MemberArg(other.list()) {}
inline MemberArg::MemberArg(Catalog&& other) : MemberArg(other.list()) {}
inline MemberArg::MemberArg(const Catalog& other) : MemberArg(Catalog(other).list()) {}

} // namespace cohort
