#include <cohort/cohort.hpp>
#include <atomic>
#include <cassert>
#include <chrono>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <thread>
#include <unordered_map>

using namespace cohort;

// ═══════════════════════════════════════════════════════════════════════════
// Fixtures
// ═══════════════════════════════════════════════════════════════════════════

class StateHandle : public Handle {
public:
    StateHandle(MemberId id, std::string kind, std::string location,
                std::optional<std::string> name = std::nullopt)
        : id_(id), kind_(std::move(kind)), location_(std::move(location)), name_(std::move(name)) {}

    MemberId id() const override { return id_; }
    std::string kind() const override { return kind_; }
    std::string location() const override { return location_; }
    std::optional<std::string> name() const override { return name_; }

private:
    MemberId id_;
    std::string kind_;
    std::string location_;
    std::optional<std::string> name_;
};

HandlePtr make_member(uint64_t n, const std::string& kind, const std::string& location,
                      std::optional<std::string> name = std::nullopt) {
    return std::make_shared<StateHandle>(MemberId{0, n}, kind, location, std::move(name));
}

// What "the filesystem" currently holds, keyed by member id
class ScriptedClient : public ResolutionClient {
public:
    std::unordered_map<MemberId, HandlePtr, MemberIdHash> world;
    std::unordered_map<std::string, std::vector<HandlePtr>> directories;
    size_t resolve_calls = 0;
    size_t last_pending = 0;
    size_t found_at_hint = 0;

    void place(const HandlePtr& h) { world[h->id()] = h; }
    void vanish(const MemberId& id) { world.erase(id); }

    Resolved resolve(const std::vector<MemberId>& pending, const LocationHints& hints) override {
        ++resolve_calls;
        last_pending = pending.size();

        Resolved out;
        for (const auto& id : pending) {
            auto it = world.find(id);
            if (it == world.end()) {
                out[id] = nullptr;
                continue;
            }
            auto hint = hints.find(id);
            if (hint != hints.end() && hint->second == it->second->location()) {
                ++found_at_hint;
            }
            out[id] = it->second;
        }
        return out;
    }

    std::vector<HandlePtr> expand(const std::string& location) override {
        auto it = directories.find(location);
        if (it == directories.end()) return {};
        return it->second;
    }
};

class RecordingMirror : public TableMirror {
public:
    bool deny = false;
    size_t upserts = 0;
    size_t removes = 0;
    size_t clears = 0;

    void on_upsert(const MemberRecord&) override {
        if (deny) throw PermissionDenied("statefile is read-only");
        ++upserts;
    }
    void on_remove(const std::vector<MemberId>& ids) override { removes += ids.size(); }
    void on_clear() override { ++clears; }
};

template <typename E, typename F>
bool throws(F&& fn) {
    try {
        fn();
    } catch (const E&) {
        return true;
    }
    return false;
}

// Counts tasks in flight. Each task holds until a second one has been seen
// running (or a deadline passes), so overlap shows up in peak().
class OverlapGauge {
public:
    void enter() {
        int now = ++running_;
        int seen = peak_.load();
        while (now > seen && !peak_.compare_exchange_weak(seen, now)) {}
    }

    void wait_for_company() const {
        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
        while (peak_.load() < 2 && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::microseconds(100));
        }
    }

    void leave() { --running_; }

    int peak() const { return peak_.load(); }

private:
    std::atomic<int> running_{0};
    std::atomic<int> peak_{0};
};

// A catalog whose members A, B, C also exist in the client's world
struct Fixture {
    std::shared_ptr<ScriptedClient> client = std::make_shared<ScriptedClient>();
    HandlePtr a = make_member(1, "Sim", "/data/sims/a", std::string("alpha"));
    HandlePtr b = make_member(2, "Sim", "/data/sims/b", std::string("beta"));
    HandlePtr c = make_member(3, "Group", "/data/groups/c", std::string("gamma"));
    Catalog catalog{client};

    Fixture() {
        client->place(a);
        client->place(b);
        client->place(c);
        catalog.add(a, b, c);
    }
};

// ═══════════════════════════════════════════════════════════════════════════
// Types and config
// ═══════════════════════════════════════════════════════════════════════════

void test_member_id() {
    std::cout << "Testing MemberId..." << std::endl;

    MemberId id = MemberId::generate();
    assert(id.valid());

    std::string s = id.to_string();
    assert(s.size() == 36);
    assert(s[8] == '-' && s[13] == '-' && s[18] == '-' && s[23] == '-');
    assert(MemberId::from_string(s) == id);

    assert(!MemberId::from_string("not-a-uuid").valid());
    assert(!MemberId::from_string("zzzzzzzz-zzzz-zzzz-zzzz-zzzzzzzzzzzz").valid());
    assert(!MemberId::from_string("+2345678-1234-1234-1234-123456789abc").valid());
    assert(!MemberId::from_string("12345678-1234- 234-1234-123456789abc").valid());
    assert(!MemberId::from_string("12345678_1234-1234-1234-123456789abc").valid());
    assert(MemberId::from_string("12345678-1234-ABCD-1234-123456789abc").valid());
    assert(!MemberId{}.valid());

    std::cout << "  PASS" << std::endl;
}

void test_config() {
    std::cout << "Testing CatalogConfig..." << std::endl;

    CatalogConfig defaults;
    assert(defaults.limits.id_length == 36);
    assert(defaults.limits.kind_length == 55);
    assert(defaults.limits.location_length == 511);
    assert(defaults.default_concurrency == 1);

    auto cfg = CatalogConfig::from_json(json{{"location_length", 64}, {"verbose", true}});
    assert(cfg.limits.location_length == 64);
    assert(cfg.limits.kind_length == 55);
    assert(cfg.verbose);

    assert(throws<ConfigError>([] { CatalogConfig::from_json(json{{"verbose", "loud"}}); }));
    assert(throws<ConfigError>([] { CatalogConfig::from_json(json{{"default_concurrency", 0}}); }));
    assert(throws<ConfigError>([] { CatalogConfig::from_json(json{{"default_concurrency", -1}}); }));
    assert(throws<ConfigError>([] { CatalogConfig::from_json(json{{"location_length", -1}}); }));
    assert(throws<ConfigError>([] { CatalogConfig::from_json(json{{"kind_length", 2.5}}); }));
    assert(throws<ConfigError>([] { CatalogConfig::from_json(json{{"id_length", "36"}}); }));
    assert(CatalogConfig::from_json(json::parse(R"({"location_length": 1024})")).limits.location_length == 1024);
    assert(throws<ConfigError>([] { CatalogConfig::from_json(json::array()); }));

    CatalogConfig loaded;
    assert(!CatalogConfig::load("/nonexistent/cohort.json", loaded));

    std::string path = "cohort_test_config.json";
    {
        std::ofstream out(path);
        out << R"({"default_concurrency": 3, "normalize_locations": false})";
    }
    assert(CatalogConfig::load(path, loaded));
    assert(loaded.default_concurrency == 3);
    assert(!loaded.normalize_locations);
    std::remove(path.c_str());

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// MemberTable
// ═══════════════════════════════════════════════════════════════════════════

void test_table_upsert_idempotent() {
    std::cout << "Testing MemberTable upsert..." << std::endl;

    MemberTable table;
    MemberId id{0, 7};
    table.upsert(id, "Sim", "/old/place");
    table.upsert(id, "Group", "/new/place");

    assert(table.size() == 1);
    auto rec = table.get(id);
    assert(rec.has_value());
    assert(rec->location == "/new/place");
    assert(rec->kind == "Sim");  // kind is fixed by the first insert

    std::cout << "  PASS" << std::endl;
}

void test_table_order_and_removal() {
    std::cout << "Testing MemberTable order/removal..." << std::endl;

    MemberTable table;
    for (uint64_t i = 1; i <= 5; ++i) {
        table.upsert(MemberId{0, i}, "Sim", "/sims/" + std::to_string(i));
    }

    auto ids = table.ids();
    for (uint64_t i = 1; i <= 5; ++i) {
        assert(ids[i - 1] == (MemberId{0, i}));
    }
    auto locations = table.locations();
    auto kinds = table.kinds();
    assert(locations.size() == 5 && kinds.size() == 5);
    assert(locations[2] == "/sims/3");

    table.remove({MemberId{0, 2}, MemberId{0, 99}, MemberId{0, 2}});
    assert(table.size() == 4);
    assert(!table.contains(MemberId{0, 2}));
    assert(!table.get(MemberId{0, 2}).has_value());

    // Projections stay parallel to the snapshot after compaction
    const auto& snap = table.snapshot();
    ids = table.ids();
    locations = table.locations();
    for (size_t i = 0; i < snap.size(); ++i) {
        assert(snap[i].id == ids[i]);
        assert(snap[i].location == locations[i]);
        assert(*table.position(ids[i]) == i);
    }

    table.remove_all();
    assert(table.size() == 0);
    assert(table.snapshot().empty());
    assert(table.ids().empty());

    std::cout << "  PASS" << std::endl;
}

void test_table_validation() {
    std::cout << "Testing MemberTable validation..." << std::endl;

    FieldLimits limits;
    limits.kind_length = 8;
    limits.location_length = 16;
    MemberTable table(limits);

    table.upsert(MemberId{0, 1}, "Sim", "/short");
    assert(throws<ValidationError>([&] { table.upsert(MemberId{0, 2}, "VeryLongKind", "/short"); }));
    assert(throws<ValidationError>([&] {
        table.upsert(MemberId{0, 1}, "Sim", "/a/location/that/is/too/long");
    }));
    assert(throws<ValidationError>([&] { table.upsert(MemberId{}, "Sim", "/short"); }));
    assert(throws<ValidationError>([&] { table.upsert(MemberId{0, 3}, "", "/short"); }));

    // Nothing was truncated or half-written
    assert(table.size() == 1);
    assert(table.get(MemberId{0, 1})->location == "/short");

    std::cout << "  PASS" << std::endl;
}

void test_table_json() {
    std::cout << "Testing MemberTable JSON encoding..." << std::endl;

    MemberTable table;
    table.upsert(MemberId{0, 1}, "Sim", "/sims/one");
    table.upsert(MemberId{0, 2}, "Group", "/groups/two");

    json j = table.to_json();
    assert(j["format"] == COHORT_TABLE_FORMAT_VERSION);
    assert(j["members"].size() == 2);
    assert(j["members"][1]["kind"] == "Group");

    MemberTable copy = MemberTable::from_json(j);
    assert(copy.snapshot() == table.snapshot());

    json future = j;
    future["format"] = COHORT_TABLE_FORMAT_VERSION + 1;
    assert(throws<ValidationError>([&] { MemberTable::from_json(future); }));

    json bad_id = j;
    bad_id["members"][0]["id"] = "1234";
    assert(throws<ValidationError>([&] { MemberTable::from_json(bad_id); }));

    json missing = j;
    missing["members"][0].erase("location");
    assert(throws<ValidationError>([&] { MemberTable::from_json(missing); }));

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// ObjectCache and WorkerPool
// ═══════════════════════════════════════════════════════════════════════════

void test_object_cache() {
    std::cout << "Testing ObjectCache..." << std::endl;

    ObjectCache cache;
    HandlePtr first = make_member(1, "Sim", "/first");
    HandlePtr second = make_member(1, "Sim", "/second");

    assert(cache.get(first->id()) == nullptr);
    cache.insert(first->id(), nullptr);
    assert(!cache.contains(first->id()));

    cache.insert(first->id(), first);
    cache.insert(first->id(), second);
    assert(cache.get(first->id()) == first);

    cache.replace(first->id(), second);
    assert(cache.get(first->id()) == second);

    cache.erase(first->id());
    assert(cache.size() == 0);

    std::cout << "  PASS" << std::endl;
}

void test_worker_pool() {
    std::cout << "Testing WorkerPool..." << std::endl;

    OverlapGauge gauge;
    std::vector<std::future<int>> results;
    {
        WorkerPool pool(3);
        assert(pool.size() == 3);
        for (int i = 0; i < 12; ++i) {
            results.push_back(pool.submit([i, &gauge]() {
                gauge.enter();
                gauge.wait_for_company();
                std::this_thread::sleep_for(std::chrono::milliseconds(2));
                gauge.leave();
                return i * i;
            }));
        }
        for (int i = 0; i < 12; ++i) {
            assert(results[i].get() == i * i);
        }
    }
    assert(gauge.peak() >= 2);
    assert(gauge.peak() <= 3);

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// Catalog
// ═══════════════════════════════════════════════════════════════════════════

void test_catalog_add() {
    std::cout << "Testing Catalog add..." << std::endl;

    Fixture f;
    assert(f.catalog.size() == 3);
    assert(f.catalog.ids() == (std::vector<MemberId>{f.a->id(), f.b->id(), f.c->id()}));
    assert(f.catalog.kinds() == (std::vector<std::string>{"Sim", "Sim", "Group"}));
    assert(f.catalog.cache_size() == 0);  // add never resolves

    // Re-adding refreshes the location only
    f.catalog.add(make_member(2, "Sim", "/archive/b"));
    assert(f.catalog.size() == 3);
    assert(f.catalog.locations()[1] == "/archive/b");

    // Absent arguments are skipped; nested collections flatten
    HandlePtr d = make_member(4, "Sim", "/data/sims/d");
    HandlePtr e = make_member(5, "Sim", "/data/sims/e");
    f.client->place(d);
    f.client->place(e);
    f.catalog.add(nullptr, HandlePtr(), std::vector<MemberArg>{d, std::vector<MemberArg>{e, nullptr}});
    assert(f.catalog.size() == 5);
    assert(f.catalog.ids()[4] == e->id());

    // Locations are stored normalised
    f.catalog.add(make_member(6, "Sim", "/data/sims/../sims/f/"));
    assert(f.catalog.locations()[5] == "/data/sims/f");

    std::cout << "  PASS" << std::endl;
}

void test_catalog_add_location() {
    std::cout << "Testing Catalog add by location..." << std::endl;

    auto client = std::make_shared<ScriptedClient>();
    HandlePtr x = make_member(10, "Sim", "/data/run/x");
    HandlePtr y = make_member(11, "Sim", "/data/run/y");
    client->directories["/data/run"] = {x, y};
    client->directories["/data/run/x"] = {x};

    Catalog catalog(client);
    catalog.add("/data/run");
    assert(catalog.size() == 2);

    catalog.add(std::string("/data/run/x"));
    assert(catalog.size() == 2);

    catalog.add("/data/nothing/here");
    assert(catalog.size() == 2);

    // Another catalog flattens into its members
    client->place(x);
    client->place(y);
    Catalog other(client);
    HandlePtr z = make_member(12, "Group", "/data/z");
    client->place(z);
    other.add(z, catalog);
    assert(other.size() == 3);
    assert(other.ids()[1] == x->id());

    // A const catalog can be added too; its own cache is left alone
    const Catalog& frozen = catalog;
    size_t cached = frozen.cache_size();
    Catalog third(client);
    third.add(frozen);
    assert(third.ids() == catalog.ids());
    assert(frozen.cache_size() == cached);

    std::cout << "  PASS" << std::endl;
}

void test_catalog_remove() {
    std::cout << "Testing Catalog remove..." << std::endl;

    Fixture f;
    f.catalog.list();
    assert(f.catalog.cache_size() == 3);

    // Ordinals are 0-based against current order
    f.catalog.remove(1);
    assert(f.catalog.size() == 2);
    assert(f.catalog.contains(f.a));
    assert(!f.catalog.contains(f.b));
    assert(f.catalog.contains(f.c));
    assert(f.catalog.cache_size() == 2);

    f.catalog.remove(f.c);
    assert(f.catalog.size() == 1);
    assert(f.catalog.ids()[0] == f.a->id());

    // Untracked handles are ignored; bad arguments change nothing
    f.catalog.remove(make_member(99, "Sim", "/nowhere"));
    assert(f.catalog.size() == 1);
    assert(throws<InvalidArgument>([&] { f.catalog.remove(HandlePtr()); }));
    assert(throws<InvalidArgument>([&] { f.catalog.remove(0, 5); }));
    assert(f.catalog.size() == 1);

    f.catalog.add(f.b, f.c);
    f.catalog.remove(-1, 0);
    assert(f.catalog.size() == 1);
    assert(f.catalog.ids()[0] == f.b->id());

    f.catalog.remove_all();
    assert(f.catalog.size() == 0);
    assert(f.catalog.empty());
    assert(f.catalog.cache_size() == 0);
    assert(f.catalog.table().snapshot().empty());

    std::cout << "  PASS" << std::endl;
}

void test_catalog_list_resolution() {
    std::cout << "Testing Catalog list resolution..." << std::endl;

    Fixture f;
    auto members = f.catalog.list();
    assert(f.client->resolve_calls == 1);
    assert(f.client->last_pending == 3);
    assert(f.client->found_at_hint == 3);
    assert(members.size() == f.catalog.size());

    auto ids = f.catalog.ids();
    for (size_t i = 0; i < members.size(); ++i) {
        assert(members[i]->id() == ids[i]);
    }

    // Second pass is served from the cache
    auto again = f.catalog.list();
    assert(f.client->resolve_calls == 1);
    assert(again[2] == members[2]);

    // Only the uncached member is asked for
    HandlePtr d = make_member(4, "Sim", "/data/sims/d");
    f.client->place(d);
    f.catalog.add(d);
    auto four = f.catalog.list();
    assert(f.client->resolve_calls == 2);
    assert(f.client->last_pending == 1);
    assert(four[3] == d);

    std::cout << "  PASS" << std::endl;
}

void test_catalog_self_heal() {
    std::cout << "Testing Catalog self-healing locations..." << std::endl;

    Fixture f;
    // b moved on disk since it was added
    HandlePtr moved = make_member(2, "Sim", "/scratch/moved/b", std::string("beta"));
    f.client->place(moved);

    auto members = f.catalog.list();
    assert(members[1] == moved);
    assert(f.catalog.locations()[1] == "/scratch/moved/b");
    assert(f.catalog.locations()[0] == "/data/sims/a");
    assert(f.client->found_at_hint == 2);

    // A new location that does not fit the table keeps the old row and is
    // not cached, so the correction is attempted again next time
    CatalogConfig cfg;
    cfg.limits.location_length = 24;
    auto client = std::make_shared<ScriptedClient>();
    HandlePtr m = make_member(7, "Sim", "/data/m", std::string("mu"));
    client->place(m);
    Catalog narrow(client, cfg);
    narrow.add(m);

    HandlePtr far = make_member(7, "Sim", "/scratch/a/very/deep/tree/m", std::string("mu"));
    client->place(far);
    auto found = narrow.list();
    assert(found[0] == far);
    assert(narrow.locations()[0] == "/data/m");
    assert(narrow.cache_size() == 0);
    assert(narrow.names()[0] == std::optional<std::string>("mu"));
    assert(narrow.repr() == "<Catalog([<Sim: mu>])>");
    assert(client->resolve_calls == 3);

    HandlePtr near = make_member(7, "Sim", "/scratch/m", std::string("mu"));
    client->place(near);
    assert(narrow.list()[0] == near);
    assert(narrow.locations()[0] == "/scratch/m");
    assert(narrow.cache_size() == 1);
    narrow.list();
    assert(client->resolve_calls == 4);

    std::cout << "  PASS" << std::endl;
}

void test_catalog_missing_member() {
    std::cout << "Testing Catalog missing member..." << std::endl;

    Fixture f;
    f.client->vanish(f.b->id());
    auto before = f.catalog.table().snapshot();

    bool raised = false;
    try {
        f.catalog.list();
    } catch (const MemberNotFound& e) {
        raised = true;
        assert(e.position() == 1);
        assert(e.id() == f.b->id());
        assert(std::string(e.what()).find(f.b->id().to_string()) != std::string::npos);
    }
    assert(raised);
    assert(f.catalog.table().snapshot() == before);
    assert(f.catalog.cache_size() == 0);

    assert(throws<MemberNotFound>([&] { f.catalog.at(1); }));
    assert(f.catalog.at(0) == f.a);

    // Metadata listing tolerates the hole
    auto names = f.catalog.names();
    assert(names.size() == 3);
    assert(names[0] == std::optional<std::string>("alpha"));
    assert(!names[1].has_value());
    assert(names[2] == std::optional<std::string>("gamma"));
    assert(f.catalog.repr().find("<missing: " + f.b->id().to_string() + ">") != std::string::npos);

    // Missing members are looked for again on the next call
    f.client->place(f.b);
    assert(f.catalog.list().size() == 3);
    assert(f.catalog.names()[1] == std::optional<std::string>("beta"));

    std::cout << "  PASS" << std::endl;
}

void test_catalog_permission_swallowed() {
    std::cout << "Testing Catalog refresh permission failure..." << std::endl;

    Fixture f;
    auto mirror = std::make_shared<RecordingMirror>();
    f.catalog.set_mirror(mirror);

    HandlePtr d = make_member(4, "Sim", "/data/sims/d");
    f.client->place(d);
    f.catalog.add(d);
    assert(mirror->upserts == 1);

    HandlePtr moved = make_member(1, "Sim", "/scratch/a", std::string("alpha"));
    f.client->place(moved);
    mirror->deny = true;

    auto members = f.catalog.list();
    assert(members.size() == 4);
    assert(members[0] == moved);
    assert(f.catalog.locations()[0] == "/scratch/a");

    // add() surfaces the same failure
    assert(throws<PermissionDenied>([&] { f.catalog.add(make_member(5, "Sim", "/data/e")); }));

    mirror->deny = false;
    f.catalog.remove(0);
    assert(mirror->removes == 1);
    f.catalog.remove_all();
    assert(mirror->clears == 1);

    // Copies do not write through to the source catalog's store
    f.catalog.add(d);
    size_t upserts = mirror->upserts;
    Catalog copy = f.catalog;
    copy.add(make_member(6, "Sim", "/data/g"));
    assert(mirror->upserts == upserts);
    assert(copy.size() == f.catalog.size() + 1);

    std::cout << "  PASS" << std::endl;
}

void test_catalog_index_and_slice() {
    std::cout << "Testing Catalog index/slice..." << std::endl;

    Fixture f;
    assert(f.catalog.at(0) == f.a);
    assert(f.catalog[-1] == f.c);
    assert(f.client->last_pending == 1);
    assert(throws<std::out_of_range>([&] { f.catalog.at(3); }));
    assert(throws<std::out_of_range>([&] { f.catalog.at(-4); }));

    Catalog head = f.catalog.slice(0, 2);
    assert(head.size() == 2);
    assert(head.ids() == (std::vector<MemberId>{f.a->id(), f.b->id()}));
    assert(f.catalog.size() == 3);

    Catalog reversed = f.catalog.slice(std::nullopt, std::nullopt, -1);
    assert(reversed.ids() == (std::vector<MemberId>{f.c->id(), f.b->id(), f.a->id()}));

    Catalog odd = f.catalog.slice(1, 100);
    assert(odd.size() == 2);
    assert(odd.ids()[0] == f.b->id());

    assert(f.catalog.slice(5, std::nullopt).empty());
    assert(f.catalog.slice(-2, std::nullopt, 2).ids() == (std::vector<MemberId>{f.b->id()}));
    assert(throws<InvalidArgument>([&] { f.catalog.slice(0, 3, 0); }));

    std::cout << "  PASS" << std::endl;
}

void test_catalog_map_order() {
    std::cout << "Testing Catalog map ordering..." << std::endl;

    auto client = std::make_shared<ScriptedClient>();
    Catalog catalog(client);
    for (uint64_t i = 1; i <= 24; ++i) {
        HandlePtr h = make_member(i, "Sim", "/sims/" + std::to_string(i));
        client->place(h);
        catalog.add(h);
    }

    // Later members finish first
    auto fn = [](const HandlePtr& h) {
        std::this_thread::sleep_for(std::chrono::microseconds(50 * (25 - h->id().low)));
        return h->location();
    };

    std::vector<std::string> expected;
    for (const auto& m : catalog.list()) expected.push_back(fn(m));

    assert(catalog.map(fn, 1) == expected);
    assert(catalog.map(fn, 4) == expected);
    assert(catalog.map(fn, 64) == expected);
    assert(catalog.map(fn, 0) == expected);

    // With several workers, tasks run side by side
    OverlapGauge gauge;
    auto overlapping = [&gauge](const HandlePtr& h) {
        gauge.enter();
        gauge.wait_for_company();
        gauge.leave();
        return h->location();
    };
    assert(catalog.map(overlapping, 4) == expected);
    assert(gauge.peak() > 1);
    assert(gauge.peak() <= 4);

    OverlapGauge serial;
    auto alone = [&serial](const HandlePtr& h) {
        serial.enter();
        serial.leave();
        return h->location();
    };
    assert(catalog.map(alone, 1) == expected);
    assert(serial.peak() == 1);

    // Extra arguments are passed through to every call
    auto tag = [](const HandlePtr& h, const std::string& prefix, int n) {
        return prefix + std::to_string(h->id().low * n);
    };
    auto tagged = catalog.map(tag, 4, std::string("m"), 10);
    assert(tagged.front() == "m10");
    assert(tagged.back() == "m240");

    std::cout << "  PASS" << std::endl;
}

void test_catalog_map_failure() {
    std::cout << "Testing Catalog map failure..." << std::endl;

    Fixture f;
    auto fn = [](const HandlePtr& h) -> int {
        if (h->kind() == "Group") throw std::runtime_error("cannot process groups");
        return static_cast<int>(h->id().low);
    };

    assert(throws<std::runtime_error>([&] { f.catalog.map(fn, 1); }));
    assert(throws<std::runtime_error>([&] { f.catalog.map(fn, 4); }));

    // A missing member fails the map before any work runs
    std::atomic<int> calls{0};
    f.client->vanish(f.a->id());
    f.catalog.clear_cache();
    assert(throws<MemberNotFound>([&] {
        f.catalog.map([&calls](const HandlePtr&) { return ++calls; }, 4);
    }));
    assert(calls.load() == 0);

    std::cout << "  PASS" << std::endl;
}

void test_catalog_repr() {
    std::cout << "Testing Catalog repr..." << std::endl;

    Fixture f;
    HandlePtr nameless = make_member(4, "Sim", "/data/sims/n");
    f.client->place(nameless);
    f.catalog.add(nameless);

    std::string r = f.catalog.repr();
    assert(r.rfind("<Catalog([<Sim: alpha>, <Sim: beta>, <Group: gamma>, ", 0) == 0);
    assert(r.find("<Sim: " + nameless->id().to_string() + ">") != std::string::npos);

    Catalog empty(f.client);
    assert(empty.repr() == "<Catalog([])>");
    assert(throws<InvalidArgument>([] { Catalog c(nullptr); }));

    std::cout << "  PASS" << std::endl;
}

int main() {
    std::cout << "=== Cohort C++ Tests ===" << std::endl;
    std::cout << "Version " << COHORT_VERSION << std::endl;
    std::cout << std::endl;

    test_member_id();
    test_config();

    test_table_upsert_idempotent();
    test_table_order_and_removal();
    test_table_validation();
    test_table_json();

    test_object_cache();
    test_worker_pool();

    std::cout << std::endl;
    std::cout << "=== Catalog Tests ===" << std::endl;
    test_catalog_add();
    test_catalog_add_location();
    test_catalog_remove();
    test_catalog_list_resolution();
    test_catalog_self_heal();
    test_catalog_missing_member();
    test_catalog_permission_swallowed();
    test_catalog_index_and_slice();
    test_catalog_map_order();
    test_catalog_map_failure();
    test_catalog_repr();

    std::cout << std::endl;
    std::cout << "=== All tests passed! ===" << std::endl;
    return 0;
}
