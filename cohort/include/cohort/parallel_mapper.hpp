#pragma once
// Parallel Mapper: apply a function to every member
//
// concurrency == 1 runs in member order on the calling thread.
// concurrency  > 1 queues one task per member on a WorkerPool, waits for
// all of them, then reorders the results to member order. Results never
// depend on completion order or on the number of workers.

#include "errors.hpp"
#include "log.hpp"
#include "types.hpp"
#include "worker_pool.hpp"
#include <algorithm>
#include <future>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

namespace cohort {

class ParallelMapper {
public:
    template <typename F, typename... Args>
    using result_of_t = std::invoke_result_t<F&, const HandlePtr&, const Args&...>;

    explicit ParallelMapper(bool verbose = false) : verbose_(verbose) {}

    template <typename F, typename... Args>
    std::vector<result_of_t<F, Args...>> map(const std::vector<HandlePtr>& members,
                                             F fn,
                                             size_t concurrency,
                                             const Args&... args) const {
        using R = result_of_t<F, Args...>;
        static_assert(!std::is_void_v<R>, "mapped function must return a value");

        for (const auto& m : members) {
            if (!m) throw InvalidArgument("cannot map over an absent member");
        }

        std::vector<R> results;
        results.reserve(members.size());

        if (concurrency <= 1 || members.size() <= 1) {
            for (const auto& m : members) {
                results.push_back(fn(m, args...));
            }
            return results;
        }

        size_t workers = std::min(concurrency, members.size());
        log::detail(verbose_, "ParallelMapper",
                    "Mapping " + std::to_string(members.size()) + " members on " +
                    std::to_string(workers) + " workers");

        std::vector<std::future<R>> pending;
        pending.reserve(members.size());
        {
            WorkerPool pool(workers);
            // Fan out everything before waiting on anything
            for (const auto& m : members) {
                pending.push_back(pool.submit([fn, m, args...]() mutable {
                    return fn(std::as_const(m), std::as_const(args)...);
                }));
            }
            for (auto& f : pending) f.wait();
        }

        // Gather keyed by member, then project back to member order.
        // The first failure in member order wins.
        std::unordered_map<MemberId, R, MemberIdHash> by_id;
        by_id.reserve(members.size());
        for (size_t i = 0; i < members.size(); ++i) {
            by_id.emplace(members[i]->id(), pending[i].get());
        }
        for (const auto& m : members) {
            auto it = by_id.find(m->id());
            results.push_back(std::move(it->second));
        }
        return results;
    }

private:
    bool verbose_;
};

} // namespace cohort
