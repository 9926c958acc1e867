#pragma once
// Cohort: in-memory catalog of tracked members
//
// - Types: MemberId, MemberRecord, Handle
// - MemberTable: id-keyed rows of (kind, location)
// - ObjectCache: live handles resolved so far
// - ResolutionClient / TableMirror: what the caller plugs in
// - Catalog: ordered, indexable, self-healing collection
// - ParallelMapper: order-preserving map over members

#include "version.hpp"
#include "types.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "config.hpp"
#include "member_table.hpp"
#include "object_cache.hpp"
#include "resolver.hpp"
#include "worker_pool.hpp"
#include "parallel_mapper.hpp"
#include "catalog.hpp"
