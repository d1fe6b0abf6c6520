#pragma once

#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "behavior/definition.hpp"
#include "orbital/context.hpp"
#include "orbital/profile.hpp"

namespace behavior {

struct pending_event {
    std::string event;
    orbital::value payload;
};

// Live state of one behavior applied to one entity. The definition is shared and
// must outlive the instance.
struct instance : std::enable_shared_from_this<instance> {
    explicit instance(const definition* definition_ptr = nullptr);

    const definition* def = nullptr;
    std::int64_t instance_handle = 0;

    std::shared_ptr<orbital::entity_store> entity;
    std::string state;
    orbital::value config;
    // "config" plus host-provided singletons.
    std::shared_ptr<const orbital::singleton_map> singletons;
    orbital::value user;

    // Held for the whole of a dispatch or tick pass.
    std::mutex transaction;
    // Guards in_transaction and pending. Declared events emitted while a transaction
    // is in flight are queued and drained before it ends.
    std::mutex queue_mutex;
    bool in_transaction = false;
    std::deque<pending_event> pending;

    // Index-aligned with def->ticks; starts at the creation time.
    std::vector<std::int64_t> tick_last_run_ms;

    orbital::dispatch_profile_stats stats{};
};

std::string dump_stats(const instance& inst);
std::string dump_entity(const instance& inst);

}  // namespace behavior
