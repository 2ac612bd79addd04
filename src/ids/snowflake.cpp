#include "gidkit/ids/snowflake.hpp"

#include <new>

namespace gidkit::ids {
    IdGenerator::IdGenerator(u32 machine_tag, gidkit::core::Clock clock) noexcept
        : machine_tag_(machine_tag), clock_(clock) {}

    gidkit::core::Status IdGenerator::create(const IdGeneratorConfig& cfg,
        std::unique_ptr<IdGenerator>* out) noexcept {
        if (out == nullptr || !gidkit::core::clock_valid(cfg.clock)) {
            return gidkit::core::make_status(gidkit::core::StatusDomain::Ids, gidkit::core::StatusCode::Invalid);
        }
        if (cfg.machine_tag > kMaxMachineTag) {
            return gidkit::core::make_status(gidkit::core::StatusDomain::Ids,
                gidkit::core::StatusCode::InvalidMachineTag, cfg.machine_tag);
        }

        IdGenerator* gen = new (std::nothrow) IdGenerator(cfg.machine_tag, cfg.clock);
        if (gen == nullptr) {
            return gidkit::core::make_status(gidkit::core::StatusDomain::Ids, gidkit::core::StatusCode::OutOfMemory);
        }
        out->reset(gen);
        return gidkit::core::ok_status();
    }

    i64 IdGenerator::now_rel_ms() const noexcept {
        return gidkit::core::clock_now(clock_) - kSnowflakeEpochMs;
    }

    u64 IdGenerator::generate() noexcept {
        std::lock_guard<std::mutex> lock(mutex_);

        i64 now = now_rel_ms();

        if (now == last_ms_) {
            sequence_ = (sequence_ + 1u) & kMaxSequence;
            if (sequence_ == 0) {
                // Sequence space for this millisecond is exhausted.
                while (now <= last_ms_) {
                    now = now_rel_ms();
                }
            }
        } else {
            sequence_ = 0;
        }

        last_ms_ = now;
        return snowflake_compose(now, machine_tag_, sequence_);
    }
} // namespace gidkit::ids
