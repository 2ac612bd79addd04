#pragma once

#include <memory>
#include <mutex>
#include <type_traits>

#include "gidkit/core/clock.hpp"
#include "gidkit/core/errors.hpp"
#include "gidkit/core/types.hpp"

namespace gidkit::ids {
    using u32 = gidkit::core::u32;
    using u64 = gidkit::core::u64;
    using i64 = gidkit::core::i64;

    // 2024-01-01T00:00:00Z in Unix milliseconds.
    inline constexpr i64 kSnowflakeEpochMs = 1704067200000;

    inline constexpr u32 kTimestampBits = 41;
    inline constexpr u32 kMachineTagBits = 10;
    inline constexpr u32 kSequenceBits = 12;

    inline constexpr u32 kMaxMachineTag = (1u << kMachineTagBits) - 1u; // 1023
    inline constexpr u32 kMaxSequence = (1u << kSequenceBits) - 1u;     // 4095

    inline constexpr u32 kTimestampShift = kMachineTagBits + kSequenceBits;
    inline constexpr u32 kMachineTagShift = kSequenceBits;

    [[nodiscard]] constexpr u64 snowflake_compose(i64 rel_ms, u32 machine_tag, u32 sequence) noexcept {
        return (static_cast<u64>(rel_ms) << kTimestampShift) |
               (static_cast<u64>(machine_tag & kMaxMachineTag) << kMachineTagShift) |
               static_cast<u64>(sequence & kMaxSequence);
    }

    // Milliseconds since kSnowflakeEpochMs.
    [[nodiscard]] constexpr i64 snowflake_timestamp_ms(u64 id) noexcept {
        return static_cast<i64>(id >> kTimestampShift);
    }

    [[nodiscard]] constexpr gidkit::core::UnixMillis snowflake_unix_ms(u64 id) noexcept {
        return snowflake_timestamp_ms(id) + kSnowflakeEpochMs;
    }

    [[nodiscard]] constexpr u32 snowflake_machine_tag(u64 id) noexcept {
        return static_cast<u32>((id >> kMachineTagShift) & kMaxMachineTag);
    }

    [[nodiscard]] constexpr u32 snowflake_sequence(u64 id) noexcept {
        return static_cast<u32>(id & kMaxSequence);
    }

    struct IdGeneratorConfig {
        u32 machine_tag{0};
        gidkit::core::Clock clock{gidkit::core::system_clock()};
    };

    // Time-ordered 64-bit id source: 41 bits of milliseconds since the epoch,
    // 10 bits of machine tag, 12 bits of per-millisecond sequence.
    //
    // One instance per machine tag per process. Two live generators sharing a
    // tag can hand out the same id; nothing here detects that.
    class IdGenerator {
    public:
        // (Ids, InvalidMachineTag) if cfg.machine_tag > kMaxMachineTag.
        static gidkit::core::Status create(const IdGeneratorConfig& cfg,
            std::unique_ptr<IdGenerator>* out) noexcept;

        IdGenerator(const IdGenerator&) = delete;
        IdGenerator& operator=(const IdGenerator&) = delete;

        // Serialized across callers. Spins while holding the lock when the
        // 4096 sequence values of the current millisecond are used up.
        //
        // A clock that steps backward resets the sequence and proceeds, so
        // ids issued after the step can sort below earlier ones.
        [[nodiscard]] u64 generate() noexcept;

        [[nodiscard]] u32 machine_tag() const noexcept { return machine_tag_; }

    private:
        IdGenerator(u32 machine_tag, gidkit::core::Clock clock) noexcept;

        [[nodiscard]] i64 now_rel_ms() const noexcept;

        static constexpr i64 kNever = -1;

        const u32 machine_tag_;
        const gidkit::core::Clock clock_;

        std::mutex mutex_;
        i64 last_ms_{kNever};
        u32 sequence_{0};
    };

    static_assert(std::is_trivially_copyable_v<IdGeneratorConfig>);
    static_assert(snowflake_machine_tag(snowflake_compose(5, 1023, 7)) == 1023);
    static_assert(snowflake_sequence(snowflake_compose(5, 1023, 7)) == 7);
    static_assert(snowflake_timestamp_ms(snowflake_compose(5, 1023, 7)) == 5);

} // namespace gidkit::ids
