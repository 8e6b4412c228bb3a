//
// Position in the source change stream
//

#ifndef OPLOGSYNC_CHECKPOINT_TIMESTAMP_HPP
#define OPLOGSYNC_CHECKPOINT_TIMESTAMP_HPP

#include <cstdint>
#include <string>
#include <tuple>

#include <fmt/format.h>

namespace oplogsync::checkpoint {
    /**
     * (epoch seconds, per-second counter), ordered lexicographically.
     * persisted as one 64-bit integer: seconds in the high 32 bits, counter in the low 32 bits.
     */
    struct Timestamp {
        uint32_t seconds = 0;
        uint32_t increment = 0;

        Timestamp() = default;
        Timestamp(uint32_t seconds, uint32_t increment):
            seconds(seconds),
            increment(increment)
        {
        }

        static Timestamp fromInt64(uint64_t value) {
            return Timestamp(
                static_cast<uint32_t>(value >> 32),
                static_cast<uint32_t>(value & 0xffffffffULL)
            );
        }

        uint64_t toInt64() const {
            return (static_cast<uint64_t>(seconds) << 32) | increment;
        }

        std::string toString() const {
            return fmt::format("Timestamp({}, {})", seconds, increment);
        }

        bool operator==(const Timestamp &other) const {
            return seconds == other.seconds && increment == other.increment;
        }

        bool operator!=(const Timestamp &other) const {
            return !(*this == other);
        }

        bool operator<(const Timestamp &other) const {
            return std::tie(seconds, increment) < std::tie(other.seconds, other.increment);
        }
    };
}

#endif //OPLOGSYNC_CHECKPOINT_TIMESTAMP_HPP
