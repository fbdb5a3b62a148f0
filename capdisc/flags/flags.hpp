#pragma once

#include <cstdint>
#include <type_traits>

namespace capdisc
{

/**
 * Bit set indexed by an enum. Not synchronized: owners guard it with their own mutex.
 */
template <typename FlagType>
class Flags
{
    static_assert(std::is_enum<FlagType>::value, "FlagType must be an enum");

public:
    Flags() = default;

    void set_flag(FlagType flag) { _flags |= bit(flag); }

    void clear_flag(FlagType flag) { _flags &= ~bit(flag); }

    bool get_flag(FlagType flag) const { return (_flags & bit(flag)) != 0; }

    /// True when none of the given flags is set.
    template <typename... Rest>
    bool none_of(FlagType flag, Rest... rest) const
    {
        return !get_flag(flag) && none_of(rest...);
    }

    void clear_all() { _flags = 0; }

private:
    bool none_of() const { return true; }

    static uint32_t bit(FlagType flag) { return 1U << static_cast<uint32_t>(flag); }

    uint32_t _flags = 0;
};
} // namespace capdisc
