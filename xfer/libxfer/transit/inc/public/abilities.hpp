#ifndef XFER_TRANSIT_ABILITIES_HPP_
#define XFER_TRANSIT_ABILITIES_HPP_

namespace xfer::transit
{
struct Abilities
{
    bool direct_tcp_v1 {};
    bool relay_v1 {};

    static constexpr Abilities all()
    {
        return Abilities {true, true};
    }

    static constexpr Abilities force_direct()
    {
        return Abilities {true, false};
    }

    static constexpr Abilities force_relay()
    {
        return Abilities {false, true};
    }

    [[nodiscard]] bool can_direct() const
    {
        return direct_tcp_v1;
    }

    [[nodiscard]] bool can_relay() const
    {
        return relay_v1;
    }

    bool operator==(const Abilities &rhs) const
    {
        return direct_tcp_v1 == rhs.direct_tcp_v1 && relay_v1 == rhs.relay_v1;
    }

    bool operator!=(const Abilities &rhs) const
    {
        return !(*this == rhs);
    }
};
}  // namespace xfer::transit

#endif  // XFER_TRANSIT_ABILITIES_HPP_
