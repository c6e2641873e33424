#ifndef NUMSCULL_VERSION_HPP
#define NUMSCULL_VERSION_HPP

namespace Numscull {

    // Protocol version announced in control/init unless configured otherwise.
    constexpr char DEFAULT_PROTOCOL_VERSION[] = "0.2.4";

}  // namespace Numscull

#endif  // NUMSCULL_VERSION_HPP
