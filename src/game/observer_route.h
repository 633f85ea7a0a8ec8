#pragma once

#include <core/world.h>

#include <cstddef>
#include <vector>

namespace Bastion
{
    // Scripted observer movement for headless runs: a list of legs played in order.
    class ObserverRoute
    {
    public:
        struct Leg
        {
            enum class Type
            {
                Walk,      // straight line to target at speed_mps
                Teleport,  // jump to target instantly
                Hold,      // stand still for duration_s
                Oscillate, // alternate between target and alt_target every step for duration_s
            };

            Type type = Type::Hold;
            WorldVec3 target{0.0};
            WorldVec3 alt_target{0.0};
            double speed_mps = 0.0;
            double duration_s = 0.0;
        };

        ObserverRoute() = default;
        explicit ObserverRoute(const WorldVec3 &start);

        ObserverRoute &walk_to(const WorldVec3 &target, double speed_mps);
        ObserverRoute &teleport_to(const WorldVec3 &target);
        ObserverRoute &hold(double duration_s);
        ObserverRoute &oscillate(const WorldVec3 &a, const WorldVec3 &b, double duration_s);

        // Advance by dt and return the new position. Stays at the last position once finished.
        const WorldVec3 &step(double dt);

        const WorldVec3 &position() const { return _position; }
        bool finished() const { return _leg >= _legs.size(); }
        size_t leg_index() const { return _leg; }
        const std::vector<Leg> &legs() const { return _legs; }

    private:
        void next_leg();

        std::vector<Leg> _legs;
        size_t _leg = 0;
        double _leg_time = 0.0;
        bool _osc_flip = false;
        WorldVec3 _position{0.0};
    };

    // Walk across a few chunks, dither on a chunk border, teleport away, come back.
    ObserverRoute make_demo_route(double chunk_size_m);
} // namespace Bastion
