#include "observer_route.h"

#include <glm/geometric.hpp>

namespace Bastion
{
    ObserverRoute::ObserverRoute(const WorldVec3 &start)
        : _position(start)
    {
    }

    ObserverRoute &ObserverRoute::walk_to(const WorldVec3 &target, double speed_mps)
    {
        Leg leg{};
        leg.type = Leg::Type::Walk;
        leg.target = target;
        leg.speed_mps = speed_mps;
        _legs.push_back(leg);
        return *this;
    }

    ObserverRoute &ObserverRoute::teleport_to(const WorldVec3 &target)
    {
        Leg leg{};
        leg.type = Leg::Type::Teleport;
        leg.target = target;
        _legs.push_back(leg);
        return *this;
    }

    ObserverRoute &ObserverRoute::hold(double duration_s)
    {
        Leg leg{};
        leg.type = Leg::Type::Hold;
        leg.duration_s = duration_s;
        _legs.push_back(leg);
        return *this;
    }

    ObserverRoute &ObserverRoute::oscillate(const WorldVec3 &a, const WorldVec3 &b, double duration_s)
    {
        Leg leg{};
        leg.type = Leg::Type::Oscillate;
        leg.target = a;
        leg.alt_target = b;
        leg.duration_s = duration_s;
        _legs.push_back(leg);
        return *this;
    }

    void ObserverRoute::next_leg()
    {
        ++_leg;
        _leg_time = 0.0;
        _osc_flip = false;
    }

    const WorldVec3 &ObserverRoute::step(double dt)
    {
        if (finished())
        {
            return _position;
        }

        const Leg &leg = _legs[_leg];
        _leg_time += dt;

        switch (leg.type)
        {
            case Leg::Type::Walk:
            {
                const WorldVec3 to_target = leg.target - _position;
                const double remaining = glm::length(to_target);
                const double travel = leg.speed_mps * dt;
                if (leg.speed_mps <= 0.0 || remaining <= travel)
                {
                    _position = leg.target;
                    next_leg();
                }
                else
                {
                    _position += to_target * (travel / remaining);
                }
                break;
            }
            case Leg::Type::Teleport:
                _position = leg.target;
                next_leg();
                break;
            case Leg::Type::Hold:
                if (_leg_time >= leg.duration_s)
                {
                    next_leg();
                }
                break;
            case Leg::Type::Oscillate:
                _position = _osc_flip ? leg.alt_target : leg.target;
                _osc_flip = !_osc_flip;
                if (_leg_time >= leg.duration_s)
                {
                    next_leg();
                }
                break;
        }
        return _position;
    }

    ObserverRoute make_demo_route(double chunk_size_m)
    {
        const double s = chunk_size_m;
        const double speed = s * 0.75; // three quarters of a chunk per second

        ObserverRoute route(WorldVec3(s * 0.5, 0.0, s * 0.5));
        route.hold(1.0)
            .walk_to(WorldVec3(s * 3.5, 0.0, s * 0.5), speed)
            .oscillate(WorldVec3(s * 3.0 - 1.0, 0.0, s * 0.5), WorldVec3(s * 3.0 + 1.0, 0.0, s * 0.5), 2.0)
            .teleport_to(WorldVec3(s * 8.5, 0.0, s * 0.5))
            .hold(2.0)
            .walk_to(WorldVec3(s * 0.5, 0.0, s * 0.5), speed * 4.0)
            .hold(1.0);
        return route;
    }
} // namespace Bastion
