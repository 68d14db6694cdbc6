#pragma once

#include "Vector2.hpp"
#include <cstddef>
#include <deque>

// A point mass with a bounded history of its recent positions.
// The trail is stored newest first; front() is the position before the latest advance().
class Body
{
public:
    Body(const Vector2& position, const Vector2& velocity, double mass, size_t trailCapacity = 60);

    // velocity += f
    void applyForce(const Vector2& f) { m_velocity += f; }

    // Records the current position in the trail, then moves by one velocity step.
    // Dead bodies do neither.
    void advance();

    void kill() { m_dead = true; }
    bool isDead() const { return m_dead; }

    const Vector2& position() const { return m_position; }
    const Vector2& velocity() const { return m_velocity; }
    double mass() const { return m_mass; }
    const std::deque<Vector2>& trail() const { return m_trail; }
    size_t trailCapacity() const { return m_trailCapacity; }

    // Visual radius in world units: never smaller than 2 screen pixels at the given zoom.
    double radius(double zoom) const;

private:
    Vector2 m_position;
    Vector2 m_velocity;
    double m_mass;
    size_t m_trailCapacity;
    std::deque<Vector2> m_trail;
    bool m_dead;
};
