#include "Body.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

Body::Body(const Vector2& position, const Vector2& velocity, double mass, size_t trailCapacity)
    : m_position(position),
      m_velocity(velocity),
      m_mass(mass),
      m_trailCapacity(trailCapacity),
      m_dead(false)
{
    if (!(mass > 0.0)) {
        throw std::invalid_argument("Body mass must be positive");
    }
}

void Body::advance()
{
    if (m_dead) return;

    m_trail.push_front(m_position);
    while (m_trail.size() > m_trailCapacity) {
        m_trail.pop_back();
    }

    m_position += m_velocity;
}

double Body::radius(double zoom) const
{
    return std::max(std::sqrt(m_mass), 2.0 / zoom);
}
