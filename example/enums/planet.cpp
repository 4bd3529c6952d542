/**
 * Examples for ordinal::enums with values that carry their own data
 *
 * Planets have a mass and a radius and compute their surface gravity. The
 * value constructor is private, so only the enumeration can create planets.
 */

#include <spdlog/spdlog.h>

#include "ordinal/enums/enum.hpp"

using namespace ordinal::enums;

class Planet : public Val {
public:
    static constexpr double G = 6.67300E-11;

    [[nodiscard]] double mass() const { return mass_; }
    [[nodiscard]] double radius() const { return radius_; }
    [[nodiscard]] double surfaceGravity() const {
        return G * mass_ / (radius_ * radius_);
    }
    [[nodiscard]] double surfaceWeight(double otherMass) const {
        return otherMass * surfaceGravity();
    }

private:
    friend class Enum<Planet>;

    Planet(double mass, double radius) : mass_(mass), radius_(radius) {}

    double mass_;
    double radius_;
};

class PlanetEnum : public Enum<Planet> {
public:
    PlanetEnum() : Enum({.name = "Planet"}) {}

    const Planet& Mercury = declare("Mercury", 3.303e+23, 2.4397e6);
    const Planet& Venus = declare("Venus", 4.869e+24, 6.0518e6);
    const Planet& Earth = declare("Earth", 5.976e+24, 6.37814e6);
    const Planet& Mars = declare("Mars", 6.421e+23, 3.3972e6);
    const Planet& Jupiter = declare("Jupiter", 1.9e+27, 7.1492e7);
    const Planet& Saturn = declare("Saturn", 5.688e+26, 6.0268e7);
    const Planet& Uranus = declare("Uranus", 8.686e+25, 2.5559e7);
    const Planet& Neptune = declare("Neptune", 1.024e+26, 2.4746e7);
};

int main() {
    spdlog::set_level(spdlog::level::debug);
    PlanetEnum planets;

    const double earthWeight = 175.0;
    const double mass = earthWeight / planets.Earth.surfaceGravity();

    spdlog::info("=== Weight of a {} lb person ===", earthWeight);
    for (const Planet& planet : planets.values()) {
        spdlog::info("{:<8} {:>8.2f}", planet.toString(),
                     planet.surfaceWeight(mass));
    }

    auto giants = planets.values().filter(
        [](const Planet& planet) { return planet.radius() > 2.0e7; });
    spdlog::info("Gas giants: {}", giants.toString());

    auto heavierThanEarth = planets.values().rangeFrom(planets.Earth).filter(
        [&planets](const Planet& planet) {
            return planet.mass() > planets.Earth.mass();
        });
    spdlog::info("Outer planets heavier than Earth: {}",
                 heavierThanEarth.toString());

    // Mapping out of the enumeration yields a sorted set
    auto gravities = planets.values().map([](const Planet& planet) {
        return static_cast<int>(planet.surfaceGravity());
    });
    spdlog::info("Distinct whole surface gravities: {}", gravities.size());

    return 0;
}
