// tests/enums/test_enums.hpp
#ifndef ORDINAL_TEST_ENUMS_HPP
#define ORDINAL_TEST_ENUMS_HPP

#include <string>

#include "ordinal/enums/enum.hpp"

namespace ordinal::test {

// Values with their own behaviour
class Day : public enums::Val {
public:
    explicit Day(bool weekend) : weekend_(weekend) {}

    [[nodiscard]] bool isWorkingDay() const { return !weekend_; }

private:
    bool weekend_;
};

class DayEnum : public enums::Enum<Day> {
public:
    DayEnum() : Enum({.name = "Day"}) {}

    const Day& Monday = declare("Monday", false);
    const Day& Tuesday = declare("Tuesday", false);
    const Day& Wednesday = declare("Wednesday", false);
    const Day& Thursday = declare("Thursday", false);
    const Day& Friday = declare("Friday", false);
    const Day& Saturday = declare("Saturday", true);
    const Day& Sunday = declare("Sunday", true);
};

// Plain values without extra state
class Color : public enums::Val {};

class ColorEnum : public enums::Enum<Color> {
public:
    ColorEnum() : Enum({.name = "Color"}) {}

    const Color& Red = declare("Red");
    const Color& Green = declare("Green");
    const Color& Blue = declare("Blue");
};

// Values with attributes and a private constructor
class Planet : public enums::Val {
public:
    static constexpr double G = 6.67300E-11;

    [[nodiscard]] double mass() const { return mass_; }
    [[nodiscard]] double radius() const { return radius_; }
    [[nodiscard]] double surfaceGravity() const {
        return G * mass_ / (radius_ * radius_);
    }

private:
    friend class enums::Enum<Planet>;

    Planet(double mass, double radius) : mass_(mass), radius_(radius) {}

    double mass_;
    double radius_;
};

class PlanetEnum : public enums::Enum<Planet> {
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

// Abstract value type with one subclass per value
class Operation : public enums::Val {
public:
    [[nodiscard]] virtual double eval(double x, double y) const = 0;
};

class Plus final : public Operation {
public:
    [[nodiscard]] double eval(double x, double y) const override {
        return x + y;
    }
};

class Times final : public Operation {
public:
    [[nodiscard]] double eval(double x, double y) const override {
        return x * y;
    }
};

class OperationEnum : public enums::Enum<Operation> {
public:
    OperationEnum() : Enum({.name = "Operation"}) {}

    const Plus& Add = declare<Plus>("Add");
    const Times& Multiply = declare<Times>("Multiply");
};

// Values registered one by one in tests
class Token : public enums::Val {};

class TokenEnum : public enums::Enum<Token> {
public:
    explicit TokenEnum(enums::RegistryOptions options = {.name = "Token"})
        : Enum(std::move(options)) {}
};

}  // namespace ordinal::test

#endif  // ORDINAL_TEST_ENUMS_HPP
