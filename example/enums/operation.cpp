/**
 * Examples for ordinal::enums with one subclass per value
 *
 * Operation is abstract; every value is an instance of its own subclass with
 * its own behaviour. A second enumeration is built at runtime from explicit
 * specs instead of declared members.
 */

#include <iostream>
#include <string>

#include <spdlog/spdlog.h>

#include "ordinal/enums/enum.hpp"

using namespace ordinal::enums;

class Operation : public Val {
public:
    [[nodiscard]] virtual double eval(double x, double y) const = 0;
};

class Plus final : public Operation {
public:
    [[nodiscard]] double eval(double x, double y) const override {
        return x + y;
    }
};

class Minus final : public Operation {
public:
    [[nodiscard]] double eval(double x, double y) const override {
        return x - y;
    }
};

class Times final : public Operation {
public:
    [[nodiscard]] double eval(double x, double y) const override {
        return x * y;
    }
};

class Divide final : public Operation {
public:
    [[nodiscard]] double eval(double x, double y) const override {
        return x / y;
    }
};

class OperationEnum : public Enum<Operation> {
public:
    OperationEnum() : Enum({.name = "Operation"}) {}

    const Plus& Add = declare<Plus>("Add");
    const Minus& Subtract = declare<Minus>("Subtract");
    const Times& Multiply = declare<Times>("Multiply");
    const Divide& Quotient = declare<Divide>("Quotient");
};

class Level : public Val {};

int main() {
    OperationEnum operations;

    const double x = 8.0;
    const double y = 2.0;
    for (const Operation& op : operations.values()) {
        std::cout << op << "(" << x << ", " << y << ") = " << op.eval(x, y)
                  << std::endl;
    }

    // Values restored from their persisted ids keep their behaviour
    const int persisted = operations.Multiply.id();
    std::cout << "Restored #" << persisted << ": "
              << operations(persisted).eval(x, y) << std::endl;

    // Runtime enumeration with explicit ids and queued names
    Enum<Level> levels({.name = "Level",
                        .initialId = 10,
                        .names = {"Low", "Medium", "High"}});
    const auto& low = levels.create(ValueSpec{});
    const auto& medium = levels.create(ValueSpec{});
    const auto& critical = levels.create(ValueSpec{.id = 100,
                                                   .name = "Critical"});
    const auto& high = levels.create(ValueSpec{});

    spdlog::info("{} spans ids [{}, {})", levels.values().toString(),
                 levels.minId(), levels.maxId());
    spdlog::info("{} < {}: {}", low.toString(), medium.toString(),
                 low < medium);
    spdlog::info("{} follows {} with id {}", high.toString(),
                 critical.toString(), high.id());

    try {
        (void)levels.create(ValueSpec{.id = 10});
    } catch (const DuplicateIdentifierError& e) {
        spdlog::warn("Rejected: {}", e.getMessage());
    }

    return 0;
}
