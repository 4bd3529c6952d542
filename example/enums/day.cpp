/**
 * Examples for ordinal::enums with a plain day-of-week enumeration
 *
 * This file demonstrates:
 * 1. Declaring values and looking them up by id and name
 * 2. Building value sets and set algebra
 * 3. Range queries and iteration order
 * 4. Exporting and restoring a set as a bit mask
 * 5. Error reporting
 */

#include <iomanip>
#include <iostream>
#include <string>

#include "ordinal/enums/enum.hpp"

using namespace ordinal::enums;

class Day : public Val {
public:
    explicit Day(bool weekend) : weekend_(weekend) {}

    [[nodiscard]] bool isWorkingDay() const { return !weekend_; }

private:
    bool weekend_;
};

class DayEnum : public Enum<Day> {
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

// Helper function to print section headers
void printHeader(const std::string& title) {
    std::cout << "\n==========================================================="
              << std::endl;
    std::cout << "  " << title << std::endl;
    std::cout << "==========================================================="
              << std::endl;
}

void printValue(const std::string& label, const std::string& value) {
    std::cout << std::left << std::setw(36) << label << ": " << value
              << std::endl;
}

int main() {
    DayEnum days;

    //=========================================================================
    // 1. Lookups
    //=========================================================================
    printHeader("1. Lookups");

    printValue("days.Wednesday.id()", std::to_string(days.Wednesday.id()));
    printValue("days.value(4)", days.value(4).toString());
    printValue("days.withName(\"Sunday\").id()",
               std::to_string(days.withName("Sunday").id()));
    printValue("days.maxId()", std::to_string(days.maxId()));

    //=========================================================================
    // 2. Value sets
    //=========================================================================
    printHeader("2. Value Sets");

    auto all = days.values();
    auto working = all.filter(&Day::isWorkingDay);
    auto weekend = days.Saturday + days.Sunday;
    auto meetings = DayEnum::ValueSet{days.Monday, days.Thursday};

    printValue("all", all.toString());
    printValue("working", working.toString());
    printValue("weekend", weekend.toString());
    printValue("working | weekend == all",
               (working | weekend) == all ? "true" : "false");
    printValue("meetings & weekend", (meetings & weekend).toString());
    printValue("all - meetings", (all - meetings).toString());

    //=========================================================================
    // 3. Ranges
    //=========================================================================
    printHeader("3. Ranges");

    printValue("range(Tuesday, Friday)",
               all.range(days.Tuesday, days.Friday).toString());
    printValue("rangeFrom(Friday)", all.rangeFrom(days.Friday).toString());
    std::cout << "Iterating working days from Wednesday:" << std::endl;
    for (auto it = working.iteratorFrom(days.Wednesday); it != working.end();
         ++it) {
        std::cout << "  " << *it << std::endl;
    }

    //=========================================================================
    // 4. Bit masks
    //=========================================================================
    printHeader("4. Bit Masks");

    const auto words = weekend.toBitMask();
    std::cout << std::left << std::setw(36) << "weekend.toBitMask()" << ": 0x"
              << std::hex << words.front() << std::dec << std::endl;
    printValue("days.fromBitMask(words)", days.fromBitMask(words).toString());

    //=========================================================================
    // 5. Errors
    //=========================================================================
    printHeader("5. Errors");

    try {
        (void)days.value(12);
    } catch (const UnknownIdentifierError& e) {
        printValue("days.value(12)", e.getMessage());
    }
    try {
        (void)weekend.withName("Monday");
    } catch (const UnknownNameError& e) {
        printValue("weekend.withName(\"Monday\")", e.getMessage());
    }

    return 0;
}
