#include "ordinal/enums/enum.hpp"

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace py = pybind11;
using namespace ordinal::enums;

namespace {

// Values of enumerations created from Python carry no state of their own
class DynamicValue : public Val {};

class DynamicEnum : public Enum<DynamicValue> {
public:
    using Enum::Enum;
};

using DynamicSet = DynamicEnum::ValueSet;

}  // namespace

PYBIND11_MODULE(ordinal_enums, m) {
    m.doc() = "Closed, extensible enumerations for the ordinal package";

    // Register exception translations
    py::register_exception_translator([](std::exception_ptr p) {
        try {
            if (p)
                std::rethrow_exception(p);
        } catch (const UnknownIdentifierError& e) {
            PyErr_SetString(PyExc_KeyError, e.getMessage().c_str());
        } catch (const UnknownNameError& e) {
            PyErr_SetString(PyExc_KeyError, e.getMessage().c_str());
        } catch (const DuplicateIdentifierError& e) {
            PyErr_SetString(PyExc_ValueError, e.getMessage().c_str());
        } catch (const CrossRegistryOperationError& e) {
            PyErr_SetString(PyExc_ValueError, e.getMessage().c_str());
        } catch (const ordinal::error::InvalidArgument& e) {
            PyErr_SetString(PyExc_ValueError, e.getMessage().c_str());
        } catch (const ordinal::error::OutOfRange& e) {
            PyErr_SetString(PyExc_IndexError, e.getMessage().c_str());
        } catch (const ordinal::error::Exception& e) {
            PyErr_SetString(PyExc_RuntimeError, e.getMessage().c_str());
        }
    });

    py::class_<DynamicValue, std::unique_ptr<DynamicValue, py::nodelete>>(
        m, "Value",
        R"(A value of an enumeration. Values are owned by their enumeration
and compare equal only to themselves.)")
        .def_property_readonly("id", &DynamicValue::id,
                               "The id, also the value's bit position")
        .def_property_readonly("name", &DynamicValue::toString,
                               "The display name")
        .def("__str__", &DynamicValue::toString)
        .def("__repr__",
             [](const DynamicValue& value) {
                 return "<" + value.registry().name() + "." +
                        value.toString() + ": " + std::to_string(value.id()) +
                        ">";
             })
        .def("__eq__", [](const DynamicValue& lhs,
                          const DynamicValue& rhs) { return lhs == rhs; })
        .def("__lt__", [](const DynamicValue& lhs,
                          const DynamicValue& rhs) { return lhs < rhs; })
        .def("__hash__",
             [](const DynamicValue& value) {
                 return std::hash<const void*>{}(&value);
             })
        .def(
            "__add__",
            [](const DynamicValue& lhs, const DynamicValue& rhs) {
                return combine(lhs, rhs);
            },
            py::keep_alive<0, 1>(),
            R"(Set holding both values.

Raises:
    ValueError: If the values belong to different enumerations
)");

    py::class_<DynamicSet>(m, "ValueSet",
                           "Immutable, ordered set of values of one enumeration")
        .def(py::init<>())
        .def("__len__", &DynamicSet::size)
        .def("__bool__", [](const DynamicSet& set) { return !set.empty(); })
        .def(
            "__iter__",
            [](const DynamicSet& set) {
                return py::make_iterator(set.begin(), set.end());
            },
            py::keep_alive<0, 1>())
        .def("__contains__", &DynamicSet::contains, py::arg("value"))
        .def("__eq__", [](const DynamicSet& lhs,
                          const DynamicSet& rhs) { return lhs == rhs; })
        .def("__or__", &DynamicSet::unite, py::keep_alive<0, 1>())
        .def("__and__", &DynamicSet::intersect, py::keep_alive<0, 1>())
        .def("__sub__", &DynamicSet::difference, py::keep_alive<0, 1>())
        .def("__str__", &DynamicSet::toString)
        .def("__repr__", &DynamicSet::toString)
        .def("insert", &DynamicSet::insert, py::arg("value"),
             py::keep_alive<0, 1>(), "A new set that also contains value")
        .def("remove", &DynamicSet::remove, py::arg("value"),
             py::keep_alive<0, 1>(), "A new set without value")
        .def("is_subset_of", &DynamicSet::isSubsetOf, py::arg("other"))
        .def("front", &DynamicSet::front,
             py::return_value_policy::reference_internal)
        .def("back", &DynamicSet::back,
             py::return_value_policy::reference_internal)
        .def(
            "range",
            [](const DynamicSet& set, std::optional<int> from,
               std::optional<int> until) { return set.range(from, until); },
            py::arg("from_id") = py::none(), py::arg("until_id") = py::none(),
            py::keep_alive<0, 1>(),
            R"(Members with from_id <= id < until_id. A missing bound is open.

Raises:
    ValueError: If from_id > until_id
)")
        .def(
            "with_name",
            [](const DynamicSet& set, const std::string& name)
                -> const DynamicValue& { return set.withName(name); },
            py::arg("name"), py::return_value_policy::reference_internal)
        .def("to_bit_mask", &DynamicSet::toBitMask,
             R"(Membership as a list of 64-bit words; bit k stands for id
min_id + k of the enumeration.)");

    py::class_<DynamicEnum>(m, "Enum",
                            R"(An enumeration whose values are created at runtime.

Examples:
    >>> from ordinal_enums import Enum
    >>> color = Enum("Color")
    >>> red = color.declare("Red")
    >>> color.with_name("Red").id
    0
)")
        .def(py::init([](std::string name, int initialId,
                         std::vector<std::string> names) {
                 return std::make_unique<DynamicEnum>(
                     RegistryOptions{.name = std::move(name),
                                     .initialId = initialId,
                                     .names = std::move(names)});
             }),
             py::arg("name") = ORDINAL_ENUM_DEFAULT_NAME,
             py::arg("initial_id") = ORDINAL_ENUM_DEFAULT_INITIAL_ID,
             py::arg("names") = std::vector<std::string>{})
        .def_property_readonly("name", &DynamicEnum::name)
        .def(
            "declare",
            [](DynamicEnum& e, std::string name) -> const DynamicValue& {
                return e.declare(std::move(name));
            },
            py::arg("name"), py::return_value_policy::reference_internal,
            "Registers a value under the next id with a declared name")
        .def(
            "create",
            [](DynamicEnum& e, std::optional<int> id,
               std::optional<std::string> name) -> const DynamicValue& {
                return e.create(ValueSpec{.id = id, .name = std::move(name)});
            },
            py::arg("id") = py::none(), py::arg("name") = py::none(),
            py::return_value_policy::reference_internal,
            R"(Registers a value with an optional explicit id and name.

Raises:
    ValueError: If the id is already taken
)")
        .def(
            "value",
            [](const DynamicEnum& e, int id) -> const DynamicValue& {
                return e.value(id);
            },
            py::arg("id"), py::return_value_policy::reference_internal,
            R"(The value with the given id.

Raises:
    KeyError: If there is none
)")
        .def(
            "with_name",
            [](const DynamicEnum& e, const std::string& name)
                -> const DynamicValue& { return e.withName(name); },
            py::arg("name"), py::return_value_policy::reference_internal,
            R"(The value with the given display name.

Raises:
    KeyError: If there is none
)")
        .def("values", &DynamicEnum::values, py::keep_alive<0, 1>(),
             "All values in id order")
        .def("empty_set", &DynamicEnum::emptySet, py::keep_alive<0, 1>())
        .def(
            "from_bit_mask",
            [](const DynamicEnum& e, const std::vector<std::uint64_t>& words) {
                return e.fromBitMask(words);
            },
            py::arg("words"), py::keep_alive<0, 1>())
        .def_property_readonly("max_id", &DynamicEnum::maxId)
        .def_property_readonly("min_id", &DynamicEnum::minId)
        .def("__len__", &DynamicEnum::size);
}
