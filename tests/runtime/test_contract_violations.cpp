#include "runtime_helpers.hpp"
#include "../test_model.hpp"

using namespace RuntimeFmt;
using namespace RuntimeFmt::capability;
using TestHelpers::AbortsWith;

void unchecked_indices_are_fatal() {
    using Args = FormatArgs<Point>;
    CHECK(AbortsWith([] { (void)Args::get_child<Display>(2); },
                     "get_child: field index 2 is out of range (2 fields)"));
    CHECK(AbortsWith([] { (void)Args::get_child(CapabilityKind::debug, 5); },
                     "get_child: field index 5 is out of range (2 fields)"));
    CHECK(AbortsWith([] { (void)Args::as_usize(2); },
                     "as_usize: field index 2 is out of range (2 fields)"));
    CHECK(AbortsWith([] { (void)FormatArgs<Sensor>::field_name(3); },
                     "field_name: field index 3 is out of range (3 fields)"));
}

void kind_outside_closed_set_is_fatal() {
    CHECK(AbortsWith([] { (void)FormatArgs<Point>::get_child(static_cast<CapabilityKind>(42), 0); },
                     "capability kind outside the closed set"));
}

void unsupported_perform_is_fatal() {
    CHECK(AbortsWith([] {
        fmt::memory_buffer out;
        Formatter f(out);
        (void)LowerHex::perform(1.0, f);
    }, "lowercase hexadecimal representation performed on a type that does not support it"));

    CHECK(AbortsWith([] {
        fmt::memory_buffer out;
        Formatter f(out);
        (void)Pointer::perform(7, f);
    }, "pointer representation performed on a type that does not support it"));
}

void valid_calls_do_not_abort() {
    // The helper must tell a clean exit apart from an abort
    CHECK(!AbortsWith([] { (void)FormatArgs<Point>::get_child<Display>(1); }, "contract violation"));
}

int main() {
    unchecked_indices_are_fatal();
    kind_outside_closed_set_is_fatal();
    unsupported_perform_is_fatal();
    valid_calls_do_not_abort();
    fmt::print("contract violations: ok\n");
    return 0;
}
