#include "runtime_helpers.hpp"
#include "../test_model.hpp"

#include <string>
#include <thread>
#include <vector>

using namespace RuntimeFmt;
using namespace RuntimeFmt::capability;
using TestHelpers::Render;

void point_scenario() {
    using Args = FormatArgs<Point>;
    const Point p{12, 2.5};

    const auto x = Args::validate_name("x");
    const auto y = Args::validate_name("y");
    CHECK(x.has_value());
    CHECK(y.has_value());
    CHECK(!Args::validate_name("z").has_value());
    CHECK(!Args::validate_index(2));

    const auto xDisplay = Args::get_child<Display>(*x);
    CHECK(xDisplay.has_value());
    CHECK_EQ(Render(p, *xDisplay), "12");

    CHECK(!Args::get_child<LowerHex>(*y).has_value());
    CHECK_EQ(Render(p, *Args::get_child<LowerHex>(*x)), "c");
    CHECK_EQ(Render(p, *Args::get_child<Display>(*y)), "2.5");

    const auto xCount = Args::as_usize(*x);
    CHECK(xCount.has_value());
    CHECK_EQ((*xCount)(p), std::size_t{12});
    CHECK(&(*xCount)(p) == &p.x);
    CHECK(!Args::as_usize(*y).has_value());
}

void formatters_are_pure() {
    using Args = FormatArgs<Point>;
    Point p{255, 0.1};
    const auto hex = *Args::get_child<UpperHex>(0);
    const std::string first = Render(p, hex);
    CHECK_EQ(first, "FF");
    for(int i = 0; i < 10; i++) {
        CHECK(*Args::get_child<UpperHex>(0) == hex);
        CHECK_EQ(Render(p, hex), first);
    }
    // Output follows the instance, not the moment the formatter was fetched
    p.x = 16;
    CHECK_EQ(Render(p, hex), "10");
}

void dynamic_width_from_index_field() {
    using Args = FormatArgs<Point>;
    const Point p{8, 2.5};

    // "{y:>x$}" style: width comes from field x
    FormatSpec spec;
    spec.width = (*Args::as_usize(*Args::validate_name("x")))(p);
    CHECK_EQ(Render(p, *Args::get_child<Display>(1), spec), "     2.5");

    // ".x$" style: precision comes from field x
    const Point q{3, 3.14159};
    FormatSpec precise;
    precise.precision = (*Args::as_usize(0))(q);
    CHECK_EQ(Render(q, *Args::get_child<Display>(1), precise), "3.14");
    CHECK_EQ(Render(q, *Args::get_child<LowerExp>(1), precise), "3.142e+00");
}

void runtime_kind_dispatch() {
    using Args = FormatArgs<Point>;
    const Point p{10, 0.5};
    const auto kind = capability_from_token("o");
    CHECK(kind.has_value());
    const auto octal = Args::get_child(*kind, 0);
    CHECK(octal.has_value());
    CHECK_EQ(Render(p, *octal), "12");
    CHECK(!Args::get_child(*capability_from_token("b"), 1).has_value());
    CHECK_EQ(Render(p, *Args::get_child(*capability_from_token("E"), 1)), "5E-01");
}

void external_meta_fields() {
    using Args = FormatArgs<Sensor>;
    const Sensor s{.id = 42, .reading = 3.14159, .digits = 2, .secret = "hidden"};
    CHECK_EQ(Render(s, *Args::get_child<Display>(*Args::validate_name("id"))), "42");
    CHECK_EQ(Render(s, *Args::get_child<UpperHex>(*Args::validate_name("id"))), "2A");
    CHECK_EQ(Render(s, *Args::get_child<LowerExp>(*Args::validate_name("value"))), "3.14159e+00");

    FormatSpec spec;
    spec.precision = (*Args::as_usize(*Args::validate_name("digits")))(s);
    CHECK_EQ(Render(s, *Args::get_child<Display>(1), spec), "3.1");
    CHECK(!Args::validate_name("secret").has_value());
}

void shared_across_threads() {
    using Args = FormatArgs<Telemetry>;
    const auto label = *Args::get_child<Debug>(*Args::validate_name("label"));
    const auto flags = *Args::get_child<Binary>(*Args::validate_name("flags"));

    std::vector<std::thread> workers;
    std::vector<int> failures(4, 0);
    for(int w = 0; w < 4; w++) {
        workers.emplace_back([&, w] {
            Telemetry t{};
            t.label = "worker " + std::to_string(w);
            t.flags = static_cast<std::uint32_t>(w + 1);
            const std::string expectedLabel = "\"worker " + std::to_string(w) + "\"";
            const std::string expectedFlags = fmt::format("{:b}", w + 1);
            for(int i = 0; i < 500; i++) {
                fmt::memory_buffer a;
                fmt::memory_buffer b;
                if(!format_field(t, label, a) || fmt::to_string(a) != expectedLabel) failures[w]++;
                if(!format_field(t, flags, b) || fmt::to_string(b) != expectedFlags) failures[w]++;
            }
        });
    }
    for(auto & th : workers) {
        th.join();
    }
    for(int f : failures) {
        CHECK_EQ(f, 0);
    }
}

int main() {
    point_scenario();
    formatters_are_pure();
    dynamic_width_from_index_field();
    runtime_kind_dispatch();
    external_meta_fields();
    shared_across_threads();
    fmt::print("descriptor dispatch: ok\n");
    return 0;
}
