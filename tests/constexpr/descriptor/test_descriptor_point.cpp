#include "../test_helpers.hpp"
#include "../../test_model.hpp"
#include <RuntimeFmt/format_args.hpp>

using namespace RuntimeFmt;
using namespace RuntimeFmt::capability;
using namespace TestHelpers;

using Args = FormatArgs<Point>;

static_assert(FormatArgsLike<Args, Point>);
static_assert(Args::field_count == 2);

// ============================================================================
// Names and indices
// ============================================================================

static_assert(NameResolvesTo<Point>("x", 0));
static_assert(NameResolvesTo<Point>("y", 1));
static_assert(!Args::validate_name("z"));
static_assert(!Args::validate_name(""));
static_assert(!Args::validate_name("X"));
static_assert(!Args::validate_name("xy"));
static_assert(!Args::validate_name("x "));

static_assert(Args::validate_index(0));
static_assert(Args::validate_index(1));
static_assert(!Args::validate_index(2));
static_assert(!Args::validate_index(static_cast<std::size_t>(-1)));

static_assert(Args::field_name(0) == "x");
static_assert(Args::field_name(1) == "y");

// ============================================================================
// Capabilities per field
// ============================================================================

static_assert(FieldHas<Point, Display>("x"));
static_assert(FieldHas<Point, LowerHex>("x"));
static_assert(FieldHas<Point, Binary>("x"));
static_assert(!FieldHas<Point, LowerExp>("x"));

static_assert(FieldHas<Point, Display>("y"));
static_assert(FieldHas<Point, UpperExp>("y"));
static_assert(!FieldHas<Point, LowerHex>("y"));
static_assert(!FieldHas<Point, Octal>("y"));

static_assert(FieldIsCount<Point>("x"));
static_assert(!FieldIsCount<Point>("y"));

// The runtime-kind overload reads the same table
static_assert(Args::get_child(CapabilityKind::lower_hex, 0) == Args::get_child<LowerHex>(0));
static_assert(!Args::get_child(CapabilityKind::lower_hex, 1));
static_assert(Args::get_child(CapabilityKind::upper_exp, 1) == Args::get_child<UpperExp>(1));

static_assert(RowMatchesPredicates<Point, 0>());
static_assert(RowMatchesPredicates<Point, 1>());

// ============================================================================
// Referential stability
// ============================================================================

static_assert(*Args::get_child<Display>(0) == *Args::get_child<Display>(0));
static_assert(*Args::as_usize(0) == *Args::as_usize(0));
static_assert(*Args::get_child<Display>(0) == *get_formatter<Display, Point>(FieldAccessor<Point, 0>{}));

constexpr Point p{12, 2.5};
static_assert((*Args::as_usize(0))(p) == 12);

int main() {
    // All tests run at compile time via static_assert
    return 0;
}
