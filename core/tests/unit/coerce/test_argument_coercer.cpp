// tests/unit/coerce/test_argument_coercer.cpp - Unit tests for argument coercion
//
// Exercises the recursive coercer directly on literal raw values.
//

#include <gtest/gtest.h>

#include <any>
#include <cstdint>
#include <string>

#include "gql_coerce/ast/ast_context.hpp"
#include "gql_coerce/coerce/argument_coercer.hpp"
#include "gql_coerce/coerce/normalizer.hpp"
#include "gql_coerce/schema/schema.hpp"
#include "gql_coerce/test_support/query_builder.hpp"

using namespace gql_coerce;
using gql_coerce::test_support::QueryBuilder;

namespace
{

struct TestContext
{
  TypeContext types;
  QueryBuilder q;
  FailureBag failures;
  ArgumentCoercer coercer{q.ast(), failures};

  const Type * color = types.define_enum("Color", {"RED", "GREEN", "BLUE"});
  const Type * point = types.define_input_object(
    "PointInput", {
                    InputField{"x", types.get_non_null_type(types.int_type()), std::nullopt},
                    InputField{"y", types.int_type(), Value::make_scalar(int64_t{7})},
                    InputField{"label", types.string_type(), std::nullopt},
                  });

  Value coerce(const Type * type, ValueNode * node)
  {
    const RawValue raw = coercer.normalizer().normalize(node);
    return coercer.coerce(type, raw, ArgumentPath{std::string("arg")});
  }
};

int64_t as_int(const Value & v)
{
  const auto * i = v.get_if<int64_t>();
  return i != nullptr ? *i : -1;
}

}  // namespace

// ============================================================================
// Scalars
// ============================================================================

TEST(CoerceArgumentCoercer, IntLiteral)
{
  TestContext ctx;
  const Value v = ctx.coerce(ctx.types.int_type(), ctx.q.int_value(42));
  EXPECT_TRUE(ctx.failures.empty());
  ASSERT_TRUE(v.is_scalar());
  EXPECT_EQ(as_int(v), 42);
}

TEST(CoerceArgumentCoercer, ScalarRejectsWrongLiteral)
{
  TestContext ctx;
  const Value v = ctx.coerce(ctx.types.int_type(), ctx.q.string_value("abc"));
  EXPECT_TRUE(v.is_absent());
  ASSERT_EQ(ctx.failures.size(), 1u);
  const auto & f = ctx.failures.all().front();
  EXPECT_EQ(f.kind, FailureKind::ScalarCoercionFailed);
  EXPECT_EQ(f.reason, "expected type `Int', found \"abc\"");
  EXPECT_EQ(format_path(f.path), "arg");
}

TEST(CoerceArgumentCoercer, NullScalarIsExplicitNull)
{
  TestContext ctx;
  const Value v = ctx.coerce(ctx.types.string_type(), ctx.q.null_value());
  EXPECT_TRUE(ctx.failures.empty());
  EXPECT_TRUE(v.is_null());
}

TEST(CoerceArgumentCoercer, AbsentScalarStaysAbsent)
{
  TestContext ctx;
  const Value v = ctx.coerce(ctx.types.string_type(), nullptr);
  EXPECT_TRUE(ctx.failures.empty());
  EXPECT_TRUE(v.is_absent());
}

TEST(CoerceArgumentCoercer, CustomScalarParseFailureIsReported)
{
  TestContext ctx;
  const Type * even = ctx.types.define_scalar(
    "Even",
    [](const RawValue & raw) {
      if (raw.is_int() && raw.as_int() % 2 == 0) return ScalarParseResult::ok(raw.as_int());
      return ScalarParseResult::fail("not an even number");
    },
    [](const std::any & v) { return nlohmann::json(std::any_cast<int64_t>(v)); });

  EXPECT_TRUE(ctx.coerce(even, ctx.q.int_value(4)).is_scalar());
  EXPECT_TRUE(ctx.coerce(even, ctx.q.int_value(3)).is_absent());
  ASSERT_EQ(ctx.failures.size(), 1u);
  EXPECT_EQ(ctx.failures.all().front().kind, FailureKind::ScalarCoercionFailed);
  EXPECT_EQ(ctx.failures.all().front().reason, "not an even number");
}

// ============================================================================
// Non-null
// ============================================================================

TEST(CoerceArgumentCoercer, NonNullRejectsAbsent)
{
  TestContext ctx;
  const Type * t = ctx.types.get_non_null_type(ctx.types.int_type());
  EXPECT_TRUE(ctx.coerce(t, nullptr).is_absent());
  ASSERT_EQ(ctx.failures.size(), 1u);
  EXPECT_EQ(ctx.failures.all().front().kind, FailureKind::ValueRequired);
  EXPECT_EQ(ctx.failures.all().front().reason, "no value provided");
}

TEST(CoerceArgumentCoercer, NonNullRejectsNull)
{
  TestContext ctx;
  const Type * t = ctx.types.get_non_null_type(ctx.types.int_type());
  EXPECT_TRUE(ctx.coerce(t, ctx.q.null_value()).is_absent());
  ASSERT_EQ(ctx.failures.size(), 1u);
  EXPECT_EQ(ctx.failures.all().front().kind, FailureKind::ValueRequired);
}

TEST(CoerceArgumentCoercer, NonNullPassesValueThrough)
{
  TestContext ctx;
  const Type * t = ctx.types.get_non_null_type(ctx.types.int_type());
  EXPECT_EQ(as_int(ctx.coerce(t, ctx.q.int_value(1))), 1);
  EXPECT_TRUE(ctx.failures.empty());
}

// ============================================================================
// Enums
// ============================================================================

TEST(CoerceArgumentCoercer, EnumSymbol)
{
  TestContext ctx;
  const Value v = ctx.coerce(ctx.color, ctx.q.enum_value("GREEN"));
  EXPECT_TRUE(ctx.failures.empty());
  ASSERT_TRUE(v.is_enum());
  EXPECT_EQ(v.enum_symbol(), "GREEN");
}

TEST(CoerceArgumentCoercer, EnumRejectsQuotedStringLiteral)
{
  TestContext ctx;
  EXPECT_TRUE(ctx.coerce(ctx.color, ctx.q.string_value("GREEN")).is_absent());
  ASSERT_EQ(ctx.failures.size(), 1u);
  EXPECT_EQ(ctx.failures.all().front().kind, FailureKind::InvalidEnumValue);
  EXPECT_EQ(
    ctx.failures.all().front().reason,
    "expected one of `RED', `GREEN', `BLUE' for enum `Color', found \"GREEN\"");
}

TEST(CoerceArgumentCoercer, EnumRejectsUnknownSymbol)
{
  TestContext ctx;
  EXPECT_TRUE(ctx.coerce(ctx.color, ctx.q.enum_value("PURPLE")).is_absent());
  ASSERT_EQ(ctx.failures.size(), 1u);
  EXPECT_EQ(ctx.failures.all().front().kind, FailureKind::InvalidEnumValue);
}

// ============================================================================
// Lists
// ============================================================================

TEST(CoerceArgumentCoercer, ListElementsCoercedIndependently)
{
  TestContext ctx;
  const Type * t = ctx.types.get_list_type(ctx.types.int_type());
  const Value v = ctx.coerce(t, ctx.q.list({ctx.q.int_value(1), ctx.q.int_value(2)}));
  EXPECT_TRUE(ctx.failures.empty());
  ASSERT_TRUE(v.is_list());
  ASSERT_EQ(v.as_list().size(), 2u);
  EXPECT_EQ(as_int(v.as_list()[0]), 1);
  EXPECT_EQ(as_int(v.as_list()[1]), 2);
}

TEST(CoerceArgumentCoercer, ListDoesNotPromoteSingleValue)
{
  TestContext ctx;
  const Type * t = ctx.types.get_list_type(ctx.types.int_type());
  EXPECT_TRUE(ctx.coerce(t, ctx.q.int_value(1)).is_absent());
  ASSERT_EQ(ctx.failures.size(), 1u);
  EXPECT_EQ(ctx.failures.all().front().kind, FailureKind::ShapeMismatch);
  EXPECT_EQ(ctx.failures.all().front().reason, "expected a list of type `[Int]', found 1");
}

TEST(CoerceArgumentCoercer, ListCollectsEveryElementFailure)
{
  TestContext ctx;
  const Type * t = ctx.types.get_list_type(ctx.types.int_type());
  const Value v = ctx.coerce(
    t, ctx.q.list({ctx.q.string_value("a"), ctx.q.int_value(2), ctx.q.bool_value(true)}));
  EXPECT_TRUE(v.is_absent());
  ASSERT_EQ(ctx.failures.size(), 2u);
  EXPECT_EQ(format_path(ctx.failures.all()[0].path), "arg[0]");
  EXPECT_EQ(format_path(ctx.failures.all()[1].path), "arg[2]");
}

TEST(CoerceArgumentCoercer, ListNullAndAbsentPassThrough)
{
  TestContext ctx;
  const Type * t = ctx.types.get_list_type(ctx.types.int_type());
  EXPECT_TRUE(ctx.coerce(t, ctx.q.null_value()).is_null());
  EXPECT_TRUE(ctx.coerce(t, nullptr).is_absent());
  EXPECT_TRUE(ctx.failures.empty());
}

TEST(CoerceArgumentCoercer, ListOfNonNullRejectsNullElement)
{
  TestContext ctx;
  const Type * t = ctx.types.get_list_type(ctx.types.get_non_null_type(ctx.types.int_type()));
  EXPECT_TRUE(ctx.coerce(t, ctx.q.list({ctx.q.int_value(1), ctx.q.null_value()})).is_absent());
  ASSERT_EQ(ctx.failures.size(), 1u);
  EXPECT_EQ(ctx.failures.all().front().kind, FailureKind::ValueRequired);
  EXPECT_EQ(format_path(ctx.failures.all().front().path), "arg[1]");
}

// ============================================================================
// Input Objects
// ============================================================================

TEST(CoerceArgumentCoercer, InputObjectAppliesDefaultsAndDropsUnknownKeys)
{
  TestContext ctx;
  const Value v = ctx.coerce(
    ctx.point, ctx.q.object({{"x", ctx.q.int_value(1)}, {"z", ctx.q.int_value(99)}}));
  EXPECT_TRUE(ctx.failures.empty());
  ASSERT_TRUE(v.is_object());
  EXPECT_EQ(as_int(*v.find("x")), 1);
  ASSERT_NE(v.find("y"), nullptr);
  EXPECT_EQ(as_int(*v.find("y")), 7);
  EXPECT_FALSE(v.contains("label"));
  EXPECT_FALSE(v.contains("z"));
  ASSERT_EQ(v.keys().size(), 2u);
  EXPECT_EQ(v.keys()[0], "x");
  EXPECT_EQ(v.keys()[1], "y");
}

TEST(CoerceArgumentCoercer, InputObjectExplicitNullIsNotDefaulted)
{
  TestContext ctx;
  const Value v =
    ctx.coerce(ctx.point, ctx.q.object({{"x", ctx.q.int_value(1)}, {"y", ctx.q.null_value()}}));
  EXPECT_TRUE(ctx.failures.empty());
  ASSERT_NE(v.find("y"), nullptr);
  EXPECT_TRUE(v.find("y")->is_null());
}

TEST(CoerceArgumentCoercer, InputObjectCollectsFieldFailures)
{
  TestContext ctx;
  const Value v = ctx.coerce(
    ctx.point, ctx.q.object({{"y", ctx.q.string_value("bad")}, {"label", ctx.q.int_value(3)}}));
  EXPECT_TRUE(v.is_absent());
  ASSERT_EQ(ctx.failures.size(), 3u);
  EXPECT_EQ(ctx.failures.all()[0].kind, FailureKind::ValueRequired);
  EXPECT_EQ(format_path(ctx.failures.all()[0].path), "arg.x");
  EXPECT_EQ(format_path(ctx.failures.all()[1].path), "arg.y");
  EXPECT_EQ(format_path(ctx.failures.all()[2].path), "arg.label");
}

TEST(CoerceArgumentCoercer, InputObjectRejectsList)
{
  TestContext ctx;
  EXPECT_TRUE(ctx.coerce(ctx.point, ctx.q.list({})).is_absent());
  ASSERT_EQ(ctx.failures.size(), 1u);
  EXPECT_EQ(ctx.failures.all().front().kind, FailureKind::ShapeMismatch);
  EXPECT_EQ(
    ctx.failures.all().front().reason, "expected an object of type `PointInput', found []");
}

TEST(CoerceArgumentCoercer, NestedListOfInputObjectsReportsFullPath)
{
  TestContext ctx;
  const Type * t = ctx.types.get_list_type(ctx.point);
  ctx.coerce(
    t, ctx.q.list(
         {ctx.q.object({{"x", ctx.q.int_value(1)}}),
          ctx.q.object({{"x", ctx.q.string_value("no")}})}));
  ASSERT_EQ(ctx.failures.size(), 1u);
  EXPECT_EQ(format_path(ctx.failures.all().front().path), "arg[1].x");
}

// ============================================================================
// Argument Maps
// ============================================================================

TEST(CoerceArgumentCoercer, ArgumentMapOmitsAbsentAndUsesDefaults)
{
  TestContext ctx;
  FieldDef field;
  field.name = "thing";
  field.type = ctx.types.string_type();
  field.arguments = {
    ArgumentDef{"flag", ctx.types.boolean_type(), Value::make_scalar(false)},
    ArgumentDef{"name", ctx.types.string_type(), std::nullopt},
    ArgumentDef{"limit", ctx.types.int_type(), std::nullopt},
  };

  const FieldNode * node = ctx.q.field("thing", {ctx.q.argument("limit", ctx.q.null_value())});
  const ArgumentMap args = ctx.coercer.coerce_arguments(field, *node);

  EXPECT_TRUE(ctx.failures.empty());
  ASSERT_TRUE(args.is_object());
  ASSERT_NE(args.find("flag"), nullptr);
  EXPECT_EQ(*args.find("flag")->get_if<bool>(), false);
  EXPECT_FALSE(args.contains("name"));
  ASSERT_NE(args.find("limit"), nullptr);
  EXPECT_TRUE(args.find("limit")->is_null());
}

TEST(CoerceArgumentCoercer, OmittedRequiredArgumentIsLeftToResolver)
{
  TestContext ctx;
  FieldDef field;
  field.name = "thing";
  field.type = ctx.types.string_type();
  field.arguments = {
    ArgumentDef{"name", ctx.types.get_non_null_type(ctx.types.string_type()), std::nullopt}};

  const ArgumentMap args = ctx.coercer.coerce_arguments(field, *ctx.q.field("thing"));
  EXPECT_TRUE(ctx.failures.empty());
  EXPECT_TRUE(args.empty());
}

TEST(CoerceArgumentCoercer, StrictModeRejectsOmittedRequiredArgument)
{
  TypeContext types;
  QueryBuilder q;
  FailureBag failures;
  ArgumentCoercer coercer(q.ast(), failures, nullptr, CoercionOptions{true});

  FieldDef field;
  field.name = "thing";
  field.type = types.string_type();
  field.arguments = {
    ArgumentDef{"name", types.get_non_null_type(types.string_type()), std::nullopt}};

  const ArgumentMap args = coercer.coerce_arguments(field, *q.field("thing"));
  EXPECT_TRUE(args.empty());
  ASSERT_EQ(failures.size(), 1u);
  EXPECT_EQ(failures.all().front().kind, FailureKind::ValueRequired);
  EXPECT_EQ(format_path(failures.all().front().path), "name");
}

TEST(CoerceArgumentCoercer, ExplicitNullForRequiredArgumentFails)
{
  TestContext ctx;
  FieldDef field;
  field.name = "thing";
  field.type = ctx.types.string_type();
  field.arguments = {
    ArgumentDef{"name", ctx.types.get_non_null_type(ctx.types.string_type()), std::nullopt}};

  ctx.coercer.coerce_arguments(
    field, *ctx.q.field("thing", {ctx.q.argument("name", ctx.q.null_value())}));
  ASSERT_EQ(ctx.failures.size(), 1u);
  EXPECT_EQ(ctx.failures.all().front().kind, FailureKind::ValueRequired);
}

TEST(CoerceArgumentCoercer, CoerceValueConvenience)
{
  TypeContext types;
  AstContext arena;
  const CoercionResult ok = coerce_value(types.float_type(), RawValue::make_int(3), arena);
  EXPECT_TRUE(ok.ok());
  ASSERT_NE(ok.value.get_if<double>(), nullptr);
  EXPECT_DOUBLE_EQ(*ok.value.get_if<double>(), 3.0);

  const CoercionResult bad = coerce_value(types.float_type(), RawValue::make_boolean(true), arena);
  EXPECT_FALSE(bad.ok());
}
