// tests/unit/schema/test_type.cpp - Unit tests for type descriptors
//
// Tests TypeContext interning and the built-in scalar functions.
//

#include <gtest/gtest.h>

#include <any>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "gql_coerce/schema/builtin_scalars.hpp"
#include "gql_coerce/schema/type.hpp"

using namespace gql_coerce;

// ============================================================================
// TypeContext
// ============================================================================

TEST(SchemaTypeContext, BuiltinLookup)
{
  TypeContext types;
  EXPECT_EQ(types.lookup("Int"), types.int_type());
  EXPECT_EQ(types.lookup("Float"), types.float_type());
  EXPECT_EQ(types.lookup("String"), types.string_type());
  EXPECT_EQ(types.lookup("Boolean"), types.boolean_type());
  EXPECT_EQ(types.lookup("ID"), types.id_type());
  EXPECT_EQ(types.lookup("Nope"), nullptr);
}

TEST(SchemaTypeContext, DefinedTypesAreFound)
{
  TypeContext types;
  const Type * color = types.define_enum("Color", {"RED", "GREEN"});
  const Type * input = types.define_input_object("PointInput");

  EXPECT_EQ(types.lookup("Color"), color);
  EXPECT_EQ(types.lookup("PointInput"), input);
  EXPECT_TRUE(color->is_enum());
  EXPECT_TRUE(color->has_enum_value("GREEN"));
  EXPECT_FALSE(color->has_enum_value("green"));
  EXPECT_TRUE(input->is_input_object());
}

TEST(SchemaTypeContext, WrappersAreInterned)
{
  TypeContext types;
  const Type * list_a = types.get_list_type(types.int_type());
  const Type * list_b = types.get_list_type(types.int_type());
  EXPECT_EQ(list_a, list_b);

  const Type * nn_a = types.get_non_null_type(types.int_type());
  const Type * nn_b = types.get_non_null_type(types.int_type());
  EXPECT_EQ(nn_a, nn_b);
  EXPECT_NE(static_cast<const void *>(nn_a), static_cast<const void *>(list_a));
}

TEST(SchemaTypeContext, NonNullIsNotDoubleWrapped)
{
  TypeContext types;
  const Type * nn = types.get_non_null_type(types.string_type());
  EXPECT_EQ(types.get_non_null_type(nn), nn);
}

TEST(SchemaWrapperTypeTable, InternsOverForeignTypes)
{
  TypeContext types;
  WrapperTypeTable local;

  const Type * list = local.list_of(types.int_type());
  EXPECT_EQ(local.list_of(types.int_type()), list);
  EXPECT_EQ(list->of_type, types.int_type());

  const Type * nn = local.non_null_of(list);
  EXPECT_EQ(local.non_null_of(nn), nn);
  EXPECT_EQ(nn->display_name(), "[Int]!");
  EXPECT_EQ(local.size(), 2u);
}

TEST(SchemaWrapperTypeTable, LeavesSchemaWrappersAlone)
{
  TypeContext types;
  const Type * schema_list = types.get_list_type(types.string_type());
  const size_t before = types.wrapper_count();

  WrapperTypeTable local;
  const Type * local_list = local.list_of(types.string_type());
  local.non_null_of(local.list_of(local_list));

  EXPECT_NE(local_list, schema_list);
  EXPECT_EQ(local_list->display_name(), schema_list->display_name());
  EXPECT_EQ(types.wrapper_count(), before);
}

TEST(SchemaTypeContext, SelfReferentialInputObject)
{
  TypeContext types;
  Type * node = types.define_input_object("TreeInput");
  node->fields.push_back(InputField{"value", types.int_type(), std::nullopt});
  node->fields.push_back(InputField{"children", types.get_list_type(node), std::nullopt});

  const InputField * children = node->find_field("children");
  ASSERT_NE(children, nullptr);
  EXPECT_EQ(children->type->of_type, node);
  EXPECT_EQ(node->find_field("missing"), nullptr);
}

TEST(SchemaType, DisplayName)
{
  TypeContext types;
  const Type * t =
    types.get_non_null_type(types.get_list_type(types.get_non_null_type(types.int_type())));
  EXPECT_EQ(t->display_name(), "[Int!]!");
  EXPECT_EQ(t->named_type(), types.int_type());
  EXPECT_EQ(t->nullable()->display_name(), "[Int!]");
}

// ============================================================================
// Built-in Scalars
// ============================================================================

TEST(SchemaBuiltinScalars, IntRange)
{
  const auto ok = builtin::parse_int(RawValue::make_int(2147483647));
  ASSERT_TRUE(ok.success);
  EXPECT_EQ(std::any_cast<int64_t>(ok.value), 2147483647);

  const auto too_big = builtin::parse_int(RawValue::make_int(2147483648LL));
  EXPECT_FALSE(too_big.success);
  EXPECT_EQ(too_big.error, "Int cannot represent non 32-bit signed integer value: 2147483648");

  EXPECT_FALSE(builtin::parse_int(RawValue::make_float(1.5)).success);
}

TEST(SchemaBuiltinScalars, FloatAcceptsInt)
{
  const auto r = builtin::parse_float(RawValue::make_int(2));
  ASSERT_TRUE(r.success);
  EXPECT_DOUBLE_EQ(std::any_cast<double>(r.value), 2.0);
  EXPECT_FALSE(builtin::parse_float(RawValue::make_string("2")).success);
}

TEST(SchemaBuiltinScalars, StringAndBooleanAreStrict)
{
  EXPECT_TRUE(builtin::parse_string(RawValue::make_string("x")).success);
  EXPECT_FALSE(builtin::parse_string(RawValue::make_int(1)).success);
  EXPECT_TRUE(builtin::parse_boolean(RawValue::make_boolean(false)).success);

  const auto r = builtin::parse_boolean(RawValue::make_string("true"));
  EXPECT_FALSE(r.success);
  EXPECT_EQ(r.error, "expected type `Boolean', found \"true\"");
}

TEST(SchemaBuiltinScalars, IdAcceptsStringOrInt)
{
  const auto from_int = builtin::parse_id(RawValue::make_int(42));
  ASSERT_TRUE(from_int.success);
  EXPECT_EQ(std::any_cast<std::string>(from_int.value), "42");

  const auto from_string = builtin::parse_id(RawValue::make_string("abc"));
  ASSERT_TRUE(from_string.success);
  EXPECT_EQ(std::any_cast<std::string>(from_string.value), "abc");

  EXPECT_FALSE(builtin::parse_id(RawValue::make_boolean(true)).success);
}

TEST(SchemaBuiltinScalars, Serialize)
{
  EXPECT_EQ(builtin::serialize_int(std::any(int64_t{5})), nlohmann::json(5));
  EXPECT_EQ(builtin::serialize_int(std::any(7)), nlohmann::json(7));
  EXPECT_EQ(builtin::serialize_float(std::any(int64_t{2})), nlohmann::json(2.0));
  EXPECT_EQ(builtin::serialize_string(std::any(std::string("s"))), nlohmann::json("s"));
  EXPECT_THROW((void)builtin::serialize_boolean(std::any(std::string("no"))), std::bad_any_cast);
}
