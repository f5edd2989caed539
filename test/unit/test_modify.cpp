#include "tanto/core/derive.hpp"
#include "tanto/core/modify.hpp"

#include <gtest/gtest.h>
#include <string>
#include <vector>

using namespace tanto;

namespace {

schema basket_schema() {
    auto fruit_amount = type_descriptor::product("FruitAmount")
                            .with_field("fruit", type_descriptor::primitive(primitive_kind::string))
                            .with_field("amount", type_descriptor::primitive(primitive_kind::integer));
    auto basket = type_descriptor::product("Basket")
                      .with_field("fruits", type_descriptor::array(fruit_amount))
                      .with_field("owner",
                                  type_descriptor::optional(type_descriptor::product("Owner").with_field(
                                      "name", type_descriptor::primitive(primitive_kind::string))));
    return derive(basket).value();
}

field_path amount_path() {
    return field_path().field("fruits").each().field("amount");
}

schema describe_as(const schema& s, std::string text) {
    return s.with_description(std::move(text));
}

// A named container "Box" holding its content in field "content".
schema box_of(schema content) {
    return schema::product({field::of("content", std::move(content))})->with_name("Box");
}

unwrapper box_unwrapper() {
    return unwrapper{
        [](const schema& box) -> const schema* {
            const auto* f = box.find_field("content");
            return f ? &f->type : nullptr;
        },
        [](const schema& box, schema content) { return box.with_field_schema(0, std::move(content)); }};
}

} // namespace

TEST(FieldPath, BuildAndShow) {
    auto path = amount_path();
    EXPECT_EQ(path.size(), 3u);
    EXPECT_EQ(path.to_string(), "fruits.each.amount");
    EXPECT_EQ(path.segments()[1], path_segment::each());
    EXPECT_EQ(field_path().to_string(), "<root>");
    EXPECT_TRUE(field_path().empty());
}

TEST(FieldPath, BuildersDoNotMutateReceiver) {
    auto base = field_path().field("fruits");
    auto longer = base.each();
    EXPECT_EQ(base.size(), 1u);
    EXPECT_EQ(longer.size(), 2u);
    EXPECT_EQ(field_path({path_segment::field("fruits")}), base);
}

TEST(Modify, BasketAmountDescription) {
    auto root = basket_schema();
    auto out = modify(root, amount_path(), [](const schema& s) {
        return describe_as(s, "How many fruits?");
    });
    ASSERT_TRUE(out);

    const auto& fruits = out->find_field("fruits")->type;
    ASSERT_EQ(fruits.kind(), schema_kind::array);
    const auto& item = *fruits.element();
    ASSERT_EQ(item.kind(), schema_kind::product);
    EXPECT_EQ(item.find_field("amount")->type.metadata().description, "How many fruits?");
    EXPECT_EQ(item.find_field("amount")->type.primitive_type(), primitive_kind::integer);

    const auto& original_item = *root.find_field("fruits")->type.element();
    EXPECT_EQ(item.find_field("fruit")->type, original_item.find_field("fruit")->type);
    EXPECT_FALSE(original_item.find_field("amount")->type.metadata().description);
}

TEST(Modify, LocalityOnlyTargetChanges) {
    auto root = basket_schema();
    auto transform = [](const schema& s) { return s.with_validator(validator::min(1)); };

    auto lens = at(root, amount_path());
    ASSERT_TRUE(lens);
    auto out = lens->modify(transform);

    auto read_back = at(out, amount_path());
    ASSERT_TRUE(read_back);
    EXPECT_EQ(read_back->get(), transform(lens->get()));

    // Everything off the path is untouched.
    EXPECT_EQ(out.find_field("owner")->type, root.find_field("owner")->type);
    EXPECT_EQ(out.fields().size(), root.fields().size());
    EXPECT_EQ(out.name(), root.name());

    // Restoring the original node gives back the original tree.
    EXPECT_EQ(read_back->set(lens->get()), root);
}

TEST(Modify, LensGetReadsTarget) {
    auto root = basket_schema();
    auto lens = at(root, field_path().field("owner").each().field("name"));
    ASSERT_TRUE(lens);
    EXPECT_EQ(lens->get(), schema::primitive(primitive_kind::string));
    EXPECT_EQ(lens->path().to_string(), "owner.each.name");
}

TEST(Modify, EmptyPathTargetsRoot) {
    auto root = basket_schema();
    auto out = modify(root, field_path(), [](const schema& s) { return s.with_deprecated(); });
    ASSERT_TRUE(out);
    EXPECT_TRUE(out->metadata().deprecated);
}

TEST(Modify, OptionIsModifiedRegardlessOfPresence) {
    auto root = basket_schema();
    auto out = modify(root, field_path().field("owner").each(), [](const schema& s) {
        return describe_as(s, "Who packed it");
    });
    ASSERT_TRUE(out);

    const auto& owner = out->find_field("owner")->type;
    ASSERT_TRUE(owner.is_optional());
    EXPECT_FALSE(owner.metadata().description);
    EXPECT_EQ(owner.element()->metadata().description, "Who packed it");
}

TEST(Modify, AppendedValidatorsCombine) {
    auto root = basket_schema();
    auto once = modify(root, amount_path(), [](const schema& s) {
        return s.with_validator(validator::min(1));
    });
    ASSERT_TRUE(once);
    auto twice = modify(*once, amount_path(), [](const schema& s) {
        return s.with_validator(validator::max(100));
    });
    ASSERT_TRUE(twice);

    auto lens = at(*twice, amount_path());
    ASSERT_TRUE(lens);
    EXPECT_EQ(lens->get().combined_validator(), combine(validator::min(1), validator::max(100)));
}

TEST(Modify, UnknownFieldIsPathNotFound) {
    auto root = basket_schema();
    auto out = modify(root, field_path().field("fruits").each().field("weight"), [](const schema& s) {
        return describe_as(s, "never");
    });
    ASSERT_FALSE(out);
    EXPECT_EQ(out.error(), make_error_code(error_code::path_not_found));
    EXPECT_EQ(out.error(), error_kind::path_not_found);
}

TEST(Modify, FailureAppliesNothing) {
    auto root = basket_schema();
    int calls = 0;
    auto out = modify(root, field_path().field("fruits").field("amount"), [&](const schema& s) {
        ++calls;
        return s;
    });
    EXPECT_FALSE(out);
    EXPECT_EQ(calls, 0);
}

TEST(Modify, EachOnNonContainerFails) {
    auto root = basket_schema();
    auto lens = at(root, field_path().field("fruits").each().each());
    ASSERT_FALSE(lens);
    EXPECT_EQ(lens.error(), make_error_code(error_code::path_not_found));
}

TEST(Modify, FieldOnCoproductFails) {
    auto coproduct = schema::coproduct({variant{"a", schema::primitive(primitive_kind::string)}});
    ASSERT_TRUE(coproduct);
    EXPECT_FALSE(at(*coproduct, field_path().field("a")));
}

TEST(Modify, CustomContainerNeedsUnwrapper) {
    auto root = schema::product({field::of("items", box_of(schema::primitive(primitive_kind::integer)))});
    ASSERT_TRUE(root);
    auto path = field_path().field("items").each();

    EXPECT_FALSE(at(*root, path));

    unwrap_registry unwrappers;
    unwrappers.add("Box", box_unwrapper());
    ASSERT_NE(unwrappers.find("Box"), nullptr);
    EXPECT_EQ(unwrappers.find("Crate"), nullptr);

    auto out = modify(
        *root, path, [](const schema& s) { return s.with_format("int64"); }, &unwrappers);
    ASSERT_TRUE(out);

    const auto& box = out->find_field("items")->type;
    EXPECT_EQ(box.name(), "Box");
    EXPECT_EQ(box.find_field("content")->type.metadata().format, "int64");
}

TEST(Modify, LensOutlivesUnwrapRegistry) {
    auto root = schema::product({field::of("items", box_of(schema::primitive(primitive_kind::integer)))});
    ASSERT_TRUE(root);

    auto lens = [&root] {
        unwrap_registry unwrappers;
        unwrappers.add("Box", box_unwrapper());
        return at(*root, field_path().field("items").each(), &unwrappers);
    }();
    ASSERT_TRUE(lens);

    EXPECT_EQ(lens->get(), schema::primitive(primitive_kind::integer));
    auto out = lens->modify([](const schema& s) { return s.with_format("int32"); });
    EXPECT_EQ(out.find_field("items")->type.find_field("content")->type.metadata().format, "int32");
}

TEST(Modify, UnsafePathMatchesCheckedPath) {
    auto root = basket_schema();
    auto transform = [](const schema& s) { return describe_as(s, "How many fruits?"); };

    auto checked = modify(root, amount_path(), transform);
    auto unsafe = modify_unsafe(root, {"fruits", "each", "amount"}, transform);
    ASSERT_TRUE(checked && unsafe);
    EXPECT_EQ(*checked, *unsafe);
}

TEST(Modify, UnsafePathFailsAtRuntime) {
    auto root = basket_schema();
    auto out = modify_unsafe(root, {"fruits", "amount"}, [](const schema& s) { return s; });
    ASSERT_FALSE(out);
    EXPECT_EQ(out.error(), error_kind::path_not_found);

    auto typo = modify_unsafe(root, {"fruit", "each", "amount"}, [](const schema& s) { return s; });
    EXPECT_FALSE(typo);
}

TEST(Modify, UnsafeEachIsFieldNameOnProducts) {
    auto root = schema::product({field::of("each", schema::primitive(primitive_kind::boolean))});
    ASSERT_TRUE(root);
    auto out = modify_unsafe(*root, {"each"}, [](const schema& s) { return s.with_description("flag"); });
    ASSERT_TRUE(out);
    EXPECT_EQ(out->find_field("each")->type.metadata().description, "flag");
}

TEST(Modify, UnsafeThroughCustomContainer) {
    auto root = schema::product({field::of("items", box_of(schema::primitive(primitive_kind::integer)))});
    ASSERT_TRUE(root);
    unwrap_registry unwrappers;
    unwrappers.add("Box", box_unwrapper());

    auto out = modify_unsafe(
        *root, {"items", "each"}, [](const schema& s) { return s.with_format("int64"); }, &unwrappers);
    ASSERT_TRUE(out);
    EXPECT_EQ(out->find_field("items")->type.find_field("content")->type.metadata().format, "int64");
}

TEST(Modify, PathsUseDeclaredFieldNames) {
    auto type = type_descriptor::product("Order").with_field(
        "createdAt", type_descriptor::primitive(primitive_kind::string));
    auto root = derive(type, configuration().with_snake_case_member_names());
    ASSERT_TRUE(root);
    EXPECT_EQ(root->fields()[0].encoded_name, "created_at");

    EXPECT_TRUE(at(*root, field_path().field("createdAt")));
    EXPECT_FALSE(at(*root, field_path().field("created_at")));
}

TEST(MakePath, ChecksAgainstDescriptor) {
    auto fruit_amount = type_descriptor::product("FruitAmount")
                            .with_field("amount", type_descriptor::primitive(primitive_kind::integer));
    auto basket = type_descriptor::product("Basket").with_field("fruits",
                                                                type_descriptor::array(fruit_amount));

    auto ok = make_path(basket,
                        {path_segment::field("fruits"), path_segment::each(), path_segment::field("amount")});
    ASSERT_TRUE(ok);
    EXPECT_EQ(*ok, amount_path());

    auto bad = make_path(basket, {path_segment::field("fruits"), path_segment::field("amount")});
    ASSERT_FALSE(bad);
    EXPECT_EQ(bad.error(), make_error_code(error_code::invalid_path));
}

TEST(MakePath, OpaqueTypesEndTheCheck) {
    auto invoice = type_descriptor::product("Invoice").with_field("total",
                                                                  type_descriptor::opaque("Money"));
    EXPECT_TRUE(make_path(invoice, {path_segment::field("total")}));
    EXPECT_FALSE(make_path(invoice, {path_segment::field("total"), path_segment::field("cents")}));
    EXPECT_FALSE(make_path(invoice, {path_segment::field("total"), path_segment::each()}));
}
