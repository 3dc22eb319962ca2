#include "bindings.hpp"
#include "common/exceptions.hpp"
#include "gtest/gtest.h"
#include "test/assertions.hpp"

using namespace std;
using namespace nlohmann;
using namespace codebox;

TEST(BindingStoreTest, LocalsOverrideModuleBindingsTest) {
    binding_store store;
    store.set_module("rate", 0.5);
    store.set_module("name", "module");
    store.set_local("rate", 0.25);

    EXPECT_JSON_EQ(store.merged(), (json{{"rate", 0.25}, {"name", "module"}}));
    EXPECT_JSON_EQ(store.module_bindings(), (json{{"rate", 0.5}, {"name", "module"}}));
    EXPECT_JSON_EQ(store.local_bindings(), (json{{"rate", 0.25}}));
}

TEST(BindingStoreTest, FromJsonTest) {
    binding_store store = binding_store::from_json(
        {{"data", json::array({1, 2, 3})}},
        {{"config", {{"window", 20}}}});
    EXPECT_FALSE(store.empty());
    EXPECT_JSON_EQ(store.merged(), (json{{"data", {1, 2, 3}}, {"config", {{"window", 20}}}}));

    EXPECT_TRUE(binding_store::from_json(nullptr, nullptr).empty());
    EXPECT_TRUE(binding_store::from_json(json::object(), nullptr).empty());
}

TEST(BindingStoreTest, RejectsNonObjectNamespacesTest) {
    EXPECT_THROW(binding_store::from_json(json::array(), nullptr), validation_error);
    EXPECT_THROW(binding_store::from_json(nullptr, 42), validation_error);
}

TEST(BindingStoreTest, ValidNamesTest) {
    EXPECT_TRUE(binding_store::is_valid_name("x"));
    EXPECT_TRUE(binding_store::is_valid_name("_private"));
    EXPECT_TRUE(binding_store::is_valid_name("变量"));

    EXPECT_FALSE(binding_store::is_valid_name(""));
    EXPECT_FALSE(binding_store::is_valid_name("__builtins__"));
    EXPECT_FALSE(binding_store::is_valid_name("__name"));
    EXPECT_FALSE(binding_store::is_valid_name(string("a\0b", 3)));
    EXPECT_FALSE(binding_store::is_valid_name("\xff"));
}

TEST(BindingStoreTest, SetRejectsInvalidNameTest) {
    binding_store store;
    try {
        store.set_local("__import__", 1);
        FAIL() << "dunder name accepted";
    } catch (validation_error &e) {
        EXPECT_EQ(e.violated, constraint::INVALID_BINDING);
    }
    EXPECT_TRUE(store.empty());
}

TEST(BindingStoreTest, FilterCapturedTest) {
    json snapshot = {{"result", 2.0}, {"__doc__", nullptr}, {"_tmp", 1}};
    EXPECT_JSON_EQ(binding_store::filter_captured(snapshot), (json{{"result", 2.0}, {"_tmp", 1}}));
    EXPECT_JSON_EQ(binding_store::filter_captured(nullptr), json::object());
    EXPECT_JSON_EQ(binding_store::filter_captured(json::array({1})), json::object());
}
