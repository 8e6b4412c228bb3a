//
// NamespaceMapper unit tests
//

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include <fmt/format.h>

#include "base/Errors.hpp"
#include "namespace/NamespaceMapper.hpp"

using oplogsync::ConfigurationError;
using oplogsync::config::MappingConfig;
using oplogsync::config::NamespaceRule;
using oplogsync::routing::FieldSet;
using oplogsync::routing::MappedNamespace;
using oplogsync::routing::NamespaceMapper;
using oplogsync::routing::Projection;

namespace {

NamespaceRule renameTo(const std::string &target) {
    NamespaceRule rule;
    rule.rename = target;
    return rule;
}

MappingConfig makeMapping(std::vector<std::pair<std::string, NamespaceRule>> mapping) {
    MappingConfig config;
    config.mapping = std::move(mapping);
    return config;
}

MappingConfig makeIncludes(std::vector<std::string> include) {
    MappingConfig config;
    config.include = std::move(include);
    return config;
}

MappingConfig makeExcludes(std::vector<std::string> exclude) {
    MappingConfig config;
    config.exclude = std::move(exclude);
    return config;
}

} // namespace

TEST_CASE("NamespaceMapper keeps every namespace without configuration", "[mapper]") {
    NamespaceMapper mapper;

    REQUIRE(mapper.isPassthrough());
    CHECK(mapper.resolve("db1.col1") == MappedNamespace("db1.col1"));
    CHECK(mapper.mapNamespace("db1.col1") == "db1.col1");
    CHECK(mapper.unmap("db1.col1") == "db1.col1");
    CHECK(mapper.mapDatabase("db1") == std::set<std::string>{"db1"});
}

TEST_CASE("NamespaceMapper includes plain namespaces", "[mapper]") {
    NamespaceMapper mapper(makeIncludes({"db1.col1", "db1.col2"}));

    CHECK(mapper.mapNamespace("db1.col1") == "db1.col1");
    CHECK(mapper.mapNamespace("db1.col2") == "db1.col2");
    CHECK_FALSE(mapper.mapNamespace("db1.col4").has_value());

    CHECK(mapper.unmap("db1.col1") == "db1.col1");
    CHECK(mapper.unmap("db1.col2") == "db1.col2");
    CHECK_FALSE(mapper.unmap("not.included").has_value());

    CHECK(mapper.mapDatabase("db1") == std::set<std::string>{"db1"});
    CHECK(mapper.mapDatabase("other").empty());

    CHECK(mapper.namespaces() == std::set<std::string>{"db1.col1", "db1.col2", "db1.$cmd"});
}

TEST_CASE("NamespaceMapper includes wildcard namespaces", "[mapper]") {
    NamespaceRule identityRule;

    std::vector<MappingConfig> equivalentConfigs {
        makeIncludes({"db1.*"}),
        makeMapping({{"db1.*", identityRule}}),
        makeMapping({{"db1.*", renameTo("db1.*")}})
    };

    for (const auto &config: equivalentConfigs) {
        NamespaceMapper mapper(config);

        CHECK(mapper.unmap("db1.col1") == "db1.col1");
        CHECK(mapper.resolve("db1.col1") == MappedNamespace("db1.col1"));
        CHECK(mapper.mapDatabase("db1") == std::set<std::string>{"db1"});
        CHECK(mapper.mapNamespace("db1.col1") == "db1.col1");
        CHECK_FALSE(mapper.mapNamespace("db2.col4").has_value());
    }
}

TEST_CASE("NamespaceMapper database wildcard does not match a period", "[mapper]") {
    NamespaceMapper mapper(makeIncludes({"db*.col"}));

    CHECK_FALSE(mapper.mapNamespace("db.bar.col").has_value());
    CHECK(mapper.mapNamespace("db1.col") == "db1.col");
}

TEST_CASE("NamespaceMapper excludes plain namespaces", "[mapper]") {
    NamespaceMapper mapper(makeExcludes({"ex.clude"}));

    CHECK(mapper.unmap("db.col") == "db.col");
    CHECK(mapper.unmap("ex.clude") == "ex.clude");
    CHECK(mapper.mapNamespace("db.col") == "db.col");
    CHECK_FALSE(mapper.mapNamespace("ex.clude").has_value());
}

TEST_CASE("NamespaceMapper excludes wildcard namespaces", "[mapper]") {
    NamespaceMapper mapper(makeExcludes({"ex.*"}));

    CHECK(mapper.unmap("db.col") == "db.col");
    CHECK(mapper.unmap("ex.clude") == "ex.clude");
    CHECK(mapper.mapNamespace("db.col") == "db.col");
    CHECK_FALSE(mapper.mapNamespace("ex.clude").has_value());
    CHECK_FALSE(mapper.mapNamespace("ex.clude2").has_value());
}

TEST_CASE("NamespaceMapper exclusion wins over an explicit mapping", "[mapper]") {
    auto config = makeMapping({{"db.*", renameTo("backup.*")}});
    config.exclude = {"db.secret"};

    NamespaceMapper mapper(config);

    CHECK_FALSE(mapper.resolve("db.secret").has_value());
    CHECK(mapper.mapNamespace("db.open") == "backup.open");
}

TEST_CASE("NamespaceMapper unmaps namespaces that were never resolved", "[mapper]") {
    NamespaceMapper mapper(makeMapping({
        {"db2.*", renameTo("db2.f*")},
        {"db_*.foo", renameTo("db_new_*.foo")}
    }));

    CHECK(mapper.unmap("db2.foo") == "db2.oo");
    CHECK(mapper.unmap("db_new_123.foo") == "db_123.foo");
    CHECK_FALSE(mapper.unmap("other.foo").has_value());

    // unmap never learns
    CHECK(mapper.mapDatabase("db_123") == std::set<std::string>{"db_new_123"});
}

TEST_CASE("NamespaceMapper renames plain namespaces", "[mapper]") {
    NamespaceMapper mapper(makeMapping({
        {"db1.col1", renameTo("newdb.newcol")},
        {"db1.col2", renameTo("otherdb.col2")}
    }));

    CHECK(mapper.mapNamespace("db1.col1") == "newdb.newcol");
    CHECK(mapper.unmap("newdb.newcol") == "db1.col1");
    CHECK(mapper.mapNamespace("db1.$cmd") == "otherdb.$cmd");
    CHECK(mapper.mapDatabase("db1") == std::set<std::string>{"newdb", "otherdb"});
}

TEST_CASE("NamespaceMapper keeps every command target of a renamed database", "[mapper]") {
    NamespaceMapper mapper(makeMapping({
        {"db1.a", renameTo("x.a")},
        {"db1.b", renameTo("y.b")}
    }));

    CHECK(mapper.mapNamespace("db1.$cmd") == "y.$cmd");
    CHECK(mapper.unmap("x.$cmd") == "db1.$cmd");
    CHECK(mapper.unmap("y.$cmd") == "db1.$cmd");
    CHECK(mapper.mapDatabase("db1") == std::set<std::string>{"x", "y"});
}

TEST_CASE("NamespaceMapper learned wildcard mappings are stable", "[mapper]") {
    NamespaceRule rule = renameTo("db_new_*.foo");
    rule.includeFields = {"a"};

    NamespaceMapper mapper(makeMapping({{"db_*.foo", rule}}));

    auto first = mapper.resolve("db_7.foo");
    auto second = mapper.resolve("db_7.foo");

    REQUIRE(first.has_value());
    REQUIRE(second.has_value());
    CHECK(*first == *second);
    CHECK(first->name() == "db_new_7.foo");
    CHECK(first->includeFields() == FieldSet{"_id", "a"});
    CHECK(mapper.unmap(first->name()) == "db_7.foo");

    CHECK(mapper.mapDatabase("db_7") == std::set<std::string>{"db_new_7"});
    CHECK(mapper.mapDatabase("db_8") == std::set<std::string>{"db_new_8"});
    CHECK(mapper.mapDatabase("unrelated").empty());
}

TEST_CASE("NamespaceMapper rejects two sources mapped to one target", "[mapper][validation]") {
    REQUIRE_THROWS_AS(NamespaceMapper(makeMapping({
        {"db1.col1", renameTo("newdb.newcol")},
        {"db2.col1", renameTo("newdb.newcol")}
    })), ConfigurationError);

    NamespaceMapper mapper(makeMapping({
        {"db*.col1", renameTo("newdb.newcol*")},
        {"db*.col2", renameTo("newdb.newcol*")}
    }));

    CHECK(mapper.mapNamespace("db1.col1") == "newdb.newcol1");
    REQUIRE_THROWS_AS(mapper.mapNamespace("db1.col2"), ConfigurationError);

    // the first mapping is unaffected by the rejected one
    CHECK(mapper.unmap("newdb.newcol1") == "db1.col1");
}

TEST_CASE("NamespaceMapper rejects two source databases sharing a target database in any order",
          "[mapper][validation]") {
    SECTION("shared database registered first") {
        REQUIRE_THROWS_AS(NamespaceMapper(makeMapping({
            {"db1.a", renameTo("x.a")},
            {"db1.b", renameTo("y.b")},
            {"db2.c", renameTo("x.c")}
        })), ConfigurationError);
    }

    SECTION("shared database registered last") {
        REQUIRE_THROWS_AS(NamespaceMapper(makeMapping({
            {"db1.a", renameTo("y.a")},
            {"db1.b", renameTo("x.b")},
            {"db2.c", renameTo("x.c")}
        })), ConfigurationError);
    }
}

TEST_CASE("NamespaceMapper validates field scopes", "[mapper][validation]") {
    NamespaceRule mixed;
    mixed.includeFields = {"a"};
    mixed.excludeFields = {"b"};
    REQUIRE_THROWS_AS(NamespaceMapper(makeMapping({{"db.col", mixed}})), ConfigurationError);

    NamespaceRule excludes;
    excludes.excludeFields = {"b"};
    auto globalInclude = makeMapping({{"db.col", excludes}});
    globalInclude.includeFields = {"a"};
    REQUIRE_THROWS_AS(NamespaceMapper(globalInclude), ConfigurationError);

    NamespaceRule includes;
    includes.includeFields = {"a"};
    auto globalExclude = makeMapping({{"db.col", includes}});
    globalExclude.excludeFields = {"b"};
    REQUIRE_THROWS_AS(NamespaceMapper(globalExclude), ConfigurationError);

    MappingConfig bothGlobals;
    bothGlobals.includeFields = {"a"};
    bothGlobals.excludeFields = {"b"};
    REQUIRE_THROWS_AS(NamespaceMapper(bothGlobals), ConfigurationError);
}

TEST_CASE("NamespaceMapper validates wildcard shapes", "[mapper][validation]") {
    REQUIRE_THROWS_AS(NamespaceMapper(makeMapping({{"db.*", renameTo("db.all")}})), ConfigurationError);
    REQUIRE_THROWS_AS(NamespaceMapper(makeMapping({{"db.col", renameTo("db.*")}})), ConfigurationError);
    REQUIRE_THROWS_AS(NamespaceMapper(makeMapping({{"db*.col*", renameTo("x*.y*")}})), ConfigurationError);
    REQUIRE_THROWS_AS(NamespaceMapper(makeMapping({{"db.col", renameTo("nocollection")}})), ConfigurationError);

    auto both = makeIncludes({"db.col"});
    both.exclude = {"db.other"};
    REQUIRE_THROWS_AS(NamespaceMapper(both), ConfigurationError);
}

TEST_CASE("NamespaceMapper projection adds the mandatory fields", "[mapper][projection]") {
    auto config = makeIncludes({"db.*"});
    config.includeFields = {"foo", "nested.field"};

    NamespaceMapper mapper(config);

    auto projection = mapper.projection("db.foo", std::nullopt);
    REQUIRE(projection.has_value());
    CHECK(*projection == Projection{{"_id", 1}, {"foo", 1}, {"nested.field", 1}});

    CHECK_FALSE(mapper.projection("ignored.name", std::nullopt).has_value());

    auto merged = mapper.projection("db.foo", Projection{{"foo", 0}, {"extra", 1}});
    REQUIRE(merged.has_value());
    CHECK(*merged == Projection{{"_id", 1}, {"foo", 0}, {"nested.field", 1}, {"extra", 1}});
}

TEST_CASE("NamespaceMapper projection with exclude fields", "[mapper][projection]") {
    NamespaceRule rule;
    rule.excludeFields = {"secret", "_id"};

    NamespaceMapper mapper(makeMapping({{"db.col", rule}}));

    auto fields = mapper.fields("db.col");
    CHECK_FALSE(fields.first.has_value());
    CHECK(fields.second == FieldSet{"secret"});

    auto projection = mapper.projection("db.col", std::nullopt);
    REQUIRE(projection.has_value());
    CHECK(*projection == Projection{{"secret", 0}});
}

TEST_CASE("NamespaceMapper projection without field restriction", "[mapper][projection]") {
    NamespaceMapper mapper;

    CHECK_FALSE(mapper.projection("a.b", std::nullopt).has_value());
    CHECK(mapper.projection("a.b", Projection{{"x", 1}}) == Projection{{"x", 1}});

    auto fields = mapper.fields("a.b");
    CHECK_FALSE(fields.first.has_value());
    CHECK_FALSE(fields.second.has_value());
}

TEST_CASE("NamespaceMapper namespace fields take precedence over defaults", "[mapper][projection]") {
    NamespaceRule rule;
    rule.includeFields = {"b"};

    auto config = makeMapping({{"db.col", rule}});
    config.include = {"db.other"};
    config.includeFields = {"a"};

    NamespaceMapper mapper(config);

    CHECK(mapper.fields("db.col").first == FieldSet{"_id", "b"});
    CHECK(mapper.fields("db.other").first == FieldSet{"_id", "a"});

    auto unknown = mapper.fields("unknown.col");
    CHECK_FALSE(unknown.first.has_value());
    CHECK_FALSE(unknown.second.has_value());
}

TEST_CASE("NamespaceMapper resolves concurrently to a single learned mapping", "[mapper][concurrency]") {
    NamespaceMapper mapper(makeMapping({{"db*.col", renameTo("new*.col")}}));

    constexpr int threadCount = 8;
    constexpr int namespaceCount = 200;

    std::atomic<int> failures{0};
    std::vector<std::thread> threads;

    for (int i = 0; i < threadCount; i++) {
        threads.emplace_back([&mapper, &failures]() {
            for (int j = 0; j < namespaceCount; j++) {
                auto source = fmt::format("db{}.col", j);
                auto expected = fmt::format("new{}.col", j);

                try {
                    if (mapper.mapNamespace(source) != expected) {
                        failures++;
                    }
                } catch (const ConfigurationError &) {
                    failures++;
                }
            }
        });
    }

    for (auto &thread: threads) {
        thread.join();
    }

    CHECK(failures.load() == 0);

    for (int j = 0; j < namespaceCount; j++) {
        CHECK(mapper.unmap(fmt::format("new{}.col", j)) == fmt::format("db{}.col", j));
    }
}
