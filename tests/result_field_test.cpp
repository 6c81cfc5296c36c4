#include "common/error.hpp"
#include "database/catalog.hpp"
#include "database/database.hpp"
#include "document/key_encoding.hpp"
#include "query/result_field.hpp"
#include "query/statement.hpp"
#include "storage/memory_engine.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace docdb::query {

namespace {

using Fields = std::vector<std::pair<std::string, Value>>;

Fields collect(const Document& doc) {
    Fields out;
    EXPECT_FALSE(doc.iterate([&](std::string_view name, const Value& v) -> std::error_code {
        out.emplace_back(std::string(name), v);
        return {};
    }));
    return out;
}

std::vector<std::string> names_of(const Fields& fields) {
    std::vector<std::string> out;
    for (const auto& [name, v] : fields) {
        out.push_back(name);
    }
    return out;
}

} // anonymous namespace

// ── DocumentMask over an in-memory document ──────────────────────────────────

class DocumentMaskTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto doc = std::make_shared<FieldBuffer>();
        doc->add("name", Value::text("ada")).add("age", Value::integer(36));
        source_ = doc;
    }

    DocumentMask mask(std::vector<ResultField> fields, const TableConfig* config = nullptr) {
        return DocumentMask(source_,
                            std::make_shared<const std::vector<ResultField>>(std::move(fields)),
                            EvalStack{.config = config, .params = &params_});
    }

    DocumentPtr source_;
    Params params_;
};

TEST_F(DocumentMaskTest, WildcardPlusExpressionIsUnionOfFields) {
    auto next_age = add(field("age"), int_lit(1));
    auto m = mask({Wildcard{}, ResultFieldExpr{next_age, "next"}, ResultFieldExpr{field("name"), ""}});

    auto fields = collect(m);
    EXPECT_EQ(names_of(fields), (std::vector<std::string>{"name", "age", "next", "name"}));

    Value direct;
    ASSERT_FALSE(next_age->eval(EvalStack{.doc = source_.get()}, direct));
    EXPECT_TRUE(values_equal(fields[2].second, direct));
    EXPECT_EQ(fields[3].second.as_bytes(), "ada");
}

TEST_F(DocumentMaskTest, LookupByResultName) {
    auto m = mask({ResultFieldExpr{add(field("age"), int_lit(1)), "next"},
                   ResultFieldExpr{field("name"), ""}});

    Value v;
    ASSERT_FALSE(m.get_by_field("next", v));
    EXPECT_EQ(v.as_int64(), 37);
    ASSERT_FALSE(m.get_by_field("name", v));
    EXPECT_EQ(v.as_bytes(), "ada");

    // Fields of the source that were not projected are hidden.
    EXPECT_EQ(m.get_by_field("age", v), errc::field_not_found);
}

TEST_F(DocumentMaskTest, WildcardExposesSourceFields) {
    auto m = mask({Wildcard{}});
    Value v;
    ASSERT_FALSE(m.get_by_field("age", v));
    EXPECT_EQ(v.as_int64(), 36);
    EXPECT_EQ(m.get_by_field("ghost", v), errc::field_not_found);
}

TEST_F(DocumentMaskTest, UnnamedExpressionUsesItsRendering) {
    auto m = mask({ResultFieldExpr{add(field("age"), int_lit(1)), ""}});
    EXPECT_EQ(names_of(collect(m)), (std::vector<std::string>{"age + 1"}));

    Value v;
    ASSERT_FALSE(m.get_by_field("age + 1", v));
    EXPECT_EQ(v.as_int64(), 37);
}

TEST_F(DocumentMaskTest, MissingFieldIsOmitted) {
    auto m = mask({ResultFieldExpr{field("ghost"), ""}, ResultFieldExpr{field("age"), ""}});
    EXPECT_EQ(names_of(collect(m)), (std::vector<std::string>{"age"}));

    Value v;
    EXPECT_EQ(m.get_by_field("ghost", v), errc::field_not_found);
}

TEST_F(DocumentMaskTest, OtherEvaluationErrorsPropagate) {
    auto m = mask({ResultFieldExpr{param(3), "p"}});
    auto ec = m.iterate([](std::string_view, const Value&) -> std::error_code { return {}; });
    EXPECT_EQ(ec, errc::param_not_found);

    Value v;
    EXPECT_EQ(m.get_by_field("p", v), errc::param_not_found);
}

TEST_F(DocumentMaskTest, KeepsSourceKey) {
    auto doc = std::make_shared<FieldBuffer>();
    doc->set_key("k1");
    source_ = doc;
    EXPECT_EQ(mask({Wildcard{}}).key(), "k1");
}

TEST(ResultFieldNameTest, Names) {
    TableConfig with_pk{.name = "users", .primary_key = ValuePath::parse("id")};
    TableConfig without_pk{.name = "log"};

    EXPECT_EQ(result_field_name(ResultFieldExpr{field("a.b"), ""}, nullptr), "a.b");
    EXPECT_EQ(result_field_name(ResultFieldExpr{field("a.b"), "x"}, nullptr), "x");
    EXPECT_EQ(result_field_name(Wildcard{}, nullptr), "*");
    EXPECT_EQ(result_field_name(KeyFunc{}, &with_pk), "id");
    EXPECT_EQ(result_field_name(KeyFunc{}, &without_pk), "key()");
    EXPECT_EQ(result_field_name(KeyFunc{}, nullptr), "key()");
}

// ── key() through SELECT ─────────────────────────────────────────────────────

class KeyProjectionTest : public ::testing::Test {
protected:
    void SetUp() override {
        db_ = std::make_unique<Database>(std::make_unique<storage::MemoryEngine>());
        ASSERT_FALSE(db_->update([](storage::Transaction& tx) -> std::error_code {
            Catalog catalog(tx);
            if (auto ec = catalog.create_table({.name = "log"})) return ec;
            return catalog.create_table({.name = "users", .primary_key = ValuePath::parse("id")});
        }));

        InsertStmt log;
        log.table = "log";
        log.field_names = {"msg"};
        log.rows = {{text_lit("a")}, {text_lit("b")}, {text_lit("c")}};
        Result r;
        ASSERT_FALSE(execute(*db_, log, Params{}, r));

        InsertStmt users;
        users.table = "users";
        users.field_names = {"id", "name"};
        users.rows = {{int_lit(10), text_lit("ada")}, {int_lit(20), text_lit("bob")}};
        ASSERT_FALSE(execute(*db_, users, Params{}, r));
    }

    // Every row of `table` projected through {key(), *}.
    std::vector<Fields> select_keys(const std::string& table, std::vector<std::string>& storage_keys) {
        SelectStmt stmt;
        stmt.table = table;
        stmt.fields = {KeyFunc{}, Wildcard{}};

        Result r;
        EXPECT_FALSE(execute(*db_, stmt, Params{}, r));
        std::vector<Fields> rows;
        EXPECT_FALSE(r.iterate([&](const DocumentPtr& doc) -> std::error_code {
            storage_keys.emplace_back(doc->key());
            rows.push_back(collect(*doc));
            return {};
        }));
        return rows;
    }

    std::unique_ptr<Database> db_;
};

TEST_F(KeyProjectionTest, KeyOfTableWithoutPrimaryKeyDecodesStorageKey) {
    std::vector<std::string> storage_keys;
    auto rows = select_keys("log", storage_keys);
    ASSERT_EQ(rows.size(), 3u);

    for (std::size_t i = 0; i < rows.size(); ++i) {
        ASSERT_FALSE(rows[i].empty());
        EXPECT_EQ(rows[i][0].first, "key()");

        std::string_view in = storage_keys[i];
        Value decoded;
        ASSERT_FALSE(keys::decode_value(in, decoded));
        EXPECT_EQ(rows[i][0].second.as_int64(), decoded.as_int64());
        EXPECT_EQ(rows[i][0].second.as_int64(), static_cast<int64_t>(i + 1));
    }
}

TEST_F(KeyProjectionTest, KeyOfTableWithPrimaryKeyEmitsThePath) {
    std::vector<std::string> storage_keys;
    auto rows = select_keys("users", storage_keys);
    ASSERT_EQ(rows.size(), 2u);

    EXPECT_EQ(names_of(rows[0]), (std::vector<std::string>{"id", "id", "name"}));
    EXPECT_EQ(rows[0][0].second.as_int64(), 10);
    EXPECT_EQ(rows[1][0].second.as_int64(), 20);
}

TEST_F(KeyProjectionTest, KeyFieldIsAddressableByName) {
    SelectStmt stmt;
    stmt.table = "log";
    stmt.fields = {KeyFunc{}};
    stmt.where = eq(key_func(), int_lit(2));

    Result r;
    ASSERT_FALSE(execute(*db_, stmt, Params{}, r));
    int rows = 0;
    ASSERT_FALSE(r.iterate([&](const DocumentPtr& doc) -> std::error_code {
        ++rows;
        Value v;
        if (auto ec = doc->get_by_field("key()", v)) return ec;
        EXPECT_EQ(v.as_int64(), 2);
        EXPECT_EQ(doc->get_by_field("msg", v), errc::field_not_found);
        return {};
    }));
    EXPECT_EQ(rows, 1);
}

} // namespace docdb::query
