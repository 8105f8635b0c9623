#include <gtest/gtest.h>
#include "core/Database.hpp"
#include "core/SchemaInspector.hpp"
#include "support/TempProject.hpp"
#include <type_traits>

using namespace sf_boost;
using json = nlohmann::json;

class DatabaseTest : public ::testing::Test {
protected:
    void SetUp() override {
        db_path_ = (project_.root() / "var" / "data.db").string();
        std::filesystem::create_directories(project_.root() / "var");

        auto writer = Database::open(db_path_, false);
        writer->exec(
            "CREATE TABLE category ("
            "  id INTEGER PRIMARY KEY AUTOINCREMENT,"
            "  name VARCHAR(255) NOT NULL"
            ");"
            "CREATE TABLE product ("
            "  id INTEGER PRIMARY KEY,"
            "  category_id INTEGER REFERENCES category(id),"
            "  title VARCHAR(180) NOT NULL DEFAULT 'untitled',"
            "  price DOUBLE PRECISION,"
            "  description TEXT,"
            "  active BOOLEAN NOT NULL DEFAULT 1,"
            "  created_at DATETIME"
            ");"
            "CREATE UNIQUE INDEX uniq_product_title ON product (title);"
            "CREATE TABLE order_line ("
            "  order_id INTEGER NOT NULL,"
            "  line_no INTEGER NOT NULL,"
            "  PRIMARY KEY (order_id, line_no)"
            ");"
            "INSERT INTO category (name) VALUES ('Books'), ('Music');"
            "INSERT INTO product (category_id, title, price) VALUES"
            "  (1, 'C++ Primer', 49.5), (1, 'Effective C++', 39.0), (2, 'Kind of Blue', NULL);");
    }

    test_support::TempProject project_;
    std::string db_path_;
};

TEST_F(DatabaseTest, FetchAllReturnsTypedRows) {
    auto db = Database::open(db_path_);
    json rows = db->fetch_all("SELECT id, title, price FROM product ORDER BY id");

    ASSERT_EQ(rows.size(), 3u);
    EXPECT_EQ(rows[0]["id"], 1);
    EXPECT_TRUE(rows[0]["id"].is_number_integer());
    EXPECT_EQ(rows[0]["title"], "C++ Primer");
    EXPECT_DOUBLE_EQ(rows[0]["price"].get<double>(), 49.5);
    EXPECT_TRUE(rows[2]["price"].is_null());
}

TEST_F(DatabaseTest, FetchOne) {
    auto db = Database::open(db_path_);
    EXPECT_EQ(db->fetch_one("SELECT COUNT(*) FROM product"), 3);
    EXPECT_TRUE(db->fetch_one("SELECT id FROM product WHERE id = 99").is_null());
}

TEST_F(DatabaseTest, ReadOnlyConnectionRejectsWrites) {
    auto db = Database::open(db_path_);
    EXPECT_THROW(db->exec("DELETE FROM product"), DatabaseError);
    EXPECT_EQ(db->fetch_one("SELECT COUNT(*) FROM product"), 3);
}

TEST_F(DatabaseTest, InvalidSqlThrows) {
    auto db = Database::open(db_path_);
    EXPECT_THROW(db->fetch_all("SELEC nothing"), DatabaseError);
    EXPECT_THROW(db->fetch_all("SELECT * FROM missing_table"), DatabaseError);
}

TEST_F(DatabaseTest, OnlyOpenCreatesConnections) {
    EXPECT_FALSE((std::is_constructible<Database, sqlite3*>::value));
    auto db = Database::open(":memory:", false);
    ASSERT_NE(db, nullptr);
    EXPECT_NE(db->connection(), nullptr);
    EXPECT_EQ(db->fetch_one("SELECT 42"), 42);
}

TEST_F(DatabaseTest, MissingFileCannotBeOpenedReadOnly) {
    EXPECT_THROW(Database::open((project_.root() / "nope.db").string()), DatabaseError);
}

TEST_F(DatabaseTest, QuoteIdentifier) {
    EXPECT_EQ(Database::quote_identifier("user"), "\"user\"");
    EXPECT_EQ(Database::quote_identifier("we\"ird"), "\"we\"\"ird\"");
}

TEST_F(DatabaseTest, TableNames) {
    auto db = Database::open(db_path_);
    SchemaInspector inspector(*db);

    // sqlite_sequence (from AUTOINCREMENT) is internal
    std::vector<std::string> expected{"category", "order_line", "product"};
    EXPECT_EQ(inspector.table_names(), expected);
    EXPECT_TRUE(inspector.table_exists("product"));
    EXPECT_FALSE(inspector.table_exists("products"));
    EXPECT_FALSE(inspector.table_exists("x' OR '1'='1"));
}

TEST_F(DatabaseTest, Columns) {
    auto db = Database::open(db_path_);
    SchemaInspector inspector(*db);

    auto columns = inspector.columns("product");
    ASSERT_EQ(columns.size(), 7u);

    EXPECT_EQ(columns[0].name, "id");
    EXPECT_EQ(columns[0].type, "Integer");
    EXPECT_TRUE(columns[0].primary_key);

    EXPECT_EQ(columns[2].name, "title");
    EXPECT_EQ(columns[2].type, "String");
    EXPECT_FALSE(columns[2].nullable);
    EXPECT_EQ(columns[2].default_value, "'untitled'");

    EXPECT_EQ(columns[3].type, "Float");
    EXPECT_EQ(columns[4].type, "Text");
    EXPECT_TRUE(columns[4].nullable);
    EXPECT_TRUE(columns[4].default_value.is_null());
    EXPECT_EQ(columns[5].type, "Boolean");
    EXPECT_EQ(columns[6].type, "DateTime");
}

TEST_F(DatabaseTest, IndexesIncludePrimaryKey) {
    auto db = Database::open(db_path_);
    SchemaInspector inspector(*db);

    auto indexes = inspector.indexes("product");
    ASSERT_EQ(indexes.size(), 2u);
    EXPECT_EQ(indexes[0].name, "primary");
    EXPECT_TRUE(indexes[0].primary);
    EXPECT_EQ(indexes[0].columns, std::vector<std::string>{"id"});
    EXPECT_EQ(indexes[1].name, "uniq_product_title");
    EXPECT_TRUE(indexes[1].unique);
    EXPECT_FALSE(indexes[1].primary);
    EXPECT_EQ(indexes[1].columns, std::vector<std::string>{"title"});

    // Composite keys get a real autoindex
    auto composite = inspector.indexes("order_line");
    ASSERT_EQ(composite.size(), 1u);
    EXPECT_TRUE(composite[0].primary);
    std::vector<std::string> key{"order_id", "line_no"};
    EXPECT_EQ(composite[0].columns, key);
}

TEST_F(DatabaseTest, ForeignKeys) {
    auto db = Database::open(db_path_);
    SchemaInspector inspector(*db);

    auto keys = inspector.foreign_keys("product");
    ASSERT_EQ(keys.size(), 1u);
    EXPECT_EQ(keys[0].name, "fk_product_0");
    EXPECT_EQ(keys[0].foreign_table, "category");
    EXPECT_EQ(keys[0].local_columns, std::vector<std::string>{"category_id"});
    EXPECT_EQ(keys[0].foreign_columns, std::vector<std::string>{"id"});

    EXPECT_TRUE(inspector.foreign_keys("category").empty());
}

TEST_F(DatabaseTest, CountRows) {
    auto db = Database::open(db_path_);
    SchemaInspector inspector(*db);

    EXPECT_EQ(inspector.count_rows("product"), 3);
    EXPECT_EQ(inspector.count_rows("order_line"), 0);
}

TEST(SchemaInspectorTypeTest, DoctrineTypeNames) {
    EXPECT_EQ(SchemaInspector::doctrine_type_name("INTEGER"), "Integer");
    EXPECT_EQ(SchemaInspector::doctrine_type_name("bigint"), "BigInt");
    EXPECT_EQ(SchemaInspector::doctrine_type_name("VARCHAR(255)"), "String");
    EXPECT_EQ(SchemaInspector::doctrine_type_name("CLOB"), "Text");
    EXPECT_EQ(SchemaInspector::doctrine_type_name("DATE"), "Date");
    EXPECT_EQ(SchemaInspector::doctrine_type_name("NUMERIC(10, 2)"), "Decimal");
    EXPECT_EQ(SchemaInspector::doctrine_type_name(""), "String");
    EXPECT_EQ(SchemaInspector::doctrine_type_name("GEOMETRY"), "GEOMETRY");
}
