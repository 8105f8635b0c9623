#include <gtest/gtest.h>
#include "core/DatabaseSession.hpp"
#include "core/Lazy.hpp"
#include "support/TempProject.hpp"

using namespace sf_boost;

TEST(LazyTest, CreatesOnceOnFirstGet) {
    int calls = 0;
    Lazy<int> value([&calls]() {
        ++calls;
        return std::make_unique<int>(42);
    });

    EXPECT_FALSE(value.initialized());
    EXPECT_EQ(calls, 0);

    EXPECT_EQ(value.get(), 42);
    EXPECT_EQ(&value.get(), &value.get());
    EXPECT_TRUE(value.initialized());
    EXPECT_EQ(calls, 1);
}

TEST(LazyTest, FailureIsNotCached) {
    int calls = 0;
    Lazy<int> value([&calls]() -> std::unique_ptr<int> {
        if (++calls == 1) {
            throw std::runtime_error("not yet");
        }
        return std::make_unique<int>(7);
    });

    EXPECT_THROW(value.get(), std::runtime_error);
    EXPECT_FALSE(value.initialized());
    EXPECT_EQ(value.get(), 7);
    EXPECT_EQ(calls, 2);
}

TEST(LazyTest, NullFactoryRejected) {
    EXPECT_THROW(Lazy<int>{Lazy<int>::Factory()}, std::invalid_argument);
}

class DatabaseSessionTest : public ::testing::Test {
protected:
    DatabaseConfig sqlite_config(const std::string& file) {
        return parse_database_url("sqlite:///" + file, project_.root());
    }

    test_support::TempProject project_;
};

TEST_F(DatabaseSessionTest, OpensLazilyAndReuses) {
    std::filesystem::create_directories(project_.root() / "var");
    Database::open((project_.root() / "var/app.db").string(), false)
        ->exec("CREATE TABLE t (id INTEGER)");

    DatabaseSession session(sqlite_config("var/app.db"));
    EXPECT_FALSE(session.is_connected());
    EXPECT_EQ(session.platform_name(), "SQLitePlatform");
    EXPECT_FALSE(session.is_connected());

    Database& first = session.connection();
    EXPECT_TRUE(session.is_connected());
    EXPECT_EQ(&first, &session.connection());
    EXPECT_EQ(first.fetch_one("SELECT COUNT(*) FROM t"), 0);
}

TEST_F(DatabaseSessionTest, RetriesAfterFailedOpen) {
    DatabaseSession session(sqlite_config("var/late.db"));
    EXPECT_THROW(session.connection(), DatabaseError);
    EXPECT_FALSE(session.is_connected());

    std::filesystem::create_directories(project_.root() / "var");
    Database::open((project_.root() / "var/late.db").string(), false)
        ->exec("CREATE TABLE t (id INTEGER)");
    EXPECT_NO_THROW(session.connection());
    EXPECT_TRUE(session.is_connected());
}

TEST_F(DatabaseSessionTest, NotConfigured) {
    DatabaseSession session(std::nullopt);
    EXPECT_EQ(session.platform_name(), "unknown");
    try {
        session.connection();
        FAIL() << "Expected DatabaseError";
    } catch (const DatabaseError& e) {
        EXPECT_STREQ(e.what(), "DATABASE_URL is not configured");
    }
}

TEST_F(DatabaseSessionTest, UnsupportedDriverNamed) {
    DatabaseSession session(parse_database_url("mysql://root@localhost/app", project_.root()));
    EXPECT_EQ(session.platform_name(), "MySQLPlatform");
    try {
        session.connection();
        FAIL() << "Expected DatabaseError";
    } catch (const DatabaseError& e) {
        EXPECT_NE(std::string(e.what()).find("pdo_mysql"), std::string::npos);
    }
}
