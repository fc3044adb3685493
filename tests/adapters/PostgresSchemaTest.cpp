#include <gtest/gtest.h>

#include "adapters/secondary/PostgresAccountRepository.hpp"

#include <fstream>
#include <sstream>

using identity::adapters::secondary::PostgresAccountRepository;

namespace {

std::string readSchema() {
    std::ifstream in(IDENTITY_SCHEMA_SQL);
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

} // namespace

TEST(PostgresSchemaTest, FingerprintConstraintDeclaredInSchema) {
    auto schema = readSchema();
    ASSERT_FALSE(schema.empty()) << "cannot read " << IDENTITY_SCHEMA_SQL;

    std::string declaration = std::string("CONSTRAINT ") + PostgresAccountRepository::kFingerprintConstraint +
                              " UNIQUE (device_fingerprint)";
    EXPECT_NE(schema.find(declaration), std::string::npos);
}

TEST(PostgresSchemaTest, InsertResolvesConflictByConstraintName) {
    std::string sql = PostgresAccountRepository::kInsertSql;

    std::string onConflict = std::string("ON CONFLICT ON CONSTRAINT ") +
                             PostgresAccountRepository::kFingerprintConstraint + " DO NOTHING";
    EXPECT_NE(sql.find(onConflict), std::string::npos);
    EXPECT_NE(sql.find("RETURNING account_id"), std::string::npos);
}

TEST(PostgresSchemaTest, SleepSessionsReferenceAccounts) {
    auto schema = readSchema();

    EXPECT_NE(schema.find("account_id  TEXT NOT NULL REFERENCES accounts (account_id)"), std::string::npos);
}
