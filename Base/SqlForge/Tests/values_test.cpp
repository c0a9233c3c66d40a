#include <gtest/gtest.h>

#include <QDateTime>
#include <QJsonObject>
#include <QUuid>
#include <any>
#include <optional>

#include "sqlforge/conversion.h"
#include "sqlforge/decimal.h"
#include "sqlforge/error.h"
#include "sqlforge/mysql/mysql_value.h"
#include "sqlforge/postgres/postgres_value.h"
#include "sqlforge/sqlite/sqlite_value.h"

namespace {

    using sqlforge::isEmptyOrNone;

    TEST(ConversionTest, EmptyOrNone) {
        EXPECT_TRUE(isEmptyOrNone(std::any()));
        EXPECT_TRUE(isEmptyOrNone(std::any(std::optional<int>())));
        EXPECT_TRUE(isEmptyOrNone(std::any(std::optional<std::optional<std::string>>(std::optional<std::string>()))));
        EXPECT_TRUE(isEmptyOrNone(std::any(std::string())));
        EXPECT_TRUE(isEmptyOrNone(std::any(std::string("null"))));
        EXPECT_TRUE(isEmptyOrNone(std::any(std::string("NULL"))));
        EXPECT_TRUE(isEmptyOrNone(std::any(QString())));
        EXPECT_TRUE(isEmptyOrNone(std::any(std::vector<std::uint8_t>())));
        EXPECT_TRUE(isEmptyOrNone(std::any(QByteArray())));

        EXPECT_FALSE(isEmptyOrNone(std::any(std::string("x"))));
        EXPECT_FALSE(isEmptyOrNone(std::any(std::string("nullable"))));
        EXPECT_FALSE(isEmptyOrNone(std::any(std::optional<std::string>("x"))));
        EXPECT_FALSE(isEmptyOrNone(std::any(0)));
        EXPECT_FALSE(isEmptyOrNone(std::any(false)));
        EXPECT_FALSE(isEmptyOrNone(std::any(QUuid::createUuid())));
    }

    TEST(ConversionTest, DecimalZero) {
        EXPECT_TRUE(sqlforge::Decimal("0.00").isZero());
        EXPECT_TRUE(sqlforge::Decimal("-0").isZero());
        EXPECT_FALSE(sqlforge::Decimal("0.01").isZero());
        EXPECT_FALSE(sqlforge::Decimal("").isZero());
        EXPECT_TRUE(isEmptyOrNone(std::any(sqlforge::Decimal())));
    }

    TEST(ErrorTest, ToStringIncludesDatabaseDetails) {
        sqlforge::Error plain(sqlforge::ErrorCode::RecordNotFound, "Record not found");
        EXPECT_NE(plain.toString().find("Record not found"), std::string::npos);
        EXPECT_TRUE(static_cast<bool>(plain));
        EXPECT_FALSE(static_cast<bool>(sqlforge::make_ok()));

        sqlforge::Error native(sqlforge::ErrorCode::QueryExecutionError, "duplicate key", 1062, "23000");
        const std::string text = native.toString();
        EXPECT_NE(text.find("1062"), std::string::npos);
        EXPECT_NE(text.find("23000"), std::string::npos);
    }

    // --- SQLite ---

    TEST(SqliteValueTest, KindsAndEncoding) {
        using sqlforge::sqlite::Value;
        EXPECT_EQ(Value().kind(), Value::Kind::Null);
        EXPECT_EQ(Value(std::nullopt).kind(), Value::Kind::Null);
        EXPECT_EQ(Value(true).kind(), Value::Kind::Bool);
        EXPECT_EQ(Value(42).kind(), Value::Kind::Integer);
        EXPECT_EQ(Value(4.5).kind(), Value::Kind::Real);
        EXPECT_EQ(Value("abc").kind(), Value::Kind::Text);
        EXPECT_EQ(Value(std::string("abc")), Value("abc"));
        EXPECT_EQ(Value(QByteArray("\x01\x02", 2)).kind(), Value::Kind::Blob);
        EXPECT_EQ(Value(std::optional<int>()).kind(), Value::Kind::Null);
        EXPECT_EQ(Value(std::optional<int>(3)), Value(3));

        EXPECT_EQ(std::get<qint64>(Value(true).encode()), 1);
        EXPECT_EQ(std::get<qint64>(Value(false).encode()), 0);
        EXPECT_EQ(std::get<std::string>(Value(QDate(2024, 2, 29)).encode()), "2024-02-29");
        EXPECT_EQ(std::get<std::string>(Value(QTime(8, 5, 3, 120)).encode()), "08:05:03.120");
        EXPECT_EQ(std::get<std::string>(Value(sqlforge::Decimal("12.50")).encode()), "12.50");
        EXPECT_TRUE(std::holds_alternative<std::monostate>(Value().encode()));

        QJsonObject object;
        object.insert("a", 1);
        EXPECT_EQ(std::get<std::string>(Value(object).encode()), "{\"a\":1}");
    }

    TEST(SqliteValueTest, DefaultValueDetection) {
        using sqlforge::sqlite::Value;
        EXPECT_TRUE(Value(0).isDefaultValue());
        EXPECT_TRUE(Value("").isDefaultValue());
        EXPECT_TRUE(Value(QUuid()).isDefaultValue());
        EXPECT_FALSE(Value(7).isDefaultValue());
        EXPECT_FALSE(Value(false).isDefaultValue());
        EXPECT_FALSE(Value().isDefaultValue());
    }

    TEST(SqliteValueTest, ToString) {
        using sqlforge::sqlite::Value;
        EXPECT_EQ(Value().toString(), "NULL");
        EXPECT_EQ(Value(true).toString(), "true");
        EXPECT_EQ(Value(-12).toString(), "-12");
        EXPECT_EQ(Value("hi").toString(), "hi");
        EXPECT_EQ(Value(QByteArray("\xab\xcd", 2)).toString(), "x'abcd'");
    }

    TEST(SqliteValueTest, ConvertFromAny) {
        using sqlforge::sqlite::Value;
        EXPECT_EQ(Value::convert(std::any(qint64(5))), Value(5));
        EXPECT_EQ(Value::convert(std::any(std::string("x"))), Value("x"));
        EXPECT_EQ(Value::convert(std::any(std::optional<int>(9))), Value(9));
        EXPECT_TRUE(Value::convert(std::any(std::optional<int>())).isNull());
        EXPECT_TRUE(Value::convert(std::any()).isNull());
        EXPECT_TRUE(Value::convert(std::any(std::pair<int, int>(1, 2))).isNull());
    }

    // --- MySQL ---

    TEST(MySqlValueTest, IntegerWidthsAndSignedness) {
        using sqlforge::mysql::Value;
        EXPECT_EQ(Value(std::int8_t(1)).kind(), Value::Kind::TinyInt);
        EXPECT_EQ(Value(std::int16_t(1)).kind(), Value::Kind::SmallInt);
        EXPECT_EQ(Value(std::int32_t(1)).kind(), Value::Kind::Int);
        EXPECT_EQ(Value(std::int64_t(1)).kind(), Value::Kind::BigInt);
        EXPECT_EQ(Value(std::uint8_t(1)).kind(), Value::Kind::TinyUnsigned);
        EXPECT_EQ(Value(std::uint32_t(1)).kind(), Value::Kind::IntUnsigned);
        EXPECT_EQ(Value(std::uint64_t(1)).kind(), Value::Kind::BigUnsigned);
        EXPECT_TRUE(Value(std::uint16_t(1)).isUnsigned());
        EXPECT_FALSE(Value(1).isUnsigned());
        EXPECT_EQ(Value(std::uint64_t(18446744073709551615ULL)).toString(), "18446744073709551615");
    }

    TEST(MySqlValueTest, TemporalAndOtherKinds) {
        using sqlforge::mysql::Value;
        EXPECT_EQ(Value(QDateTime::fromString("2024-01-01T00:00:00Z", Qt::ISODate)).kind(), Value::Kind::Timestamp);
        EXPECT_EQ(Value(QDateTime(QDate(2024, 1, 1), QTime(0, 0))).kind(), Value::Kind::DateTime);
        EXPECT_EQ(Value(QDate(2024, 1, 1)).kind(), Value::Kind::Date);
        EXPECT_EQ(Value(sqlforge::Decimal("1.5")).kind(), Value::Kind::Decimal);
        EXPECT_EQ(Value(boost::asio::ip::make_address_v4("10.0.0.1")).kind(), Value::Kind::Ipv4);
        EXPECT_EQ(Value(boost::asio::ip::make_address("::1")).kind(), Value::Kind::IpAddr);
        EXPECT_TRUE(Value(std::uint64_t(0)).isDefaultValue());
        EXPECT_FALSE(Value(false).isDefaultValue());
    }

    // --- PostgreSQL ---

    TEST(PostgresValueTest, IntegerPromotion) {
        using sqlforge::postgres::Value;
        EXPECT_EQ(Value(std::int16_t(1)).kind(), Value::Kind::Int2);
        EXPECT_EQ(Value(std::int32_t(1)).kind(), Value::Kind::Int4);
        EXPECT_EQ(Value(std::int64_t(1)).kind(), Value::Kind::Int8);
        EXPECT_EQ(Value(std::uint8_t(1)).kind(), Value::Kind::Int2);
        EXPECT_EQ(Value(std::uint16_t(1)).kind(), Value::Kind::Int4);
        EXPECT_EQ(Value(std::uint32_t(1)).kind(), Value::Kind::Int8);
        EXPECT_EQ(Value(std::uint64_t(1)).kind(), Value::Kind::Numeric);
        EXPECT_EQ(Value(std::uint64_t(18446744073709551615ULL)).toString(), "18446744073709551615");
    }

    TEST(PostgresValueTest, TypeOidsAndTextForm) {
        using sqlforge::postgres::Value;
        EXPECT_EQ(Value().typeOid(), 0u);
        EXPECT_EQ(Value(true).typeOid(), 16u);
        EXPECT_EQ(Value(std::int64_t(1)).typeOid(), 20u);
        EXPECT_EQ(Value("x").typeOid(), 25u);
        EXPECT_EQ(Value(QUuid()).typeOid(), 2950u);

        EXPECT_EQ(Value(true).toString(), "t");
        EXPECT_EQ(Value(false).toString(), "f");
        EXPECT_EQ(Value(QByteArray("\x01\xff", 2)).toString(), "\\x01ff");
        EXPECT_EQ(Value(sqlforge::postgres::Interval{1, 2, 3000000}).toString(), "1 mons 2 days 3000000 microseconds");
        EXPECT_EQ(Value(sqlforge::postgres::MacAddress{{0x08, 0x00, 0x2b, 0x01, 0x02, 0x03}}).toString(), "08:00:2b:01:02:03");
        EXPECT_EQ(Value(sqlforge::postgres::Network{boost::asio::ip::make_address("192.168.0.0"), 16}).toString(), "192.168.0.0/16");
        EXPECT_EQ(Value(sqlforge::postgres::Network{boost::asio::ip::make_address("192.168.0.0"), 16}).kind(), Value::Kind::Cidr);
    }

    TEST(PostgresValueTest, TimestampZoneSelectsKind) {
        using sqlforge::postgres::Value;
        const QDateTime utc = QDateTime::fromString("2024-05-01T12:30:00.250Z", Qt::ISODateWithMs);
        EXPECT_EQ(Value(utc).kind(), Value::Kind::Timestamptz);
        EXPECT_EQ(Value(utc).typeOid(), 1184u);
        EXPECT_EQ(Value(utc).toString(), "2024-05-01T12:30:00.250Z");
        EXPECT_EQ(Value(QDateTime(QDate(2024, 5, 1), QTime(12, 30))).kind(), Value::Kind::Timestamp);
    }

}  // namespace
