#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "ConnectionTester.hpp"
#include "FakeDriver.hpp"

using namespace odbcmcp;
using namespace odbcmcp::fake;
using ::testing::HasSubstr;

class ConnectionTesterTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.profiles.push_back(makeProfile("warehouse"));

        driver_.info[InfoType::DriverName] = "libfake.so";
        driver_.info[InfoType::DriverVersion] = "03.80";
        driver_.info[InfoType::DbmsName] = "FakeDB";

        FakeTable version;
        version.columns = {column("")};
        version.rows = {{std::string("FakeDB 1.2.3")}};
        driver_.script("SELECT @@version", version);
    }

    Config config_;
    FakeDriver driver_;
};

TEST_F(ConnectionTesterTest, ReportsAvailableDetails) {
    ConnectionManager manager(config_, driver_);
    ConnectionTester tester(manager);

    ConnectionStatus status = tester.test(std::nullopt);

    EXPECT_TRUE(status.connected);
    EXPECT_EQ(status.connectionName, "warehouse");
    EXPECT_FALSE(status.error.has_value());
    EXPECT_EQ(status.serverVersion, std::optional<std::string>("FakeDB 1.2.3"));
    EXPECT_EQ(status.driverName, std::optional<std::string>("libfake.so"));
    EXPECT_EQ(status.driverVersion, std::optional<std::string>("03.80"));
    EXPECT_EQ(status.dbmsName, std::optional<std::string>("FakeDB"));
}

TEST_F(ConnectionTesterTest, MissingDetailsAreAbsentNotErrors) {
    driver_.failingStatements.insert("SELECT @@version");
    ConnectionManager manager(config_, driver_);
    ConnectionTester tester(manager);

    ConnectionStatus status = tester.test(std::nullopt);

    EXPECT_TRUE(status.connected);
    EXPECT_FALSE(status.serverVersion.has_value());
    EXPECT_FALSE(status.databaseName.has_value());
    EXPECT_FALSE(status.dbmsVersion.has_value());
}

TEST_F(ConnectionTesterTest, ConnectFailureIsReportedInStatus) {
    driver_.failConnect = true;
    ConnectionManager manager(config_, driver_);
    ConnectionTester tester(manager);

    ConnectionStatus status;
    EXPECT_NO_THROW(status = tester.test(std::string("warehouse")));

    EXPECT_FALSE(status.connected);
    EXPECT_EQ(status.connectionName, "warehouse");
    ASSERT_TRUE(status.error.has_value());
    EXPECT_THAT(*status.error, HasSubstr("Unable to connect"));
}

TEST_F(ConnectionTesterTest, UnknownProfileIsReportedInStatus) {
    ConnectionManager manager(config_, driver_);
    ConnectionTester tester(manager);

    ConnectionStatus status = tester.test(std::string("ghost"));

    EXPECT_FALSE(status.connected);
    EXPECT_EQ(status.connectionName, "ghost");
    ASSERT_TRUE(status.error.has_value());
    EXPECT_THAT(*status.error, HasSubstr("not found"));
}
