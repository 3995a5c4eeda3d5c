#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <stdexcept>
#include "STS/DescriptorFetcher.hpp"
#include "TestDoubles.hpp"

using namespace STS;
using STS::test::MockHttpClient;
using ::testing::_;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::Throw;

namespace {

std::string description(const std::string& manufacturer,
                        const std::string& friendlyName,
                        const std::string& modelName,
                        const std::string& serial = "") {
    std::string xml = R"(<?xml version="1.0"?><root xmlns="urn:schemas-upnp-org:device-1-0"><device>)";
    if (!manufacturer.empty()) xml += "<manufacturer>" + manufacturer + "</manufacturer>";
    if (!friendlyName.empty()) xml += "<friendlyName>" + friendlyName + "</friendlyName>";
    if (!modelName.empty()) xml += "<modelName>" + modelName + "</modelName>";
    if (!serial.empty()) xml += "<serialNumber>" + serial + "</serialNumber>";
    xml += "</device></root>";
    return xml;
}

std::expected<HttpResponse, DiscoveryError> ok(std::string body) {
    return HttpResponse{200, std::move(body)};
}

} // namespace

class DescriptorFetcherTest : public ::testing::Test {
protected:
    void SetUp() override {
        http_ = std::make_shared<NiceMock<MockHttpClient>>();
        ON_CALL(*http_, get(_, _)).WillByDefault(Return(std::unexpected(DiscoveryError::ConnectionFailed)));
        fetcher_ = std::make_unique<DescriptorFetcher>(http_);
    }

    std::shared_ptr<NiceMock<MockHttpClient>> http_;
    std::unique_ptr<DescriptorFetcher> fetcher_;
};

TEST_F(DescriptorFetcherTest, AcceptsMatchingVendorAndUppercasesSerial) {
    ON_CALL(*http_, get("http://192.168.1.100:8091/XD/BO5EBO5E-F00D-F00D-FEED-AABBCC112233.xml", _))
        .WillByDefault(Return(ok(description("Bose Corporation", "Living Room", "SoundTouch 20", "aabbcc112233"))));

    auto devices = fetcher_->fetchAll({"http://192.168.1.100:8091/XD/BO5EBO5E-F00D-F00D-FEED-AABBCC112233.xml"});

    ASSERT_EQ(devices.size(), 1u);
    const auto& device = devices.at("AABBCC112233");
    EXPECT_EQ(device.ip, "192.168.1.100");
    EXPECT_EQ(device.friendlyName, "Living Room");
    EXPECT_EQ(device.modelName, "SoundTouch 20");
    EXPECT_EQ(device.serialNumber, "AABBCC112233");
}

TEST_F(DescriptorFetcherTest, VendorMatchIsCaseInsensitiveSubstring) {
    auto parsed = fetcher_->parseDescriptor("http://10.0.0.1/d.xml",
                                            description("BOSE CORPORATION", "Den", "SoundTouch 10", "1"));
    EXPECT_TRUE(parsed.has_value());
}

TEST_F(DescriptorFetcherTest, OtherVendorsAreExcluded) {
    ON_CALL(*http_, get("http://10.0.0.2/d.xml", _))
        .WillByDefault(Return(ok(description("Sonos, Inc.", "Office", "One", "XYZ"))));

    auto devices = fetcher_->fetchAll({"http://10.0.0.2/d.xml"});

    EXPECT_TRUE(devices.empty());
    auto parsed = fetcher_->parseDescriptor("http://10.0.0.2/d.xml", description("Sonos, Inc.", "Office", "One"));
    ASSERT_FALSE(parsed.has_value());
    EXPECT_EQ(parsed.error(), DiscoveryError::ManufacturerMismatch);
    EXPECT_EQ(errorKind(parsed.error()), ErrorKind::Validation);
}

TEST_F(DescriptorFetcherTest, MissingRequiredFieldsAreExcluded) {
    ON_CALL(*http_, get("http://10.0.0.3/d.xml", _))
        .WillByDefault(Return(ok(description("", "Kitchen", "SoundTouch 10"))));
    ON_CALL(*http_, get("http://10.0.0.4/d.xml", _))
        .WillByDefault(Return(ok(description("Bose Corporation", "", "SoundTouch 10"))));
    ON_CALL(*http_, get("http://10.0.0.5/d.xml", _))
        .WillByDefault(Return(ok(description("Bose Corporation", "Kitchen", ""))));

    auto devices = fetcher_->fetchAll({"http://10.0.0.3/d.xml", "http://10.0.0.4/d.xml", "http://10.0.0.5/d.xml"});

    EXPECT_TRUE(devices.empty());
    EXPECT_EQ(fetcher_->parseDescriptor("http://10.0.0.4/d.xml", description("Bose", "", "ST10")).error(),
              DiscoveryError::IncompleteDescriptor);
}

TEST_F(DescriptorFetcherTest, FallsBackToIpWithoutSerial) {
    auto parsed = fetcher_->parseDescriptor("http://10.0.0.6:8091/d.xml",
                                            description("Bose Corporation", "Bath", "SoundTouch 10"));

    ASSERT_TRUE(parsed.has_value());
    EXPECT_FALSE(parsed->serialNumber.has_value());
    EXPECT_EQ(parsed->dedupKey, "10.0.0.6");
}

TEST_F(DescriptorFetcherTest, FailingLocationsDoNotAffectOthers) {
    ON_CALL(*http_, get("http://10.0.0.7/d.xml", _))
        .WillByDefault(Return(ok(description("Bose Corporation", "Garage", "SoundTouch 30", "0A0B"))));
    ON_CALL(*http_, get("http://10.0.0.8/d.xml", _))
        .WillByDefault(Return(std::unexpected(DiscoveryError::Timeout)));
    ON_CALL(*http_, get("http://10.0.0.9/d.xml", _))
        .WillByDefault(Throw(std::runtime_error("socket exploded")));
    ON_CALL(*http_, get("http://10.0.0.10/d.xml", _))
        .WillByDefault(Return(ok("<root><device>")));

    auto devices = fetcher_->fetchAll({"http://10.0.0.7/d.xml", "http://10.0.0.8/d.xml",
                                       "http://10.0.0.9/d.xml", "http://10.0.0.10/d.xml"});

    ASSERT_EQ(devices.size(), 1u);
    EXPECT_EQ(devices.begin()->second.friendlyName, "Garage");
}

TEST_F(DescriptorFetcherTest, SameSerialAtTwoLocationsIsOneDevice) {
    ON_CALL(*http_, get("http://10.0.0.11/a.xml", _))
        .WillByDefault(Return(ok(description("Bose Corporation", "Porch", "SoundTouch 10", "dup"))));
    ON_CALL(*http_, get("http://10.0.0.11/b.xml", _))
        .WillByDefault(Return(ok(description("Bose Corporation", "Porch", "SoundTouch 10", "DUP"))));

    auto devices = fetcher_->fetchAll({"http://10.0.0.11/a.xml", "http://10.0.0.11/b.xml"});

    ASSERT_EQ(devices.size(), 1u);
    EXPECT_TRUE(devices.count("DUP"));
}

TEST_F(DescriptorFetcherTest, UsesConfiguredVendorAndTimeout) {
    DescriptorFetcher fetcher(http_, "sonos", std::chrono::milliseconds(1234));
    EXPECT_CALL(*http_, get("http://10.0.0.12/d.xml", std::chrono::milliseconds(1234)))
        .WillOnce(Return(ok(description("Sonos, Inc.", "Office", "One", "S1"))));

    auto devices = fetcher.fetchAll({"http://10.0.0.12/d.xml"});

    EXPECT_EQ(devices.size(), 1u);
}

TEST_F(DescriptorFetcherTest, EmptyInputMakesNoRequests) {
    EXPECT_CALL(*http_, get(_, _)).Times(0);
    EXPECT_TRUE(fetcher_->fetchAll({}).empty());
}

TEST(DescriptorFetcherConstructionTest, RejectsNullClient) {
    EXPECT_THROW(DescriptorFetcher(nullptr), std::invalid_argument);
}
