#include "vendor/vendor_registry.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <memory>
#include <thread>
#include <vector>

#include "mocks/mock_http_transport.hpp"
#include "mocks/mock_vendor_adapter.hpp"

using namespace micsync;
using namespace micsync::vendor;
using namespace micsync::tests;
using namespace testing;

class VendorRegistryTest : public Test {
protected:
    void SetUp() override {
        transport = std::make_shared<NiceMock<MockHttpTransport>>();
        ON_CALL(*transport, base_url()).WillByDefault(ReturnRef(transport->_base_url));

        deps.make_transport = [this](const VendorConfig &config) -> std::shared_ptr<client::IHttpTransport> {
            requested_urls.push_back(config.base_url);
            return transport;
        };
    }

    VendorConfig shure_config() {
        VendorConfig config;
        config.id = "shure-main";
        config.type = "shure";
        config.base_url = "http://10.0.0.5";
        config.credentials.api_key = "secret";
        return config;
    }

    VendorRegistry registry;
    AdapterDeps deps;
    std::shared_ptr<NiceMock<MockHttpTransport>> transport;
    std::vector<std::string> requested_urls;
};

TEST_F(VendorRegistryTest, BuiltInTypesAreRegistered) {
    EXPECT_TRUE(registry.has_factory("shure"));
    EXPECT_TRUE(registry.has_factory("sennheiser"));
    EXPECT_FALSE(registry.has_factory("acme"));
    EXPECT_THAT(registry.factory_types(), ElementsAre("sennheiser", "shure"));
}

TEST_F(VendorRegistryTest, CreatesAdapterForKnownType) {
    std::string error;
    auto adapter = registry.create_adapter(shure_config(), deps, error);

    ASSERT_NE(adapter, nullptr) << error;
    EXPECT_EQ(adapter->vendor_id(), "shure-main");
    EXPECT_EQ(adapter->vendor_type(), "shure");
    EXPECT_EQ(requested_urls, (std::vector<std::string>{"http://10.0.0.5"}));
}

TEST_F(VendorRegistryTest, UnknownTypeFails) {
    VendorConfig config = shure_config();
    config.type = "acme";

    std::string error;
    EXPECT_EQ(registry.create_adapter(config, deps, error), nullptr);
    EXPECT_THAT(error, HasSubstr("unknown vendor type 'acme'"));
}

TEST_F(VendorRegistryTest, InvalidBaseUrlFails) {
    VendorConfig config = shure_config();
    config.base_url = "ftp://10.0.0.5";

    std::string error;
    EXPECT_EQ(registry.create_adapter(config, deps, error), nullptr);
    EXPECT_THAT(error, HasSubstr("invalid base_url"));
    EXPECT_TRUE(requested_urls.empty());
}

TEST_F(VendorRegistryTest, MissingCredentialsFail) {
    VendorConfig shure = shure_config();
    shure.credentials.api_key.clear();

    std::string error;
    EXPECT_EQ(registry.create_adapter(shure, deps, error), nullptr);
    EXPECT_THAT(error, HasSubstr("api_key"));

    VendorConfig sennheiser = shure_config();
    sennheiser.id = "senn";
    sennheiser.type = "sennheiser";
    sennheiser.credentials.username = "api";

    error.clear();
    EXPECT_EQ(registry.create_adapter(sennheiser, deps, error), nullptr);
    EXPECT_THAT(error, HasSubstr("username and password"));
}

TEST_F(VendorRegistryTest, CustomFactoryIsUsed) {
    auto mock = std::make_shared<NiceMock<MockVendorAdapter>>();
    mock->_id = "acme-1";
    mock->_type = "acme";
    ON_CALL(*mock, vendor_id()).WillByDefault(ReturnRef(mock->_id));

    registry.register_factory("acme", [mock](const VendorConfig &, const AdapterDeps &, std::string &) {
        return mock;
    });

    VendorConfig config = shure_config();
    config.id = "acme-1";
    config.type = "acme";

    std::string error;
    auto adapter = registry.create_adapter(config, deps, error);
    EXPECT_EQ(adapter, mock);
}

TEST_F(VendorRegistryTest, FactoryReturningNullGetsDefaultError) {
    registry.register_factory("acme", [](const VendorConfig &, const AdapterDeps &, std::string &) {
        return std::shared_ptr<IVendorAdapter>();
    });

    VendorConfig config = shure_config();
    config.type = "acme";

    std::string error;
    EXPECT_EQ(registry.create_adapter(config, deps, error), nullptr);
    EXPECT_THAT(error, HasSubstr("returned no adapter"));
}

TEST_F(VendorRegistryTest, LiveAdapterLifecycle) {
    auto a = std::make_shared<NiceMock<MockVendorAdapter>>();
    auto b = std::make_shared<NiceMock<MockVendorAdapter>>();

    registry.add_adapter("zeta", a);
    registry.add_adapter("alpha", b);

    EXPECT_EQ(registry.adapter_count(), 2u);
    EXPECT_TRUE(registry.has_adapter("zeta"));
    EXPECT_EQ(registry.get_adapter("alpha"), b);
    EXPECT_EQ(registry.get_adapter("missing"), nullptr);
    EXPECT_EQ(registry.get_vendor_ids(), (std::vector<std::string>{"alpha", "zeta"}));
    EXPECT_EQ(registry.get_all_adapters().size(), 2u);

    EXPECT_TRUE(registry.remove_adapter("zeta"));
    EXPECT_FALSE(registry.remove_adapter("zeta"));
    EXPECT_EQ(registry.adapter_count(), 1u);

    registry.clear();
    EXPECT_EQ(registry.adapter_count(), 0u);
}

TEST_F(VendorRegistryTest, AdapterOutlivesRemoval) {
    auto a = std::make_shared<NiceMock<MockVendorAdapter>>();
    registry.add_adapter("shure-main", a);

    auto held = registry.get_adapter("shure-main");
    registry.remove_adapter("shure-main");

    EXPECT_EQ(held, a);
    EXPECT_EQ(a.use_count(), 2);
}

TEST_F(VendorRegistryTest, ConcurrentReadsAndWrites) {
    std::vector<std::thread> threads;
    for (int i = 0; i < 4; ++i) {
        threads.emplace_back([this, i] {
            for (int n = 0; n < 100; ++n) {
                const std::string id = "v" + std::to_string(i) + "-" + std::to_string(n);
                registry.add_adapter(id, std::make_shared<NiceMock<MockVendorAdapter>>());
                registry.get_adapter(id);
                registry.get_vendor_ids();
            }
        });
    }
    for (auto &t : threads) {
        t.join();
    }

    EXPECT_EQ(registry.adapter_count(), 400u);
}
