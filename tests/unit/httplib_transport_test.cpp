/**
 * @file httplib_transport_test.cpp
 * @brief Unit tests for the cpp-httplib transport
 *
 * - httplib errors mapped to TransportError
 * - Base URL splitting
 * - Refused connections and read timeouts against a local server
 */

#include "client/httplib_transport.hpp"

#include <gtest/gtest.h>
#include <httplib.h>

#include <chrono>
#include <thread>

// httplib's listen/bind threading trips ThreadSanitizer; skip the server tests under TSAN.
#if defined(__SANITIZE_THREAD__)
#define MICSYNC_SKIP_HTTP_TESTS 1
#elif defined(__has_feature)
#if __has_feature(thread_sanitizer)
#define MICSYNC_SKIP_HTTP_TESTS 1
#else
#define MICSYNC_SKIP_HTTP_TESTS 0
#endif
#else
#define MICSYNC_SKIP_HTTP_TESTS 0
#endif

using namespace micsync::client;
using namespace std::chrono_literals;

TEST(HttplibTransportTest, ErrorsMapToTransportErrors) {
    struct Case {
        httplib::Error error;
        std::chrono::milliseconds elapsed;
        TransportError expected;
    };
    const Case cases[] = {
        {httplib::Error::Connection, 5ms, TransportError::CONNECTION},
        {httplib::Error::SSLConnection, 5ms, TransportError::CONNECTION},
        {httplib::Error::SSLServerVerification, 5ms, TransportError::CONNECTION},
        {httplib::Error::ConnectionTimeout, 1000ms, TransportError::TIMEOUT},
        {httplib::Error::Read, 1000ms, TransportError::TIMEOUT},
        {httplib::Error::Write, 1200ms, TransportError::TIMEOUT},
        {httplib::Error::Read, 3ms, TransportError::CONNECTION},
        {httplib::Error::Write, 3ms, TransportError::CONNECTION},
        {httplib::Error::Canceled, 3ms, TransportError::OTHER},
    };

    for (const auto &c : cases) {
        EXPECT_EQ(HttplibTransport::classify_error(c.error, c.elapsed, 1000ms), c.expected)
            << httplib::to_string(c.error) << " after " << c.elapsed.count() << "ms";
    }
}

TEST(HttplibTransportTest, SplitsBaseUrl) {
    std::string origin;
    std::string prefix;

    ASSERT_TRUE(HttplibTransport::split_base_url("https://rx.local:8443/api/v1/", origin, prefix));
    EXPECT_EQ(origin, "https://rx.local:8443");
    EXPECT_EQ(prefix, "/api/v1");

    ASSERT_TRUE(HttplibTransport::split_base_url("http://10.0.0.5", origin, prefix));
    EXPECT_EQ(origin, "http://10.0.0.5");
    EXPECT_EQ(prefix, "");

    EXPECT_FALSE(HttplibTransport::split_base_url("ftp://rx.local", origin, prefix));
    EXPECT_FALSE(HttplibTransport::split_base_url("rx.local/api", origin, prefix));
    EXPECT_FALSE(HttplibTransport::split_base_url("http:///api", origin, prefix));
}

TEST(HttplibTransportTest, InvalidBaseUrlFailsWithoutConnecting) {
    HttplibTransportConfig config;
    config.base_url = "not a url";
    HttplibTransport transport(config);

    HttpRequest request;
    request.method = "GET";
    request.path = "/devices";
    HttpResponse response = transport.send(request);

    EXPECT_EQ(response.error, TransportError::CONNECTION);
    EXPECT_EQ(response.status, 0);
}

#if !MICSYNC_SKIP_HTTP_TESTS

TEST(HttplibTransportTest, RefusedConnectionIsConnectionError) {
    // Bind then close to get a port nobody listens on
    int port = 0;
    {
        httplib::Server server;
        port = server.bind_to_any_port("127.0.0.1");
        ASSERT_GT(port, 0);
    }

    HttplibTransportConfig config;
    config.base_url = "http://127.0.0.1:" + std::to_string(port);
    config.timeout_ms = 2000;
    HttplibTransport transport(config);

    HttpRequest request;
    request.method = "GET";
    request.path = "/health";
    HttpResponse response = transport.send(request);

    EXPECT_EQ(response.error, TransportError::CONNECTION);
    EXPECT_FALSE(response.error_message.empty());
}

TEST(HttplibTransportTest, SlowResponseIsTimeout) {
    httplib::Server server;
    server.Get("/slow", [](const httplib::Request &, httplib::Response &res) {
        std::this_thread::sleep_for(400ms);
        res.set_content("{}", "application/json");
    });
    const int port = server.bind_to_any_port("127.0.0.1");
    ASSERT_GT(port, 0);
    std::thread listener([&server] { server.listen_after_bind(); });

    HttplibTransportConfig config;
    config.base_url = "http://127.0.0.1:" + std::to_string(port);
    config.timeout_ms = 100;
    HttplibTransport transport(config);

    HttpRequest request;
    request.method = "GET";
    request.path = "/slow";
    HttpResponse response = transport.send(request);

    EXPECT_EQ(response.error, TransportError::TIMEOUT);
    EXPECT_EQ(transport.idle_client_count(), 0u);

    server.stop();
    listener.join();
}

TEST(HttplibTransportTest, SuccessfulResponseReturnsClientToPool) {
    httplib::Server server;
    server.Get("/api/v1/health", [](const httplib::Request &, httplib::Response &res) {
        res.set_header("Retry-After", "3");
        res.set_content(R"({"ok": true})", "application/json");
    });
    const int port = server.bind_to_any_port("127.0.0.1");
    ASSERT_GT(port, 0);
    std::thread listener([&server] { server.listen_after_bind(); });

    HttplibTransportConfig config;
    config.base_url = "http://127.0.0.1:" + std::to_string(port) + "/api/v1";
    HttplibTransport transport(config);

    HttpRequest request;
    request.method = "GET";
    request.path = "/health";
    HttpResponse response = transport.send(request);

    EXPECT_EQ(response.error, TransportError::NONE);
    EXPECT_EQ(response.status, 200);
    EXPECT_EQ(response.body, R"({"ok": true})");
    EXPECT_EQ(response.headers["retry-after"], "3");
    EXPECT_EQ(transport.idle_client_count(), 1u);

    server.stop();
    listener.join();
}

#endif  // !MICSYNC_SKIP_HTTP_TESTS
