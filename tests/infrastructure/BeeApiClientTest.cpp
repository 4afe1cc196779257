#include "infrastructure/BeeApiClient.hpp"

#include "domain/Errors.hpp"
#include "fakes/FakeUpstream.hpp"

#include <gtest/gtest.h>

#include <chrono>

using namespace sgw::domain;
using namespace sgw::infrastructure;
using sgw::config::UpstreamSettings;
using sgw::fakes::CannedBeeApiClient;

namespace {

UpstreamSettings local_settings() {
    UpstreamSettings s;
    s.bee_api_base_url = "http://bee.local:1633";
    return s;
}

UpstreamSettings one_second_timeouts() {
    UpstreamSettings s = local_settings();
    s.request_timeout_seconds = 1;
    s.connect_timeout_seconds = 1;
    return s;
}

} // namespace

TEST(BeeApiClient, FetchesBatchesPath) {
    CannedBeeApiClient client(local_settings());
    client.respond(200, R"({"batches": []})");

    auto body = client.fetch_all_stamps();

    ASSERT_EQ(client.requested_urls.size(), 1u);
    EXPECT_EQ(client.requested_urls[0], "http://bee.local:1633/batches");
    EXPECT_TRUE(body.contains("batches"));
}

TEST(BeeApiClient, ReturnsBodyUntouched) {
    CannedBeeApiClient client(local_settings());
    client.respond(200, R"([{"batchID": "a1", "batchTTL": 100}])");

    auto body = client.fetch_all_stamps();
    ASSERT_TRUE(body.is_array());
    EXPECT_EQ(body[0]["batchID"], "a1");
    EXPECT_EQ(body[0]["batchTTL"], 100);
}

TEST(BeeApiClient, AccountPaths) {
    CannedBeeApiClient client(local_settings());
    client.respond(200, R"({})");

    client.fetch_wallet();
    client.fetch_chequebook_address();
    client.fetch_chequebook_balance();

    ASSERT_EQ(client.requested_urls.size(), 3u);
    EXPECT_EQ(client.requested_urls[0], "http://bee.local:1633/wallet");
    EXPECT_EQ(client.requested_urls[1], "http://bee.local:1633/chequebook/address");
    EXPECT_EQ(client.requested_urls[2], "http://bee.local:1633/chequebook/balance");
}

TEST(BeeApiClient, SingleAttemptPerCall) {
    CannedBeeApiClient client(local_settings());
    client.respond(0, "", ix::HttpErrorCode::CannotConnect, "connection refused");

    EXPECT_THROW(client.fetch_all_stamps(), UpstreamUnreachable);
    EXPECT_EQ(client.requested_urls.size(), 1u);
}

TEST(BeeApiClient, ConnectionFailureIsUnreachable) {
    CannedBeeApiClient client(local_settings());
    client.respond(0, "", ix::HttpErrorCode::CannotConnect, "connection refused");

    try {
        client.fetch_all_stamps();
        FAIL() << "expected UpstreamUnreachable";
    } catch (const UpstreamUnreachable& e) {
        EXPECT_EQ(e.kind(), ErrorKind::UpstreamUnreachable);
    }
}

TEST(BeeApiClient, MissingResponseIsUnreachable) {
    CannedBeeApiClient client(local_settings());
    client.respond_with_nothing();
    EXPECT_THROW(client.fetch_all_stamps(), UpstreamUnreachable);
}

TEST(BeeApiClient, TimeoutIsDistinct) {
    CannedBeeApiClient client(local_settings());
    client.respond(0, "", ix::HttpErrorCode::Timeout, "read timed out");

    try {
        client.fetch_all_stamps();
        FAIL() << "expected UpstreamTimeout";
    } catch (const UpstreamTimeout& e) {
        EXPECT_EQ(e.kind(), ErrorKind::UpstreamTimeout);
    }
}

TEST(BeeApiClient, ReadCutOffAtTransferTimeoutIsTimeout) {
    CannedBeeApiClient client(one_second_timeouts());
    client.respond(0, "", ix::HttpErrorCode::CannotReadStatusLine, "Cannot retrieve status line");
    client.stall_for(std::chrono::milliseconds(1100));

    try {
        client.fetch_all_stamps();
        FAIL() << "expected UpstreamTimeout";
    } catch (const UpstreamTimeout& e) {
        EXPECT_EQ(e.kind(), ErrorKind::UpstreamTimeout);
    }
}

TEST(BeeApiClient, ConnectCutOffAtConnectTimeoutIsTimeout) {
    CannedBeeApiClient client(one_second_timeouts());
    client.respond(0, "", ix::HttpErrorCode::CannotConnect, "connect timed out");
    client.stall_for(std::chrono::milliseconds(1100));

    EXPECT_THROW(client.fetch_all_stamps(), UpstreamTimeout);
}

TEST(BeeApiClient, FastReadFailureIsUnreachable) {
    CannedBeeApiClient client(one_second_timeouts());
    client.respond(0, "", ix::HttpErrorCode::CannotReadStatusLine, "connection reset");

    EXPECT_THROW(client.fetch_all_stamps(), UpstreamUnreachable);
}

TEST(BeeApiClient, Non2xxCarriesStatus) {
    CannedBeeApiClient client(local_settings());
    client.respond(503, R"({"message": "node syncing"})");

    try {
        client.fetch_all_stamps();
        FAIL() << "expected UpstreamHttpError";
    } catch (const UpstreamHttpError& e) {
        EXPECT_EQ(e.status(), 503);
        EXPECT_EQ(e.kind(), ErrorKind::UpstreamHttpError);
    }
}

TEST(BeeApiClient, ClientErrorStatusIsAlsoHttpError) {
    CannedBeeApiClient client(local_settings());
    client.respond(404, "");
    EXPECT_THROW(client.fetch_all_stamps(), UpstreamHttpError);
}

TEST(BeeApiClient, MalformedBodyIsNormalizationError) {
    CannedBeeApiClient client(local_settings());
    client.respond(200, "<html>not json</html>");

    try {
        client.fetch_all_stamps();
        FAIL() << "expected MalformedUpstreamBody";
    } catch (const MalformedUpstreamBody& e) {
        EXPECT_EQ(e.kind(), ErrorKind::NormalizationError);
    }
}

TEST(BeeApiClient, ExposesBaseUrl) {
    CannedBeeApiClient client(local_settings());
    EXPECT_EQ(client.base_url(), "http://bee.local:1633");
}
