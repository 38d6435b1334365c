/// @file test_api_resource.cpp
/// Unit tests for api_resource.hpp: the Episodes resource on a scripted
/// transport.

#include "api_resource.hpp"
#include "errors.hpp"
#include "stub_transport.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <memory>
#include <stdexcept>

using namespace supercast;
using json = nlohmann::json;
using supercast::fakes::StubTransport;

class EpisodesTest : public ::testing::Test {
protected:
    void SetUp() override {
        Config cfg;
        cfg.apiKey  = "sk_test";
        cfg.apiBase = "https://api.test";
        mStub   = std::make_shared<StubTransport>();
        mClient = std::make_unique<Client>(mStub, cfg);
    }

    std::shared_ptr<StubTransport> mStub;
    std::unique_ptr<Client>        mClient;
};

TEST_F(EpisodesTest, ResourcePath) {
    EXPECT_EQ(Episodes::resourcePath(42), "/episodes/42");
}

TEST_F(EpisodesTest, ListParsesEnvelope) {
    mStub->pushResponse(200, R"({"data":[{"id":1,"title":"One"},{"id":2,"title":"Two"}]})");

    auto [episodes, response] = mClient->request([] {
        return Episodes::list({{"page", 1}});
    });

    ASSERT_EQ(episodes.size(), 2u);
    EXPECT_EQ(episodes[1].title, "Two");
    ASSERT_TRUE(response.has_value());
    EXPECT_EQ(response->httpStatus, 200u);

    EXPECT_EQ(mStub->requests()[0].method, "GET");
    EXPECT_EQ(mStub->requests()[0].url, "https://api.test/v1/episodes?page=1");
}

TEST_F(EpisodesTest, Retrieve) {
    mStub->pushResponse(200, R"({"id":7,"title":"Seven","published_at":null})");

    auto [episode, response] = mClient->request([] { return Episodes::retrieve(7); });

    EXPECT_EQ(episode.id, 7);
    EXPECT_EQ(episode.title, "Seven");
    EXPECT_TRUE(episode.publishedAt.empty());
    EXPECT_EQ(mStub->requests()[0].url, "https://api.test/v1/episodes/7");
}

TEST_F(EpisodesTest, RetrieveToleratesNullFields) {
    mStub->pushResponse(200, R"({"id":7,"title":"Draft","description":null,"published_at":null})");

    auto [episode, response] = mClient->request([] { return Episodes::retrieve(7); });

    EXPECT_EQ(episode.title, "Draft");
    EXPECT_TRUE(episode.description.empty());
    EXPECT_TRUE(episode.publishedAt.empty());
}

TEST_F(EpisodesTest, CreateSendsFormBody) {
    mStub->pushResponse(201, R"({"id":8,"title":"Pilot"})");

    auto [episode, response] = mClient->request([] {
        return Episodes::create({{"episode", {{"title", "Pilot"}}}});
    });

    EXPECT_EQ(episode.id, 8);
    EXPECT_EQ(response->httpStatus, 201u);
    EXPECT_EQ(mStub->requests()[0].method, "POST");
    EXPECT_EQ(mStub->requests()[0].body, "episode[title]=Pilot");
}

TEST_F(EpisodesTest, UpdateUsesPatch) {
    mStub->pushResponse(200, R"({"id":8,"title":"Renamed"})");

    auto [episode, response] = mClient->request([] {
        return Episodes::update(8, {{"title", "Renamed"}});
    });

    EXPECT_EQ(episode.title, "Renamed");
    EXPECT_EQ(mStub->requests()[0].method, "PATCH");
    EXPECT_EQ(mStub->requests()[0].url, "https://api.test/v1/episodes/8");
    EXPECT_EQ(mStub->requests()[0].body, "title=Renamed");
}

TEST_F(EpisodesTest, DestroyUsesDelete) {
    mStub->pushResponse(200, R"({"id":8})");

    auto [episode, response] = mClient->request([] { return Episodes::destroy(8); });

    EXPECT_EQ(episode.id, 8);
    EXPECT_EQ(mStub->requests()[0].method, "DELETE");
    EXPECT_EQ(mStub->requests()[0].url, "https://api.test/v1/episodes/8");
}

TEST_F(EpisodesTest, PerCallOptionsApplied) {
    mStub->pushResponse(200, R"({"id":1})");

    RequestOptions options;
    options.apiKey = "sk_other";
    mClient->request([&] { return Episodes::retrieve(1, options); });

    EXPECT_EQ(mStub->requests()[0].headers.at("Authorization"), "Bearer sk_other");
}

TEST_F(EpisodesTest, ApiErrorsPropagate) {
    mStub->pushResponse(404, R"({"message":"No such episode: 99"})");

    try {
        mClient->request([] { return Episodes::retrieve(99); });
        FAIL() << "expected InvalidRequestError";
    } catch (const InvalidRequestError& e) {
        EXPECT_EQ(e.toString(), "(Status 404) No such episode: 99");
    }
}

TEST_F(EpisodesTest, UnexpectedListShapeThrows) {
    mStub->pushResponse(200, R"({"id":1})");

    EXPECT_THROW(mClient->request([] { return Episodes::list(); }), std::runtime_error);
}

TEST_F(EpisodesTest, ApiResourceRequestReturnsDataAndResponse) {
    mStub->pushResponse(200, R"({"ok":true})");

    auto [result, response] = mClient->request([] {
        return ApiResource::request("get", "/ping");
    });

    EXPECT_EQ(result.first["ok"], true);
    EXPECT_EQ(result.second.httpStatus, 200u);
    EXPECT_TRUE(response.has_value());
}
