/// @file test_client_scope.cpp
/// Unit tests for client_scope.hpp: per-thread active client binding.

#include "client.hpp"
#include "client_scope.hpp"
#include "stub_transport.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>
#include <thread>

using namespace supercast;
using supercast::fakes::StubTransport;

static Config testSettings() {
    Config cfg;
    cfg.apiKey  = "sk_test";
    cfg.apiBase = "https://api.test";
    return cfg;
}

TEST(ScopedActiveClient, NoBindingOutsideScope) {
    EXPECT_EQ(ScopedActiveClient::current(), nullptr);
}

TEST(ScopedActiveClient, BindsAndRestores) {
    Client client(std::make_shared<StubTransport>(), testSettings());

    {
        ScopedActiveClient scope(client);
        EXPECT_EQ(ScopedActiveClient::current(), &client);
        EXPECT_EQ(&Client::activeClient(), &client);
    }
    EXPECT_EQ(ScopedActiveClient::current(), nullptr);
}

TEST(ScopedActiveClient, NestedRequestRestoresOuterClient) {
    Client outer(std::make_shared<StubTransport>(), testSettings());
    Client inner(std::make_shared<StubTransport>(), testSettings());

    outer.request([&] {
        EXPECT_EQ(&Client::activeClient(), &outer);

        inner.request([&] {
            EXPECT_EQ(&Client::activeClient(), &inner);
            return 0;
        });

        EXPECT_EQ(&Client::activeClient(), &outer);
        return 0;
    });

    EXPECT_EQ(ScopedActiveClient::current(), nullptr);
}

TEST(ScopedActiveClient, NestedRunScopedRestoresOnReturnAndOnThrow) {
    Client outer(std::make_shared<StubTransport>(), testSettings());
    Client inner(std::make_shared<StubTransport>(), testSettings());

    runScoped(outer, [&] {
        runScoped(inner, [&] {
            EXPECT_EQ(&Client::activeClient(), &inner);
            return 0;
        });
        EXPECT_EQ(&Client::activeClient(), &outer);

        EXPECT_THROW(runScoped(inner, []() -> int { throw std::runtime_error("inner"); }),
                     std::runtime_error);
        EXPECT_EQ(&Client::activeClient(), &outer);
        return 0;
    });

    EXPECT_EQ(ScopedActiveClient::current(), nullptr);
}

TEST(ScopedActiveClient, RestoredWhenBlockThrows) {
    Client outer(std::make_shared<StubTransport>(), testSettings());
    Client inner(std::make_shared<StubTransport>(), testSettings());

    outer.request([&] {
        EXPECT_THROW(inner.request([]() -> int {
            throw std::runtime_error("block failed");
        }), std::runtime_error);

        EXPECT_EQ(&Client::activeClient(), &outer);
        return 0;
    });

    EXPECT_EQ(ScopedActiveClient::current(), nullptr);
}

TEST(ScopedActiveClient, BindingIsPerThread) {
    Client client(std::make_shared<StubTransport>(), testSettings());
    Client* seenOnOtherThread = &client;

    client.request([&] {
        std::thread worker([&] {
            seenOnOtherThread = ScopedActiveClient::current();
        });
        worker.join();
        return 0;
    });

    EXPECT_EQ(seenOnOtherThread, nullptr);
}

TEST(ScopedActiveClient, OtherThreadFallsBackToItsOwnDefault) {
    Client client(std::make_shared<StubTransport>(), testSettings());
    Client* active        = nullptr;
    Client* defaultClient = nullptr;

    client.request([&] {
        std::thread worker([&] {
            active        = &Client::activeClient();
            defaultClient = &Client::defaultClient();
        });
        worker.join();
        return 0;
    });

    EXPECT_EQ(active, defaultClient);
    EXPECT_NE(active, &client);
}
