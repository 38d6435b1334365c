#include "client_scope.hpp"

namespace supercast {

namespace {
thread_local Client* tActiveClient = nullptr;
} // namespace

ScopedActiveClient::ScopedActiveClient(Client& client)
    : mPrevious(tActiveClient) {
    tActiveClient = &client;
}

ScopedActiveClient::~ScopedActiveClient() {
    tActiveClient = mPrevious;
}

Client* ScopedActiveClient::current() {
    return tActiveClient;
}

} // namespace supercast
