#pragma once

namespace supercast {

class Client;

/// Makes a client the active one for the current thread until the guard
/// goes out of scope, then restores whichever client was active before
/// (also when unwinding).  Each thread has its own binding.
class ScopedActiveClient {
public:
    explicit ScopedActiveClient(Client& client);
    ~ScopedActiveClient();

    ScopedActiveClient(const ScopedActiveClient&) = delete;
    ScopedActiveClient& operator=(const ScopedActiveClient&) = delete;

    /// Client bound on this thread, or nullptr outside any scope.
    static Client* current();

private:
    Client* mPrevious;
};

} // namespace supercast
