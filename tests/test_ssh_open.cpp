#include <gtest/gtest.h>
#include <ssh/ssh_util.hpp>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace {

// Like libssh2, the pending open lives on the session: whoever calls next
// drives it to completion, whatever that caller asked for.
struct FakeOpenSession {
    static constexpr int kCallers = 8;

    int pending_for = -1;
    int polls = 0;
    int calls = 0;
    int channels[kCallers];

    FakeOpenSession() {
        for (int i = 0; i < kCallers; i++) channels[i] = i;
    }

    const int* open(int requester) {
        calls++;
        if (pending_for < 0) {
            pending_for = requester;
            polls = 0;
        }
        if (++polls < 3) return nullptr;
        const int* channel = &channels[pending_for];
        pending_for = -1;
        return channel;
    }
};

} // namespace

TEST(SshOpenSerialized, EachCallerGetsItsOwnChannel) {
    FakeOpenSession session;
    std::mutex open_mutex;
    std::mutex io_mutex;
    std::vector<const int*> received(FakeOpenSession::kCallers, nullptr);

    std::vector<std::thread> callers;
    for (int id = 0; id < FakeOpenSession::kCallers; id++) {
        callers.emplace_back([&, id] {
            received[id] = ssh_open_serialized(open_mutex, io_mutex,
                [&] { return session.open(id); },
                [] { return true; });
        });
    }
    for (auto& t : callers) t.join();

    for (int id = 0; id < FakeOpenSession::kCallers; id++) {
        ASSERT_NE(received[id], nullptr);
        EXPECT_EQ(*received[id], id);
    }
    EXPECT_EQ(session.calls, 3 * FakeOpenSession::kCallers);
}

TEST(SshOpenSerialized, HardFailureStopsRetrying) {
    FakeOpenSession session;
    std::mutex open_mutex;
    std::mutex io_mutex;
    std::string error;

    const int* channel = ssh_open_serialized(open_mutex, io_mutex,
        [&] { return session.open(0); },
        [&] {
            error = "refused";
            return false;
        });

    EXPECT_EQ(channel, nullptr);
    EXPECT_EQ(error, "refused");
    EXPECT_EQ(session.calls, 1);
}
