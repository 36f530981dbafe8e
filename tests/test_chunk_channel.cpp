#include <cassert>
#include <chrono>
#include <thread>
#include <vector>
#include "audio/chunk_channel.hpp"

int main() {
    // Drop oldest: producer never waits, the front is discarded
    {
        ChunkChannel<int> ch(3, OverflowPolicy::DropOldest);
        for (int i = 0; i < 5; ++i) assert(ch.push(int(i)));
        assert(ch.size() == 3);
        assert(ch.droppedCount() == 2);

        int v = -1;
        assert(ch.pop(v) && v == 2);
        assert(ch.pop(v) && v == 3);
        assert(ch.pop(v) && v == 4);
        assert(ch.popFor(v, std::chrono::milliseconds(10)) == PopStatus::Timeout);
    }

    // close() drains, cancel() discards
    {
        ChunkChannel<int> ch(4, OverflowPolicy::DropOldest);
        ch.push(1);
        ch.push(2);
        ch.close();
        assert(!ch.push(3));
        int v = 0;
        assert(ch.pop(v) && v == 1);
        assert(ch.pop(v) && v == 2);
        assert(!ch.pop(v));
        assert(ch.popFor(v, std::chrono::milliseconds(10)) == PopStatus::Closed);

        ChunkChannel<int> other(4, OverflowPolicy::DropOldest);
        other.push(1);
        other.cancel();
        assert(!other.pop(v));
        assert(other.closed());
    }

    // Block: producer waits for room and nothing is lost
    {
        ChunkChannel<int> ch(2, OverflowPolicy::Block);
        std::thread producer([&] {
            for (int i = 0; i < 100; ++i) assert(ch.push(int(i)));
            ch.close();
        });

        std::vector<int> got;
        int v = 0;
        while (ch.pop(v)) {
            got.push_back(v);
            if (got.size() % 10 == 0) std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        producer.join();

        assert(got.size() == 100);
        for (int i = 0; i < 100; ++i) assert(got[i] == i);
        assert(ch.droppedCount() == 0);
    }

    // Cancelling releases a producer parked on a full channel
    {
        ChunkChannel<int> ch(1, OverflowPolicy::Block);
        ch.push(0);
        bool accepted = true;
        std::thread producer([&] { accepted = ch.push(1); });
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        ch.cancel();
        producer.join();
        assert(!accepted);
    }

    return 0;
}
