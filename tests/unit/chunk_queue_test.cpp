#include <cassert>
#include <chrono>
#include <thread>
#include <vector>
#include "voiceguard/chunk_queue.hpp"

using namespace voiceguard;
using std::chrono::milliseconds;

int main() {
    ChunkQueue q;
    assert(q.empty());

    // FIFO
    q.push(AudioChunk(std::vector<float>{1.0f}));
    q.push(AudioChunk(std::vector<float>{2.0f, 2.0f}));
    assert(q.size() == 2);
    assert(q.pushedCount() == 2);

    AudioChunk c;
    assert(q.popFor(c, milliseconds(10)));
    assert(c.samples.size() == 1 && c.samples[0] == 1.0f);
    assert(c.frame_count == 1);
    assert(q.popFor(c, milliseconds(10)));
    assert(c.samples.size() == 2);
    assert(q.empty());

    // Bounded wait on an empty queue
    auto t0 = std::chrono::steady_clock::now();
    assert(!q.popFor(c, milliseconds(20)));
    assert(std::chrono::steady_clock::now() - t0 >= milliseconds(15));

    // interrupt() releases a blocked consumer well before its timeout
    bool popped = true;
    std::thread consumer([&] {
        AudioChunk chunk;
        popped = q.popFor(chunk, milliseconds(5000));
    });
    std::this_thread::sleep_for(milliseconds(20));
    t0 = std::chrono::steady_clock::now();
    q.interrupt();
    consumer.join();
    assert(!popped);
    assert(std::chrono::steady_clock::now() - t0 < milliseconds(2000));

    // clear() drops queued chunks and any pending interrupt
    q.push(AudioChunk(std::vector<float>{3.0f}));
    q.push(AudioChunk(std::vector<float>{4.0f}));
    q.interrupt();
    assert(q.clear() == 2);
    assert(q.empty());
    q.push(AudioChunk(std::vector<float>{5.0f}));
    assert(q.popFor(c, milliseconds(10)));
    assert(c.samples[0] == 5.0f);

    // Chunk shape checks
    assert(AudioChunk(std::vector<float>{1.0f, 2.0f}).wellFormed());
    assert(!AudioChunk().wellFormed());
    AudioChunk bad(std::vector<float>{1.0f, 2.0f});
    bad.frame_count = 3;
    assert(!bad.wellFormed());

    return 0;
}
