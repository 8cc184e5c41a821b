#include <chrono>
#include <iostream>
#include <thread>

#include "galaxis/core/channel.h"

#define GALAXIS_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

int test_channel() {
  using namespace galaxis;

  // Bounded: try_send refuses once full, FIFO order on the way out.
  {
    auto ch = make_channel<int>(2);
    GALAXIS_ASSERT(ch->try_send(1));
    GALAXIS_ASSERT(ch->try_send(2));
    GALAXIS_ASSERT(!ch->try_send(3));
    GALAXIS_ASSERT(ch->size() == 2);
    GALAXIS_ASSERT(ch->recv() == 1);
    GALAXIS_ASSERT(ch->try_send(3));
    GALAXIS_ASSERT(ch->recv() == 2);
    GALAXIS_ASSERT(ch->recv() == 3);
    GALAXIS_ASSERT(!ch->try_recv().has_value());
    GALAXIS_ASSERT(!ch->recv_for(std::chrono::milliseconds(5)).has_value());
  }

  // A blocked sender resumes once a consumer makes room.
  {
    auto ch = make_channel<int>(1);
    GALAXIS_ASSERT(ch->send(10));
    std::thread producer([ch] { ch->send(11); });
    GALAXIS_ASSERT(ch->recv() == 10);
    GALAXIS_ASSERT(ch->recv() == 11);
    producer.join();
  }

  // Close: senders fail, receivers drain then get nothing.
  {
    auto ch = make_channel<int>(4);
    GALAXIS_ASSERT(ch->send(5));
    ch->close();
    GALAXIS_ASSERT(ch->closed());
    GALAXIS_ASSERT(!ch->send(6));
    GALAXIS_ASSERT(!ch->try_send(6));
    GALAXIS_ASSERT(ch->recv() == 5);
    GALAXIS_ASSERT(!ch->recv().has_value());
  }

  // Close wakes a receiver that is already waiting.
  {
    auto ch = make_channel<int>(1);
    std::thread closer([ch] {
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
      ch->close();
    });
    GALAXIS_ASSERT(!ch->recv().has_value());
    closer.join();
  }

  GALAXIS_ASSERT(make_channel<int>(0)->capacity() == 1);
  return 0;
}
